/**
 * Voidrat - Notification Triggers
 *
 * Decides which watched events deserve a notification sound.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <QString>

#include "core/SharedState.hpp"

namespace voidrat {

/**
 * Watched event kinds, each guarded by its own preference toggle
 */
enum class TriggerKind {
    VoidCaptureFissure,     // Capture fissure on Hepit or Ukko (Void)
    EpicInvasionReward      // Forma, Orokin Reactor or Orokin Catalyst reward
};

QString triggerName(TriggerKind kind);

/**
 * A trigger that matched and has not been notified on yet
 */
struct TriggerHit {
    TriggerKind kind;
    std::int64_t key;       // Activation timestamp, the dedup key
};

/**
 * First ongoing, non-storm fissure on one of the void capture nodes
 */
std::optional<Fissure> findVoidCapture(const std::vector<Fissure>& fissures, TimePoint now);

/**
 * First invasion whose rewards mention forma, reactor or catalyst
 * (case-insensitive)
 */
std::optional<Invasion> findEpicInvasion(const std::vector<Invasion>& invasions);

/**
 * Enabled triggers whose predicate matches the snapshot and whose key is
 * not in the notification history yet
 */
std::vector<TriggerHit> evaluateTriggers(const WorldSnapshot& snapshot, TimePoint now);

} // namespace voidrat
