/**
 * Voidrat - Notification Triggers Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "NotificationTriggers.hpp"

#include <algorithm>

#include <QStringList>

namespace voidrat {

namespace {
    const QStringList VOID_CAPTURE_NODES = {"Hepit (Void)", "Ukko (Void)"};
    const QStringList EPIC_REWARD_WORDS = {"forma", "reactor", "catalyst"};
}

QString triggerName(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::VoidCaptureFissure: return "void capture fissure";
        case TriggerKind::EpicInvasionReward: return "epic invasion reward";
    }
    return "unknown";
}

std::optional<Fissure> findVoidCapture(const std::vector<Fissure>& fissures, TimePoint now) {
    auto it = std::find_if(fissures.begin(), fissures.end(), [now](const Fissure& f) {
        return !f.isStorm && !f.hasExpired(now) && VOID_CAPTURE_NODES.contains(f.node.value);
    });
    if (it == fissures.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<Invasion> findEpicInvasion(const std::vector<Invasion>& invasions) {
    auto it = std::find_if(invasions.begin(), invasions.end(), [](const Invasion& i) {
        QString rewards = i.rewards.allRewardsString();
        return std::any_of(EPIC_REWARD_WORDS.begin(), EPIC_REWARD_WORDS.end(),
                           [&rewards](const QString& word) {
                               return rewards.contains(word, Qt::CaseInsensitive);
                           });
    });
    if (it == invasions.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<TriggerHit> evaluateTriggers(const WorldSnapshot& snapshot, TimePoint now) {
    std::vector<TriggerHit> hits;
    const auto& prefs = snapshot.preferences;

    auto addHit = [&](TriggerKind kind, std::int64_t key) {
        bool pending = std::any_of(hits.begin(), hits.end(),
                                   [key](const TriggerHit& h) { return h.key == key; });
        if (!prefs.wasNotified(key) && !pending) {
            hits.push_back({kind, key});
        }
    };

    if (prefs.notifyVoidCapture) {
        if (auto fissure = findVoidCapture(snapshot.fissures, now)) {
            addHit(TriggerKind::VoidCaptureFissure, fissure->notificationKey());
        }
    }

    if (prefs.notifyEpicInvasion) {
        if (auto invasion = findEpicInvasion(snapshot.invasions)) {
            addHit(TriggerKind::EpicInvasionReward, invasion->notificationKey());
        }
    }

    return hits;
}

} // namespace voidrat
