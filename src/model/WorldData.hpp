/**
 * Voidrat - World Data Model
 *
 * Normalized fissure, Cetus cycle and invasion entities shared by
 * both upstream schema parsers and the presentation layer.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "SolarNodes.hpp"

namespace voidrat {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

/**
 * Fissure tier, ordered from least to most valuable
 */
enum class FissureTier {
    Unknown,
    Lith,
    Meso,
    Neo,
    Axi,
    Requiem
};

/**
 * Exact token match ("Lith", "Meso", ...), Unknown otherwise
 */
FissureTier parseTier(const std::string& token);

QString tierName(FissureTier tier);

/**
 * Timed mission opportunity (void storms included)
 */
struct Fissure {
    std::optional<TimePoint> activation;  // Absent on the legacy aggregator shape
    TimePoint expiry;
    SolarNode node;
    QString mission;                      // e.g. "Capture"
    FissureTier tier = FissureTier::Unknown;
    bool isStorm = false;
    bool hard = false;                    // Steel Path variant

    Seconds tillExpired(TimePoint now) const;
    bool hasExpired(TimePoint now) const;

    /**
     * Timestamp used to remember that a notification was already played
     * for this fissure. Falls back to the expiry when activation is unknown.
     */
    std::int64_t notificationKey() const;
};

/**
 * Day/night cycle of the Plains of Eidolon
 *
 * The stored expiry always marks the end of the night, whichever phase
 * was active when the data was fetched.
 */
struct CetusCycle {
    static constexpr Seconds DAY_LENGTH{6000};
    static constexpr Seconds NIGHT_LENGTH{3000};

    TimePoint expiry{};

    /**
     * Build a cycle from the raw upstream expiry of the current phase
     */
    static CetusCycle fromPhaseExpiry(TimePoint phaseExpiry, bool isDay);

    bool cetusIsDay(TimePoint now) const;

    /**
     * Time left until the current phase ends
     */
    Seconds cetusTillCycle(TimePoint now) const;
};

struct Reward {
    QString item;
    std::uint32_t quantity = 1;

    QString toString() const;
};

struct InvasionRewards {
    std::vector<Reward> attacker;
    std::vector<Reward> defender;

    /**
     * All rewards of both sides as one comma separated line
     */
    QString allRewardsString() const;
};

/**
 * Two-sided faction conflict (only ongoing ones are ever stored)
 */
struct Invasion {
    TimePoint activation;
    SolarNode node;
    InvasionRewards rewards;

    Seconds activeDuration(TimePoint now) const;
    std::int64_t notificationKey() const;
};

/**
 * Sort fissures ascending by tier, keeping upstream order within a tier
 */
void sortByTier(std::vector<Fissure>& fissures);

/**
 * Color band for remaining-time cells
 */
enum class Urgency {
    Critical,   // < 10 minutes
    Warning,    // < 20 minutes
    Normal,     // < 40 minutes
    Relaxed
};

Urgency urgencyFor(Seconds remaining);

/**
 * Zero padded "SSs", "MMm SSs" or "HHh MMm SSs"
 */
QString formatDuration(Seconds duration);

std::int64_t toEpochSeconds(TimePoint time);
TimePoint fromEpochSeconds(std::int64_t seconds);

} // namespace voidrat
