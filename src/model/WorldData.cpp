/**
 * Voidrat - World Data Model Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "WorldData.hpp"

#include <algorithm>

#include <QStringList>

namespace voidrat {

FissureTier parseTier(const std::string& token) {
    if (token == "Lith") return FissureTier::Lith;
    if (token == "Meso") return FissureTier::Meso;
    if (token == "Neo") return FissureTier::Neo;
    if (token == "Axi") return FissureTier::Axi;
    if (token == "Requiem") return FissureTier::Requiem;
    return FissureTier::Unknown;
}

QString tierName(FissureTier tier) {
    switch (tier) {
        case FissureTier::Lith: return "Lith";
        case FissureTier::Meso: return "Meso";
        case FissureTier::Neo: return "Neo";
        case FissureTier::Axi: return "Axi";
        case FissureTier::Requiem: return "Requiem";
        default: return "Unknown";
    }
}

// ============ Fissure ============

Seconds Fissure::tillExpired(TimePoint now) const {
    return std::chrono::duration_cast<Seconds>(expiry - now);
}

bool Fissure::hasExpired(TimePoint now) const {
    return expiry < now;
}

std::int64_t Fissure::notificationKey() const {
    return toEpochSeconds(activation.value_or(expiry));
}

// ============ CetusCycle ============

CetusCycle CetusCycle::fromPhaseExpiry(TimePoint phaseExpiry, bool isDay) {
    CetusCycle cycle;
    cycle.expiry = isDay ? phaseExpiry + NIGHT_LENGTH : phaseExpiry;
    return cycle;
}

bool CetusCycle::cetusIsDay(TimePoint now) const {
    return std::chrono::duration_cast<Seconds>(expiry - now) >= NIGHT_LENGTH;
}

Seconds CetusCycle::cetusTillCycle(TimePoint now) const {
    auto nightStart = expiry - NIGHT_LENGTH;
    auto tillNight = std::chrono::duration_cast<Seconds>(nightStart - now);
    if (tillNight.count() > 0) {
        return tillNight;
    }
    return std::chrono::duration_cast<Seconds>(expiry - now);
}

// ============ Invasion ============

QString Reward::toString() const {
    if (quantity > 1) {
        return QString("%1 %2").arg(quantity).arg(item);
    }
    return item;
}

QString InvasionRewards::allRewardsString() const {
    QStringList parts;
    for (const auto& reward : attacker) {
        parts << reward.toString();
    }
    for (const auto& reward : defender) {
        parts << reward.toString();
    }
    return parts.join(", ");
}

Seconds Invasion::activeDuration(TimePoint now) const {
    return std::chrono::duration_cast<Seconds>(now - activation);
}

std::int64_t Invasion::notificationKey() const {
    return toEpochSeconds(activation);
}

// ============ Helpers ============

void sortByTier(std::vector<Fissure>& fissures) {
    std::stable_sort(fissures.begin(), fissures.end(),
                     [](const Fissure& a, const Fissure& b) {
                         return a.tier < b.tier;
                     });
}

Urgency urgencyFor(Seconds remaining) {
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(remaining).count();
    if (minutes < 10) return Urgency::Critical;
    if (minutes < 20) return Urgency::Warning;
    if (minutes < 40) return Urgency::Normal;
    return Urgency::Relaxed;
}

QString formatDuration(Seconds duration) {
    auto total = duration.count();
    auto seconds = total % 60;
    auto minutes = (total / 60) % 60;
    auto hours = total / 3600;

    if (hours <= 0 && minutes <= 0) {
        return QString("%1s").arg(seconds, 2, 10, QChar('0'));
    }
    if (hours <= 0) {
        return QString("%1m %2s")
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'));
    }
    return QString("%1h %2m %3s")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'));
}

std::int64_t toEpochSeconds(TimePoint time) {
    return std::chrono::duration_cast<Seconds>(time.time_since_epoch()).count();
}

TimePoint fromEpochSeconds(std::int64_t seconds) {
    return TimePoint(Seconds(seconds));
}

} // namespace voidrat
