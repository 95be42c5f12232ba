/**
 * Voidrat - World State Parser Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "WorldStateParser.hpp"
#include "ItemNames.hpp"
#include "JsonUtils.hpp"

#include <spdlog/spdlog.h>

namespace voidrat {

namespace {
    constexpr const char* CETUS_SYNDICATE_TAG = "CetusSyndicate";

/**
 * Decode {"$date": {"$numberLong": "<millis>"}}
 *
 * The millisecond value may be given as a string or a plain number.
 */
TimePoint decodeDate(const nlohmann::json& object, const char* key) {
    const auto& date = json::require(json::require(object, key), "$date");
    const auto& millis = json::require(date, "$numberLong");

    std::int64_t value = 0;
    if (millis.is_number_integer()) {
        value = millis.get<std::int64_t>();
    } else if (millis.is_string()) {
        bool ok = false;
        value = QString::fromStdString(millis.get<std::string>()).toLongLong(&ok);
        if (!ok) {
            throw ParseError(std::string("Bad timestamp in '") + key + "'");
        }
    } else {
        throw ParseError(std::string("Bad timestamp in '") + key + "'");
    }

    return json::timeFromMillis(value, key);
}

FissureTier decodeTier(const std::string& modifier) {
    if (modifier == "VoidT1") return FissureTier::Lith;
    if (modifier == "VoidT2") return FissureTier::Meso;
    if (modifier == "VoidT3") return FissureTier::Neo;
    if (modifier == "VoidT4") return FissureTier::Axi;
    if (modifier == "VoidT5") return FissureTier::Requiem;
    return FissureTier::Unknown;
}

/**
 * Rewards of one invasion side
 *
 * Sides without rewards are sent as an empty array instead of an
 * object, and entries may be malformed. Both cases yield no rewards
 * rather than failing the parse.
 */
std::vector<Reward> decodeRewards(const nlohmann::json& side) {
    std::vector<Reward> rewards;
    if (!side.is_object()) {
        return rewards;
    }

    auto it = side.find("countedItems");
    if (it == side.end() || !it->is_array()) {
        return rewards;
    }

    for (const auto& entry : *it) {
        auto itemType = json::stringOr(entry, "ItemType");
        if (itemType.empty()) {
            spdlog::debug("Skipping invasion reward without ItemType");
            continue;
        }

        Reward reward;
        reward.item = itemDisplayName(itemType);
        reward.quantity = json::countOr(entry, "ItemCount", 1);
        rewards.push_back(reward);
    }
    return rewards;
}

} // anonymous namespace

WorldStateParser::WorldStateParser(const SolarNodes& nodes)
    : m_nodes(nodes)
{
}

std::vector<Fissure> WorldStateParser::parseFissures(const std::string& data) const {
    auto doc = json::parseDocument(data);
    const auto& missions = json::requireArray(doc, "ActiveMissions");
    const auto& storms = json::requireArray(doc, "VoidStorms");

    std::vector<Fissure> fissures;
    fissures.reserve(missions.size() + storms.size());

    for (const auto& entry : missions) {
        Fissure fissure;
        fissure.activation = decodeDate(entry, "Activation");
        fissure.expiry = decodeDate(entry, "Expiry");
        fissure.node = m_nodes.byKey(json::requireString(entry, "Node"));
        fissure.mission = missionTypeName(json::stringOr(entry, "MissionType"));
        fissure.tier = decodeTier(json::stringOr(entry, "Modifier"));
        fissure.isStorm = false;
        fissure.hard = json::boolOr(entry, "Hard", false);
        json::requireValidWindow(fissure);
        fissures.push_back(std::move(fissure));
    }

    for (const auto& entry : storms) {
        Fissure fissure;
        fissure.activation = decodeDate(entry, "Activation");
        fissure.expiry = decodeDate(entry, "Expiry");
        fissure.node = m_nodes.byKey(json::requireString(entry, "Node"));
        // Storms carry no mission type of their own
        fissure.mission = fissure.node.type.value_or("Unknown");
        fissure.tier = decodeTier(json::stringOr(entry, "ActiveMissionTier"));
        fissure.isStorm = true;
        json::requireValidWindow(fissure);
        fissures.push_back(std::move(fissure));
    }

    sortByTier(fissures);

    spdlog::debug("Parsed {} fissures ({} void storms) from world state",
                  fissures.size(), storms.size());
    return fissures;
}

CetusCycle WorldStateParser::parseCetusCycle(const std::string& data) const {
    auto doc = json::parseDocument(data);
    const auto& syndicates = json::requireArray(doc, "SyndicateMissions");

    for (const auto& entry : syndicates) {
        if (json::stringOr(entry, "Tag") == CETUS_SYNDICATE_TAG) {
            CetusCycle cycle;
            cycle.expiry = decodeDate(entry, "Expiry");
            return cycle;
        }
    }

    throw ParseError("No CetusSyndicate entry in SyndicateMissions");
}

std::vector<Invasion> WorldStateParser::parseInvasions(const std::string& data) const {
    auto doc = json::parseDocument(data);
    const auto& entries = json::requireArray(doc, "Invasions");

    std::vector<Invasion> invasions;
    for (const auto& entry : entries) {
        if (json::requireBool(entry, "Completed")) {
            continue;
        }

        Invasion invasion;
        invasion.activation = decodeDate(entry, "Activation");
        invasion.node = m_nodes.byKey(json::requireString(entry, "Node"));
        invasion.rewards.attacker = decodeRewards(entry.value("AttackerReward", nlohmann::json()));
        invasion.rewards.defender = decodeRewards(entry.value("DefenderReward", nlohmann::json()));
        invasions.push_back(std::move(invasion));
    }

    spdlog::debug("Parsed {} ongoing invasions from world state ({} total)",
                  invasions.size(), entries.size());
    return invasions;
}

} // namespace voidrat
