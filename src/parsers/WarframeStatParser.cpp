/**
 * Voidrat - Aggregator API Parser Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "WarframeStatParser.hpp"
#include "JsonUtils.hpp"

#include <QDateTime>

#include <spdlog/spdlog.h>

namespace voidrat {

namespace {

TimePoint parseIsoDate(const QString& value, const char* key) {
    auto dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (!dt.isValid()) {
        throw ParseError(std::string("Bad date in '") + key + "': " + value.toStdString());
    }
    return json::timeFromMillis(dt.toMSecsSinceEpoch(), key);
}

TimePoint requireDate(const nlohmann::json& object, const char* key) {
    return parseIsoDate(json::requireString(object, key), key);
}

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
        auto item = json::stringOr(entry, "type");
        if (item.empty()) {
            continue;
        }

        Reward reward;
        reward.item = QString::fromStdString(item);
        reward.quantity = json::countOr(entry, "count", 1);
        rewards.push_back(reward);
    }
    return rewards;
}

void requireArrayDocument(const nlohmann::json& doc, const char* endpoint) {
    if (!doc.is_array()) {
        throw ParseError(std::string("Expected a JSON array from the ") + endpoint + " endpoint");
    }
}

} // anonymous namespace

WarframeStatParser::WarframeStatParser(const SolarNodes& nodes)
    : m_nodes(nodes)
{
}

std::vector<Fissure> WarframeStatParser::parseFissures(const std::string& data) const {
    auto doc = json::parseDocument(data);
    requireArrayDocument(doc, "fissures");

    std::vector<Fissure> fissures;
    fissures.reserve(doc.size());

    for (const auto& entry : doc) {
        Fissure fissure;
        // Only the extended shape carries an activation time
        auto activation = json::stringOr(entry, "activation");
        if (!activation.empty()) {
            fissure.activation = parseIsoDate(QString::fromStdString(activation), "activation");
        }
        fissure.expiry = requireDate(entry, "expiry");
        fissure.node = m_nodes.byValue(json::requireString(entry, "node"));
        fissure.mission = QString::fromStdString(
            json::stringOr(entry, "missionKey", json::stringOr(entry, "missionType", "Unknown")));
        fissure.tier = parseTier(json::stringOr(entry, "tier"));
        fissure.isStorm = json::boolOr(entry, "isStorm", false);
        fissure.hard = !fissure.isStorm && json::boolOr(entry, "isHard", false);
        json::requireValidWindow(fissure);
        fissures.push_back(std::move(fissure));
    }

    sortByTier(fissures);

    spdlog::debug("Parsed {} fissures from aggregator", fissures.size());
    return fissures;
}

CetusCycle WarframeStatParser::parseCetusCycle(const std::string& data) const {
    auto doc = json::parseDocument(data);

    auto expiry = requireDate(doc, "expiry");
    bool isDay = json::requireBool(doc, "isDay");

    return CetusCycle::fromPhaseExpiry(expiry, isDay);
}

std::vector<Invasion> WarframeStatParser::parseInvasions(const std::string& data) const {
    auto doc = json::parseDocument(data);
    requireArrayDocument(doc, "invasions");

    std::vector<Invasion> invasions;
    for (const auto& entry : doc) {
        if (json::requireBool(entry, "completed")) {
            continue;
        }

        Invasion invasion;
        invasion.activation = requireDate(entry, "activation");
        invasion.node = m_nodes.byValue(json::requireString(entry, "node"));
        invasion.rewards.attacker = decodeRewards(entry.value("attackerReward", nlohmann::json()));
        invasion.rewards.defender = decodeRewards(entry.value("defenderReward", nlohmann::json()));
        invasions.push_back(std::move(invasion));
    }

    spdlog::debug("Parsed {} ongoing invasions from aggregator ({} total)",
                  invasions.size(), doc.size());
    return invasions;
}

} // namespace voidrat
