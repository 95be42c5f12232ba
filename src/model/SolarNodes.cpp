/**
 * Voidrat - Solar Node Dataset Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SolarNodes.hpp"

#include <stdexcept>

#include <QFile>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace voidrat {

namespace {
    constexpr const char* BUNDLED_DATASET = ":/data/sol_node.json";

std::optional<QString> optionalString(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return QString::fromStdString(it->get<std::string>());
}

} // anonymous namespace

SolarNodes SolarNodes::fromJson(const QByteArray& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json.constData(), json.constData() + json.size());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Bad solar node dataset: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Bad solar node dataset: top level is not an object");
    }

    SolarNodes nodes;
    for (const auto& item : j.items()) {
        const auto& key = item.key();
        const auto& entry = item.value();
        if (!entry.is_object()) {
            spdlog::warn("Skipping malformed solar node entry: {}", key);
            continue;
        }

        SolarNode node;
        if (auto value = optionalString(entry, "value")) {
            node.value = *value;
        }
        node.enemy = optionalString(entry, "enemy");
        node.type = optionalString(entry, "type");

        auto qKey = QString::fromStdString(key);
        // First key wins on duplicate display names
        nodes.m_keysByValue.emplace(node.value, qKey);
        nodes.m_nodes.emplace(qKey, std::move(node));
    }

    return nodes;
}

SolarNodes SolarNodes::fromFile(const std::filesystem::path& path) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("Cannot open solar node dataset: " + path.string());
    }
    auto nodes = fromJson(file.readAll());
    spdlog::info("Loaded {} solar nodes from {}", nodes.size(), path.string());
    return nodes;
}

const SolarNodes& SolarNodes::bundled() {
    static const SolarNodes instance = [] {
        QFile file(BUNDLED_DATASET);
        if (!file.open(QIODevice::ReadOnly)) {
            throw std::runtime_error(
                std::string("Missing bundled solar node dataset: ") + BUNDLED_DATASET);
        }
        auto nodes = fromJson(file.readAll());
        spdlog::debug("Loaded {} solar nodes", nodes.size());
        return nodes;
    }();
    return instance;
}

SolarNode SolarNodes::byKey(const QString& key) const {
    auto it = m_nodes.find(key);
    if (it != m_nodes.end()) {
        return it->second;
    }
    spdlog::debug("Unknown solar node key: {}", key.toStdString());
    return SolarNode();
}

SolarNode SolarNodes::byValue(const QString& value) const {
    auto it = m_keysByValue.find(value);
    if (it != m_keysByValue.end()) {
        return byKey(it->second);
    }
    spdlog::debug("Unknown solar node value: {}", value.toStdString());
    return SolarNode();
}

} // namespace voidrat
