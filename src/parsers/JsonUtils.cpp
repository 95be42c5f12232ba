/**
 * Voidrat - JSON Utilities Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "JsonUtils.hpp"

namespace voidrat::json {

nlohmann::json parseDocument(const std::string& data) {
    try {
        return nlohmann::json::parse(data);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("Invalid JSON: ") + e.what());
    }
}

const nlohmann::json& require(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        throw ParseError(std::string("Expected an object holding '") + key + "'");
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        throw ParseError(std::string("Missing required key '") + key + "'");
    }
    return *it;
}

const nlohmann::json& requireArray(const nlohmann::json& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_array()) {
        throw ParseError(std::string("Key '") + key + "' is not an array");
    }
    return value;
}

QString requireString(const nlohmann::json& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_string()) {
        throw ParseError(std::string("Key '") + key + "' is not a string");
    }
    return QString::fromStdString(value.get<std::string>());
}

bool requireBool(const nlohmann::json& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_boolean()) {
        throw ParseError(std::string("Key '") + key + "' is not a boolean");
    }
    return value.get<bool>();
}

bool boolOr(const nlohmann::json& object, const char* key, bool fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

std::string stringOr(const nlohmann::json& object, const char* key,
                     const std::string& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::uint32_t countOr(const nlohmann::json& object, const char* key, std::uint32_t fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint32_t>();
    }
    if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        return value < 0 ? fallback : static_cast<std::uint32_t>(value);
    }
    if (it->is_string()) {
        bool ok = false;
        auto value = QString::fromStdString(it->get<std::string>()).toUInt(&ok);
        return ok ? value : fallback;
    }
    return fallback;
}

TimePoint timeFromMillis(std::int64_t millis, const char* key) {
    if (millis < 0 || millis > MAX_EPOCH_MILLIS) {
        throw ParseError(std::string("Timestamp out of range in '") + key + "': "
                         + std::to_string(millis));
    }
    return TimePoint(std::chrono::milliseconds(millis));
}

void requireValidWindow(const Fissure& fissure) {
    if (fissure.activation && fissure.expiry <= *fissure.activation) {
        throw ParseError("Fissure at " + fissure.node.value.toStdString()
                         + " expires before it activates");
    }
}

} // namespace voidrat::json
