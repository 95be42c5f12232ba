/**
 * Voidrat - JSON Utilities
 *
 * Checked accessors over nlohmann::json that report failures as
 * ParseError with the offending key in the message.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

#include "WorldParser.hpp"

namespace voidrat::json {

/**
 * Parse a whole document
 * @throws ParseError on invalid JSON
 */
nlohmann::json parseDocument(const std::string& data);

/**
 * Member that must be present
 * @throws ParseError if missing or if `object` is not an object
 */
const nlohmann::json& require(const nlohmann::json& object, const char* key);

/**
 * Member that must be present and be an array
 */
const nlohmann::json& requireArray(const nlohmann::json& object, const char* key);

QString requireString(const nlohmann::json& object, const char* key);

bool requireBool(const nlohmann::json& object, const char* key);

/**
 * Optional boolean member, `fallback` when absent or not a boolean
 */
bool boolOr(const nlohmann::json& object, const char* key, bool fallback);

/**
 * Optional string member, empty when absent or not a string
 */
std::string stringOr(const nlohmann::json& object, const char* key,
                     const std::string& fallback = {});

/**
 * Non-negative integer member given either as a number or a numeric string
 */
std::uint32_t countOr(const nlohmann::json& object, const char* key, std::uint32_t fallback);

/**
 * Latest accepted timestamp (2200-01-01T00:00:00Z), well inside the
 * range system_clock can represent
 */
constexpr std::int64_t MAX_EPOCH_MILLIS = 7258118400000;

/**
 * Epoch milliseconds to a time point
 * @throws ParseError if `millis` is negative or past MAX_EPOCH_MILLIS
 */
TimePoint timeFromMillis(std::int64_t millis, const char* key);

/**
 * @throws ParseError if the fissure expires at or before its activation
 */
void requireValidWindow(const Fissure& fissure);

} // namespace voidrat::json
