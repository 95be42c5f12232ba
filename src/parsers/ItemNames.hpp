/**
 * Voidrat - Item and Mission Names
 *
 * Translation of internal game identifiers found in the raw world
 * state into display names.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

#include <QString>

namespace voidrat {

/**
 * Display name of an internal item path,
 * e.g. "/Lotus/Types/Recipes/Components/FormaBlueprint" -> "Forma Blueprint"
 *
 * Known paths come from a fixed table. Anything else falls back to the
 * last path segment split at its capitals.
 */
QString itemDisplayName(const std::string& itemPath);

/**
 * "TwinVipersWraithReceiver" -> "Twin Vipers Wraith Receiver"
 */
QString splitPascalCase(const QString& value);

/**
 * Display name of a mission type id, e.g. "MT_TERRITORY" -> "Interception"
 */
QString missionTypeName(const std::string& missionType);

} // namespace voidrat
