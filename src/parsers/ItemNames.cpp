/**
 * Voidrat - Item and Mission Names Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ItemNames.hpp"

#include <unordered_map>

namespace voidrat {

namespace {

const std::unordered_map<std::string, const char*>& itemTable() {
    static const std::unordered_map<std::string, const char*> table = {
        {"/Lotus/Types/Items/MiscItems/InfestedAladCoordinate", "Infested Alad V Nav Coordinate"},
        {"/Lotus/Types/Items/Research/ChemComponent", "Detonite Injector"},
        {"/Lotus/Types/Items/Research/BioComponent", "Mutagen Mass"},
        {"/Lotus/Types/Items/Research/EnergyComponent", "Fieldron"},
        {"/Lotus/Types/Recipes/Weapons/SnipetronVandalBlueprint", "Snipetron Vandal Blueprint"},
        {"/Lotus/Types/Recipes/Weapons/DeraVandalBlueprint", "Dera Vandal Blueprint"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/TwinVipersWraithReceiver", "Twin Viper Wraith Receiver"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/DeraVandalReceiver", "Dera Vandal Receiver"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/GrineerCombatKnifeHilt", "Sheev Hilt"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/GrineerCombatKnifeBlade", "Sheev Blade"},
        {"/Lotus/Types/Recipes/Weapons/GrineerCombatKnifeSortieBlueprint", "Sheev Blueprint"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/SnipetronVandalStock", "Snipetron Vandal Stock"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/LatronWraithBarrel", "Latron Wraith Barrel"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/KarakWraithReceiver", "Karak Wraith Receiver"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/DeraVandalBarrel", "Dera Vandal Barrel"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/TwinVipersWraithBarrel", "Twin Vipers Wraith Barrel"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/StrunWraithBarrel", "Strun Wraith Barrel"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/StrunWraithReceiver", "Strun Wraith Receiver"},
        {"/Lotus/Types/Recipes/Weapons/WeaponParts/DeraVandalStock", "Dera Vandal Stock"},
        {"/Lotus/Types/Recipes/Components/FormaBlueprint", "Forma Blueprint"},
        {"/Lotus/Types/Recipes/Components/UtilityUnlockerBlueprint", "Exilus Warframe Adapter Blueprint"},
        {"/Lotus/Types/Recipes/Components/OrokinCatalystBlueprint", "Orokin Catalyst Blueprint"},
        {"/Lotus/Types/Recipes/Components/OrokinReactorBlueprint", "Orokin Reactor Blueprint"},
    };
    return table;
}

} // anonymous namespace

QString itemDisplayName(const std::string& itemPath) {
    const auto& table = itemTable();
    auto it = table.find(itemPath);
    if (it != table.end()) {
        return it->second;
    }

    auto path = QString::fromStdString(itemPath);
    return splitPascalCase(path.section('/', -1));
}

QString splitPascalCase(const QString& value) {
    QString result;
    result.reserve(value.size() * 2);
    for (int i = 0; i < value.size(); ++i) {
        QChar c = value.at(i);
        if (i > 0 && c.unicode() >= 'A' && c.unicode() <= 'Z') {
            result += QChar(' ');
        }
        result += c;
    }
    return result;
}

QString missionTypeName(const std::string& missionType) {
    static const std::unordered_map<std::string, const char*> names = {
        {"MT_ARENA", "Rathuum"},
        {"MT_ARTIFACT", "Disruption"},
        {"MT_ASSAULT", "Assault"},
        {"MT_ASSASSINATION", "Assassination"},
        {"MT_CAPTURE", "Capture"},
        {"MT_DEFENSE", "Defense"},
        {"MT_DISRUPTION", "Disruption"},
        {"MT_EVACUATION", "Defection"},
        {"MT_EXCAVATE", "Excavation"},
        {"MT_EXTERMINATION", "Extermination"},
        {"MT_HIVE", "Hive"},
        {"MT_INTEL", "Spy"},
        {"MT_LANDSCAPE", "Free Roam"},
        {"MT_MOBILE_DEFENSE", "Mobile Defense"},
        {"MT_PVP", "Conclave"},
        {"MT_RESCUE", "Rescue"},
        {"MT_RETRIEVAL", "Hijack"},
        {"MT_SABOTAGE", "Sabotage"},
        {"MT_SECTOR", "Dark Sector"},
        {"MT_SURVIVAL", "Survival"},
        {"MT_TERRITORY", "Interception"},
    };

    auto it = names.find(missionType);
    if (it != names.end()) {
        return it->second;
    }
    return "Unknown";
}

} // namespace voidrat
