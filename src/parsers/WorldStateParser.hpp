/**
 * Voidrat - World State Parser
 *
 * Parser for the raw game world state document (worldState.php):
 * PascalCase keys, Mongo-style "$date" timestamps and internal item
 * paths for rewards.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "WorldParser.hpp"
#include "model/SolarNodes.hpp"

namespace voidrat {

/**
 * Parser for the primary source
 *
 * Locations are referenced by node key (e.g. "SolNode401").
 */
class WorldStateParser : public WorldParser {
public:
    explicit WorldStateParser(const SolarNodes& nodes);

    /**
     * Merges "ActiveMissions" and "VoidStorms" into one list
     */
    std::vector<Fissure> parseFissures(const std::string& data) const override;

    /**
     * Expiry of the "CetusSyndicate" entry of "SyndicateMissions"
     */
    CetusCycle parseCetusCycle(const std::string& data) const override;

    std::vector<Invasion> parseInvasions(const std::string& data) const override;

private:
    const SolarNodes& m_nodes;
};

} // namespace voidrat
