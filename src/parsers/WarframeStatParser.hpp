/**
 * Voidrat - Aggregator API Parser
 *
 * Parser for the community aggregator endpoints (fissures, cetusCycle,
 * invasions), used as the fallback source.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "WorldParser.hpp"
#include "model/SolarNodes.hpp"

namespace voidrat {

/**
 * Parser for the fallback source
 *
 * Each endpoint returns its own document, so every entry point expects
 * the body of the matching endpoint. Locations are given by display
 * name and resolved through a reverse lookup.
 */
class WarframeStatParser : public WorldParser {
public:
    explicit WarframeStatParser(const SolarNodes& nodes);

    std::vector<Fissure> parseFissures(const std::string& data) const override;

    /**
     * Normalizes the expiry to the end of the night
     */
    CetusCycle parseCetusCycle(const std::string& data) const override;

    std::vector<Invasion> parseInvasions(const std::string& data) const override;

private:
    const SolarNodes& m_nodes;
};

} // namespace voidrat
