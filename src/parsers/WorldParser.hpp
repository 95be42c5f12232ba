/**
 * Voidrat - World Parser Interface
 *
 * Common capability of the two upstream schema parsers: turn raw
 * fetched text into the normalized world data model.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "model/WorldData.hpp"

namespace voidrat {

/**
 * Upstream payload could not be decoded
 *
 * Raised for invalid JSON, a missing required key or a malformed entry.
 * A parse never yields a partial result.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Schema parser capability
 *
 * Each entry point is independent and side-effect free, so callers can
 * parse only the part they need.
 */
class WorldParser {
public:
    virtual ~WorldParser() = default;

    /**
     * Fissures and void storms, sorted ascending by tier
     * @throws ParseError
     */
    virtual std::vector<Fissure> parseFissures(const std::string& data) const = 0;

    /**
     * @throws ParseError
     */
    virtual CetusCycle parseCetusCycle(const std::string& data) const = 0;

    /**
     * Ongoing invasions only
     * @throws ParseError
     */
    virtual std::vector<Invasion> parseInvasions(const std::string& data) const = 0;
};

} // namespace voidrat
