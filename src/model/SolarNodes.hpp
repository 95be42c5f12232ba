/**
 * Voidrat - Solar Node Dataset
 *
 * Static lookup of star chart locations, bundled with the application
 * as a Qt resource and loaded once per process.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <QByteArray>
#include <QString>

namespace voidrat {

/**
 * A place on the star chart, e.g. "Hepit (Void)"
 */
struct SolarNode {
    QString value = "Unknown";
    std::optional<QString> enemy;    // e.g. "Corrupted"
    std::optional<QString> type;     // e.g. "Capture"

    bool isUnknown() const { return value == "Unknown"; }
};

/**
 * Location dataset keyed by internal node id (e.g. "SolNode401")
 *
 * Unresolved lookups return a default SolarNode ("Unknown") instead
 * of failing.
 */
class SolarNodes {
public:
    SolarNodes() = default;

    /**
     * Build the dataset from a JSON object of key -> {value, enemy, type}
     *
     * @throws std::runtime_error if the document is not such an object
     */
    static SolarNodes fromJson(const QByteArray& json);

    /**
     * Dataset from a file on disk, same layout as the bundled one
     *
     * @throws std::runtime_error if the file cannot be read or is invalid
     */
    static SolarNodes fromFile(const std::filesystem::path& path);

    /**
     * Dataset bundled as ":/data/sol_node.json", parsed on first use
     *
     * @throws std::runtime_error if the resource is missing or invalid
     */
    static const SolarNodes& bundled();

    SolarNode byKey(const QString& key) const;

    /**
     * Reverse lookup by display name, e.g. "Hepit (Void)"
     */
    SolarNode byValue(const QString& value) const;

    size_t size() const { return m_nodes.size(); }

private:
    std::map<QString, SolarNode> m_nodes;
    std::map<QString, QString> m_keysByValue;
};

} // namespace voidrat
