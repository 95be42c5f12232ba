/**
 * Voidrat - Persistent Preferences
 *
 * Update cooldown, last update time, notification toggles and the
 * history of already played notifications, stored as a small binary
 * file next to the application.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace voidrat {

/**
 * Preferences file exists but could not be decoded, or could not be created
 *
 * Deliberately fatal: continuing with defaults would silently discard
 * the user's settings and notification history.
 */
class PreferencesError : public std::runtime_error {
public:
    explicit PreferencesError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Persistent application state
 *
 * Every mutation is followed by a full rewrite of the file.
 */
struct Preferences {
    static constexpr const char* DEFAULT_FILE_NAME = "voidrat.storage";

    std::int64_t updateCooldown = 300;   // Seconds between fetches
    std::int64_t lastUpdate = 0;         // Epoch seconds, 0 = never
    bool notifyVoidCapture = false;
    bool notifyEpicInvasion = false;
    std::vector<std::int64_t> notified;  // Activation timestamps already notified on

    /**
     * Load from `path`, creating and persisting defaults if it does not exist
     *
     * @throws PreferencesError if the file is undecodable or cannot be created
     */
    static Preferences load(const std::filesystem::path& path);

    /**
     * Overwrite `path` with the encoded preferences
     */
    bool persist(const std::filesystem::path& path) const;

    /**
     * True once the cooldown has passed since the last update
     */
    bool canUpdate(std::int64_t now) const {
        return lastUpdate + updateCooldown < now;
    }

    /**
     * Negative when an update is overdue
     */
    std::int64_t secondsUntilNextUpdate(std::int64_t now) const {
        return (lastUpdate + updateCooldown) - now;
    }

    bool wasNotified(std::int64_t key) const;

    /**
     * Record a played notification, keeping at most `maxHistory` entries
     * (oldest dropped first, 0 = unlimited)
     */
    void recordNotification(std::int64_t key, size_t maxHistory = 0);

    bool operator==(const Preferences& other) const {
        return updateCooldown == other.updateCooldown &&
               lastUpdate == other.lastUpdate &&
               notifyVoidCapture == other.notifyVoidCapture &&
               notifyEpicInvasion == other.notifyEpicInvasion &&
               notified == other.notified;
    }
};

} // namespace voidrat
