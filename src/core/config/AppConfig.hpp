/**
 * Voidrat - Application Configuration
 *
 * Endpoints, timings and file locations, read from an optional
 * voidrat.json next to the application.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace voidrat {

/**
 * Upstream endpoints
 */
struct SourceUrls {
    std::string worldState = "https://content.warframe.com/dynamic/worldState.php";
    std::string fallbackFissures = "https://api.warframestat.us/pc/fissures";
    std::string fallbackCetus = "https://api.warframestat.us/pc/cetusCycle";
    std::string fallbackInvasions = "https://api.warframestat.us/pc/invasions";
};

/**
 * Program-wide settings
 *
 * Every key is optional; missing keys keep their defaults.
 */
struct AppConfig {
    static constexpr const char* FILE_NAME = "voidrat.json";

    std::filesystem::path baseDirectory;      // Working directory of the process

    SourceUrls urls;
    int fetchTimeoutMs = 8000;
    int tickIntervalMs = 500;
    int retryDelaySeconds = 60;
    size_t maxNotificationHistory = 256;

    std::string soundCommand = "aplay";
    std::vector<std::string> soundArguments = {"-q"};
    std::string soundFile;                    // Empty = bundled sound
    std::string nodeDataFile;                 // Empty = bundled location dataset

    std::string logLevel = "info";            // debug, info, warning, error

    /**
     * Read `baseDirectory / voidrat.json`, falling back to defaults
     * when the file is absent or malformed
     */
    static AppConfig load(const std::filesystem::path& baseDirectory);

    std::filesystem::path preferencesPath() const;
    std::filesystem::path dataDirectory() const;
    std::filesystem::path logPath() const;
};

} // namespace voidrat
