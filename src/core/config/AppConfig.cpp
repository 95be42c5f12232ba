/**
 * Voidrat - Application Configuration Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AppConfig.hpp"
#include "core/Preferences.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace voidrat {

namespace {
    constexpr const char* DATA_DIR = "data";
    constexpr const char* LOG_FILE = "voidrat.log";

/**
 * Integer setting that must be at least `minimum`; out of range values
 * keep `fallback`
 */
std::int64_t boundedOr(const nlohmann::json& j, const char* key,
                       std::int64_t minimum, std::int64_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    auto value = j[key].get<std::int64_t>();
    if (value < minimum || value > std::numeric_limits<int>::max()) {
        spdlog::warn("Ignoring {} = {}, keeping {}", key, value, fallback);
        return fallback;
    }
    return value;
}

} // anonymous namespace

AppConfig AppConfig::load(const std::filesystem::path& baseDirectory) {
    AppConfig config;
    config.baseDirectory = baseDirectory;

    auto configPath = baseDirectory / FILE_NAME;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            spdlog::warn("Cannot open {}, using defaults", configPath.string());
            return config;
        }

        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("worldStateUrl")) {
            config.urls.worldState = j["worldStateUrl"].get<std::string>();
        }
        if (j.contains("fallbackFissuresUrl")) {
            config.urls.fallbackFissures = j["fallbackFissuresUrl"].get<std::string>();
        }
        if (j.contains("fallbackCetusUrl")) {
            config.urls.fallbackCetus = j["fallbackCetusUrl"].get<std::string>();
        }
        if (j.contains("fallbackInvasionsUrl")) {
            config.urls.fallbackInvasions = j["fallbackInvasionsUrl"].get<std::string>();
        }
        config.fetchTimeoutMs = static_cast<int>(
            boundedOr(j, "fetchTimeoutMs", 1, config.fetchTimeoutMs));
        config.tickIntervalMs = static_cast<int>(
            boundedOr(j, "tickIntervalMs", 1, config.tickIntervalMs));
        config.retryDelaySeconds = static_cast<int>(
            boundedOr(j, "retryDelaySeconds", 0, config.retryDelaySeconds));
        config.maxNotificationHistory = static_cast<size_t>(
            boundedOr(j, "maxNotificationHistory", 1,
                      static_cast<std::int64_t>(config.maxNotificationHistory)));
        if (j.contains("soundCommand")) {
            config.soundCommand = j["soundCommand"].get<std::string>();
        }
        if (j.contains("soundArguments")) {
            config.soundArguments = j["soundArguments"].get<std::vector<std::string>>();
        }
        if (j.contains("soundFile")) {
            config.soundFile = j["soundFile"].get<std::string>();
        }
        if (j.contains("nodeDataFile")) {
            config.nodeDataFile = j["nodeDataFile"].get<std::string>();
        }
        if (j.contains("logLevel")) {
            config.logLevel = j["logLevel"].get<std::string>();
        }

        spdlog::info("Configuration loaded from: {}", configPath.string());
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load {}: {}, using defaults", configPath.string(), e.what());
        auto defaults = AppConfig();
        defaults.baseDirectory = baseDirectory;
        return defaults;
    }

    return config;
}

std::filesystem::path AppConfig::preferencesPath() const {
    return baseDirectory / Preferences::DEFAULT_FILE_NAME;
}

std::filesystem::path AppConfig::dataDirectory() const {
    return baseDirectory / DATA_DIR;
}

std::filesystem::path AppConfig::logPath() const {
    return baseDirectory / LOG_FILE;
}

} // namespace voidrat
