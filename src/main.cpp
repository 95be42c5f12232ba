/**
 * Voidrat - Warframe world state tracker
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "core/Preferences.hpp"
#include "core/WorldTracker.hpp"
#include "core/config/AppConfig.hpp"
#include "notify/NotificationPlayer.hpp"

namespace {

void setupLogging(const std::filesystem::path& logPath) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), 1024 * 1024 * 5, 3);
    file_sink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>(
        "voidrat", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("Voidrat starting up...");
}

void applyLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", name);
        return;
    }
    spdlog::default_logger()->sinks().front()->set_level(level);
}

void logSummary(const voidrat::WorldSnapshot& snapshot) {
    auto now = std::chrono::system_clock::now();
    const auto& cetus = snapshot.cetusCycle;

    spdlog::info("{} fissures, {} invasions, Cetus {} for {} (source: {})",
                 snapshot.fissures.size(),
                 snapshot.invasions.size(),
                 cetus.cetusIsDay(now) ? "day" : "night",
                 voidrat::formatDuration(cetus.cetusTillCycle(now)).toStdString(),
                 voidrat::dataSourceName(snapshot.status.source).toStdString());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("Voidrat");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("voidrat");

    auto baseDirectory = std::filesystem::current_path();

    voidrat::AppConfig defaults;
    defaults.baseDirectory = baseDirectory;
    setupLogging(defaults.logPath());

    auto config = voidrat::AppConfig::load(baseDirectory);
    applyLogLevel(config.logLevel);

    voidrat::Preferences preferences;
    try {
        preferences = voidrat::Preferences::load(config.preferencesPath());
    } catch (const voidrat::PreferencesError& e) {
        spdlog::critical("Cannot load preferences: {}", e.what());
        return 1;
    }

    std::filesystem::path soundFile = config.soundFile;
    if (soundFile.empty()) {
        auto extracted = voidrat::CommandSoundPlayer::extractBundledSound(config.dataDirectory());
        if (extracted) {
            soundFile = *extracted;
        } else {
            spdlog::warn("Notification sound unavailable");
        }
    }

    voidrat::WorldTracker tracker(config, std::move(preferences), soundFile);

    QObject::connect(&tracker, &voidrat::WorldTracker::initialized, [&tracker]() {
        logSummary(tracker.snapshot());
    });
    QObject::connect(&tracker, &voidrat::WorldTracker::updated, [&tracker]() {
        logSummary(tracker.snapshot());
    });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&tracker]() {
        tracker.stop();
    });

    tracker.start();

    return app.exec();
}
