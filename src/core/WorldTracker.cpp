/**
 * Voidrat - World Tracker Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "WorldTracker.hpp"
#include "model/SolarNodes.hpp"
#include "network/HttpFetcher.hpp"
#include "notify/NotificationPlayer.hpp"
#include "parsers/WarframeStatParser.hpp"
#include "parsers/WorldStateParser.hpp"
#include "scheduler/RefreshScheduler.hpp"

#include <QFutureSynchronizer>
#include <QThread>
#include <QtConcurrent>

#include <spdlog/spdlog.h>

namespace voidrat {

namespace {

SolarNodes loadSolarNodes(const AppConfig& config) {
    if (!config.nodeDataFile.empty()) {
        try {
            return SolarNodes::fromFile(config.nodeDataFile);
        } catch (const std::runtime_error& e) {
            spdlog::warn("{}, using the bundled dataset", e.what());
        }
    }
    return SolarNodes::bundled();
}

} // anonymous namespace

class WorldTracker::Impl {
public:
    Impl(const AppConfig& config,
         Preferences preferences,
         std::unique_ptr<HttpFetcher> httpFetcher,
         std::unique_ptr<NotificationPlayer> notificationPlayer)
        : state(std::move(preferences))
        , preferencesPath(config.preferencesPath())
        , fetcher(std::move(httpFetcher))
        , player(std::move(notificationPlayer))
        , nodes(loadSolarNodes(config))
        , worldStateParser(nodes)
        , fallbackParser(nodes)
    {
        scheduler = std::make_unique<RefreshScheduler>(
            state, *fetcher, *player, worldStateParser, fallbackParser,
            SchedulerSettings::fromConfig(config));
    }

    SharedState state;
    std::filesystem::path preferencesPath;
    std::unique_ptr<HttpFetcher> fetcher;
    std::unique_ptr<NotificationPlayer> player;
    SolarNodes nodes;
    WorldStateParser worldStateParser;
    WarframeStatParser fallbackParser;
    QThread thread;
    std::unique_ptr<RefreshScheduler> scheduler;
    QFutureSynchronizer<void> soundTasks;
};

WorldTracker::WorldTracker(const AppConfig& config,
                           Preferences preferences,
                           const std::filesystem::path& soundFile,
                           QObject* parent)
    : WorldTracker(config,
                   std::move(preferences),
                   std::make_unique<QtHttpFetcher>(config.fetchTimeoutMs),
                   std::make_unique<CommandSoundPlayer>(config.soundCommand,
                                                        config.soundArguments,
                                                        soundFile),
                   parent)
{
}

WorldTracker::WorldTracker(const AppConfig& config,
                           Preferences preferences,
                           std::unique_ptr<HttpFetcher> fetcher,
                           std::unique_ptr<NotificationPlayer> player,
                           QObject* parent)
    : QObject(parent)
    , m_impl(std::make_unique<Impl>(config, std::move(preferences),
                                    std::move(fetcher), std::move(player)))
{
    m_impl->thread.setObjectName("voidrat-refresh");

    auto* scheduler = m_impl->scheduler.get();
    scheduler->moveToThread(&m_impl->thread);

    connect(&m_impl->thread, &QThread::started, scheduler, &RefreshScheduler::start);
    connect(scheduler, &RefreshScheduler::initialized, this, &WorldTracker::initialized);
    connect(scheduler, &RefreshScheduler::updated, this, &WorldTracker::updated);
}

WorldTracker::~WorldTracker() {
    stop();
}

void WorldTracker::start() {
    if (m_impl->thread.isRunning()) {
        return;
    }
    spdlog::info("Starting world tracker");
    m_impl->thread.start();
}

void WorldTracker::stop() {
    if (m_impl->thread.isRunning()) {
        QMetaObject::invokeMethod(m_impl->scheduler.get(), "stop",
                                  Qt::BlockingQueuedConnection);
        m_impl->thread.quit();
        m_impl->thread.wait();
        spdlog::info("World tracker stopped");
    }

    m_impl->scheduler->waitForPendingTasks();
    m_impl->soundTasks.waitForFinished();
}

bool WorldTracker::isRunning() const {
    return m_impl->thread.isRunning();
}

WorldSnapshot WorldTracker::snapshot() const {
    return m_impl->state.snapshot();
}

bool WorldTracker::saveNotificationToggles(bool voidCapture, bool epicInvasion) {
    m_impl->state.updatePreferences([voidCapture, epicInvasion](Preferences& p) {
        p.notifyVoidCapture = voidCapture;
        p.notifyEpicInvasion = epicInvasion;
    });

    if (!m_impl->state.persistPreferences(m_impl->preferencesPath)) {
        spdlog::error("Failed to save notification settings");
        m_impl->state.recordError("Cannot write preferences file");
        return false;
    }

    spdlog::info("Notifications: void capture {}, epic invasion {}",
                 voidCapture ? "on" : "off", epicInvasion ? "on" : "off");
    return true;
}

void WorldTracker::playTestSound() {
    auto* player = m_impl->player.get();
    m_impl->soundTasks.addFuture(QtConcurrent::run([player]() { player->play(); }));
}

} // namespace voidrat
