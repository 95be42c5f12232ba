/**
 * Voidrat - Refresh Scheduler
 *
 * Background loop that loads the cached world data at start-up, keeps
 * it fresh from the primary source (or the fallback endpoints when the
 * primary fails) and plays notifications for watched events.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <QByteArray>
#include <QFutureSynchronizer>
#include <QObject>
#include <QTimer>

#include "MessageInbox.hpp"
#include "core/SharedState.hpp"
#include "core/config/AppConfig.hpp"

namespace voidrat {

class HttpFetcher;
class NotificationPlayer;
class WorldParser;

using Clock = std::function<TimePoint()>;

/**
 * Wall clock
 */
TimePoint systemNow();

/**
 * Scheduler settings, normally derived from AppConfig
 */
struct SchedulerSettings {
    std::filesystem::path dataDirectory;
    std::filesystem::path preferencesPath;
    SourceUrls urls;
    int tickIntervalMs = 500;
    int retryDelaySeconds = 60;
    size_t maxNotificationHistory = 256;

    static SchedulerSettings fromConfig(const AppConfig& config);
};

/**
 * Refresh loop
 *
 * States: bootstrapping (not initialized), idle, refreshing (a refresh
 * task is in flight). The loop itself never blocks on the network apart
 * from the single start-up fetch when there is no cached document.
 *
 * All members except the inbox are only touched from the thread that
 * calls tick(); refresh tasks talk back through the inbox and the
 * shared state.
 */
class RefreshScheduler : public QObject {
    Q_OBJECT

public:
    static constexpr const char* WORLD_STATE_FILE = "world_state.json";
    static constexpr const char* FISSURE_FILE = "fissure.json";
    static constexpr const char* CETUS_FILE = "cetus.json";
    static constexpr const char* INVASION_FILE = "invasion.json";

    RefreshScheduler(SharedState& state,
                     const HttpFetcher& fetcher,
                     NotificationPlayer& player,
                     const WorldParser& worldStateParser,
                     const WorldParser& fallbackParser,
                     SchedulerSettings settings,
                     Clock clock = systemNow,
                     QObject* parent = nullptr);
    ~RefreshScheduler() override;

    /**
     * One loop iteration: drain the inbox, bootstrap if needed,
     * start a refresh if one is due
     */
    void tick();

    /**
     * Block until every refresh and sound task started so far is done
     */
    void waitForPendingTasks();

    bool isInitialized() const { return m_initialized; }
    bool isUpdating() const { return m_updating; }

public slots:
    /**
     * Start ticking on the current thread's event loop
     */
    void start();

    void stop();

signals:
    /**
     * Emitted once the first data set is in the shared state
     */
    void initialized();

    /**
     * Emitted after every stored update
     */
    void updated();

private:
    void processMessages();
    void handleUpdated();
    void handleRefreshFailed(const QString& reason);

    void bootstrap();
    bool legacyCacheIsNewer(const std::filesystem::path& worldStateFile) const;
    void loadLegacyCache();
    void loadWorldStateCache(const std::filesystem::path& worldStateFile);

    bool refreshDue(TimePoint now) const;
    void startRefresh();
    void runRefresh();
    bool refreshFromWorldState();
    int refreshFromFallback();
    bool refreshFallbackPart(const std::string& url,
                             const char* cacheFile,
                             const std::function<void(const std::string&)>& store);

    void playNotifications(TimePoint now);
    void persistPreferences();
    void recordFailure(const QString& message);
    void releaseFinishedTasks();

    std::filesystem::path dataFile(const char* name) const;

    SharedState& m_state;
    const HttpFetcher& m_fetcher;
    NotificationPlayer& m_player;
    const WorldParser& m_worldStateParser;
    const WorldParser& m_fallbackParser;
    SchedulerSettings m_settings;
    Clock m_clock;

    MessageInbox m_inbox;
    QFutureSynchronizer<void> m_tasks;
    QTimer* m_timer = nullptr;

    bool m_initialized = false;
    bool m_updating = false;
    bool m_bootstrapped = false;
    bool m_bootstrapFailed = false;
    TimePoint m_retryNotBefore{};
};

/**
 * Read a whole file, std::nullopt if it cannot be opened
 */
std::optional<std::string> readTextFile(const std::filesystem::path& path);

/**
 * Overwrite a file with `data`
 */
bool writeDataFile(const std::filesystem::path& path, const QByteArray& data);

} // namespace voidrat
