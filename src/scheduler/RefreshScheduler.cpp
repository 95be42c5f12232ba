/**
 * Voidrat - Refresh Scheduler Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RefreshScheduler.hpp"
#include "network/HttpFetcher.hpp"
#include "notify/NotificationPlayer.hpp"
#include "notify/NotificationTriggers.hpp"
#include "parsers/WorldParser.hpp"

#include <algorithm>

#include <QFile>
#include <QFuture>
#include <QtConcurrent>

#include <spdlog/spdlog.h>

namespace voidrat {

TimePoint systemNow() {
    return std::chrono::system_clock::now();
}

SchedulerSettings SchedulerSettings::fromConfig(const AppConfig& config) {
    SchedulerSettings settings;
    settings.dataDirectory = config.dataDirectory();
    settings.preferencesPath = config.preferencesPath();
    settings.urls = config.urls;
    settings.tickIntervalMs = config.tickIntervalMs;
    settings.retryDelaySeconds = config.retryDelaySeconds;
    settings.maxNotificationHistory = config.maxNotificationHistory;
    return settings;
}

std::optional<std::string> readTextFile(const std::filesystem::path& path) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

bool writeDataFile(const std::filesystem::path& path, const QByteArray& data) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        spdlog::error("Cannot write {}: {}", path.string(), file.errorString().toStdString());
        return false;
    }
    if (file.write(data) != data.size()) {
        spdlog::error("Short write to {}", path.string());
        return false;
    }
    return true;
}

RefreshScheduler::RefreshScheduler(SharedState& state,
                                   const HttpFetcher& fetcher,
                                   NotificationPlayer& player,
                                   const WorldParser& worldStateParser,
                                   const WorldParser& fallbackParser,
                                   SchedulerSettings settings,
                                   Clock clock,
                                   QObject* parent)
    : QObject(parent)
    , m_state(state)
    , m_fetcher(fetcher)
    , m_player(player)
    , m_worldStateParser(worldStateParser)
    , m_fallbackParser(fallbackParser)
    , m_settings(std::move(settings))
    , m_clock(std::move(clock))
{
}

RefreshScheduler::~RefreshScheduler() {
    // Tasks hold references to this object
    m_tasks.waitForFinished();
}

void RefreshScheduler::start() {
    if (m_timer) {
        return;
    }

    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &RefreshScheduler::tick);
    m_timer->start(m_settings.tickIntervalMs);

    spdlog::info("Refresh loop started ({} ms tick)", m_settings.tickIntervalMs);
    tick();
}

void RefreshScheduler::stop() {
    if (!m_timer) {
        return;
    }
    m_timer->stop();
    m_timer->deleteLater();
    m_timer = nullptr;
    spdlog::info("Refresh loop stopped");
}

void RefreshScheduler::waitForPendingTasks() {
    m_tasks.waitForFinished();
    m_tasks.clearFutures();
}

void RefreshScheduler::tick() {
    processMessages();
    releaseFinishedTasks();

    if (!m_initialized && !m_bootstrapped) {
        bootstrap();
    }

    auto now = m_clock();
    if (refreshDue(now)) {
        startRefresh();
    }
}

// ============ Inbox ============

void RefreshScheduler::processMessages() {
    for (const auto& message : m_inbox.drain()) {
        switch (message.kind) {
            case SchedulerMessage::Kind::Initialized:
                m_initialized = true;
                m_state.setInitialized();
                spdlog::info("World data initialized");
                emit initialized();
                break;
            case SchedulerMessage::Kind::Updated:
                handleUpdated();
                break;
            case SchedulerMessage::Kind::RefreshFailed:
                handleRefreshFailed(message.detail);
                break;
        }
    }
}

void RefreshScheduler::handleUpdated() {
    auto now = m_clock();
    m_updating = false;

    if (!m_initialized) {
        m_initialized = true;
        m_state.setInitialized();
        spdlog::info("World data initialized from a refresh");
        emit initialized();
    }

    auto prefs = m_state.updatePreferences([&now](Preferences& p) {
        p.lastUpdate = toEpochSeconds(now);
    });
    m_state.recordSuccess(now);
    persistPreferences();

    playNotifications(now);

    spdlog::debug("Updated, next update in {}s", prefs.secondsUntilNextUpdate(toEpochSeconds(now)));
    emit updated();
}

void RefreshScheduler::handleRefreshFailed(const QString& reason) {
    m_updating = false;
    m_retryNotBefore = m_clock() + Seconds(m_settings.retryDelaySeconds);
    recordFailure(reason);
    spdlog::info("Retrying in {}s", m_settings.retryDelaySeconds);
}

// ============ Bootstrapping ============

void RefreshScheduler::bootstrap() {
    m_bootstrapped = true;
    auto now = m_clock();

    std::error_code ec;
    std::filesystem::create_directories(m_settings.dataDirectory, ec);
    if (ec) {
        m_bootstrapFailed = true;
        recordFailure(QString("Cannot create data directory: %1")
                          .arg(QString::fromStdString(ec.message())));
        return;
    }

    auto worldStateFile = dataFile(WORLD_STATE_FILE);
    if (!std::filesystem::exists(worldStateFile)) {
        spdlog::info("No cached world state, fetching it");
        auto body = m_fetcher.fetch(QString::fromStdString(m_settings.urls.worldState));
        if (body && writeDataFile(worldStateFile, *body)) {
            m_state.updatePreferences([&now](Preferences& p) {
                p.lastUpdate = toEpochSeconds(now);
            });
            persistPreferences();
        }
    }

    try {
        if (legacyCacheIsNewer(worldStateFile)) {
            loadLegacyCache();
        } else if (std::filesystem::exists(worldStateFile)) {
            loadWorldStateCache(worldStateFile);
        } else {
            m_bootstrapFailed = true;
            recordFailure("No cached world data and the world state fetch failed");
            return;
        }
    } catch (const std::exception& e) {
        m_bootstrapFailed = true;
        recordFailure(QString("Cannot load cached world data: %1").arg(QString::fromUtf8(e.what())));
        return;
    }

    m_inbox.post(SchedulerMessage::Kind::Initialized);
}

bool RefreshScheduler::legacyCacheIsNewer(const std::filesystem::path& worldStateFile) const {
    std::error_code ec;
    std::filesystem::file_time_type oldest = std::filesystem::file_time_type::max();
    for (const char* name : {FISSURE_FILE, CETUS_FILE, INVASION_FILE}) {
        auto time = std::filesystem::last_write_time(dataFile(name), ec);
        if (ec) {
            return false;
        }
        oldest = std::min(oldest, time);
    }

    auto worldStateTime = std::filesystem::last_write_time(worldStateFile, ec);
    if (ec) {
        // Only the fallback documents are cached
        return true;
    }
    return oldest > worldStateTime;
}

void RefreshScheduler::loadLegacyCache() {
    spdlog::info("Loading world data from cached fallback documents");

    auto read = [this](const char* name) {
        auto content = readTextFile(dataFile(name));
        if (!content) {
            throw std::runtime_error(std::string("Cannot read ") + dataFile(name).string());
        }
        return *content;
    };

    auto fissures = m_fallbackParser.parseFissures(read(FISSURE_FILE));
    auto cetus = m_fallbackParser.parseCetusCycle(read(CETUS_FILE));
    auto invasions = m_fallbackParser.parseInvasions(read(INVASION_FILE));

    m_state.replaceWorld(std::move(fissures), cetus, std::move(invasions), DataSource::Cache);
}

void RefreshScheduler::loadWorldStateCache(const std::filesystem::path& worldStateFile) {
    spdlog::info("Loading world data from {}", worldStateFile.string());

    auto content = readTextFile(worldStateFile);
    if (!content) {
        throw std::runtime_error("Cannot read " + worldStateFile.string());
    }

    auto fissures = m_worldStateParser.parseFissures(*content);
    auto cetus = m_worldStateParser.parseCetusCycle(*content);
    auto invasions = m_worldStateParser.parseInvasions(*content);

    m_state.replaceWorld(std::move(fissures), cetus, std::move(invasions), DataSource::Cache);
}

// ============ Refreshing ============

bool RefreshScheduler::refreshDue(TimePoint now) const {
    if (m_updating || now < m_retryNotBefore) {
        return false;
    }
    // Nothing to show yet, do not wait for the cooldown
    if (m_bootstrapFailed && !m_initialized) {
        return true;
    }
    return m_state.preferences().canUpdate(toEpochSeconds(now));
}

void RefreshScheduler::startRefresh() {
    m_updating = true;
    spdlog::debug("Updating..");
    m_tasks.addFuture(QtConcurrent::run([this]() { runRefresh(); }));
}

void RefreshScheduler::runRefresh() {
    if (refreshFromWorldState()) {
        m_inbox.post(SchedulerMessage::Kind::Updated);
        return;
    }

    spdlog::warn("Failed to get data from the primary source, using fallback instead");

    if (refreshFromFallback() == 0) {
        m_inbox.post(SchedulerMessage::Kind::RefreshFailed,
                     "Primary and fallback sources all failed");
    }
}

bool RefreshScheduler::refreshFromWorldState() {
    auto body = m_fetcher.fetch(QString::fromStdString(m_settings.urls.worldState));
    if (!body) {
        return false;
    }

    std::string json = body->toStdString();
    try {
        auto fissures = m_worldStateParser.parseFissures(json);
        auto cetus = m_worldStateParser.parseCetusCycle(json);
        auto invasions = m_worldStateParser.parseInvasions(json);

        m_state.replaceWorld(std::move(fissures), cetus, std::move(invasions),
                             DataSource::WorldState);
    } catch (const ParseError& e) {
        spdlog::error("Bad world state document: {}", e.what());
        m_state.recordError(QString("Bad world state document: %1").arg(QString::fromUtf8(e.what())));
        return false;
    }

    // Keep the cached copy in sync only with documents that parsed
    writeDataFile(dataFile(WORLD_STATE_FILE), *body);
    return true;
}

int RefreshScheduler::refreshFromFallback() {
    const auto& urls = m_settings.urls;

    QFuture<bool> fissures = QtConcurrent::run([this, &urls]() {
        return refreshFallbackPart(urls.fallbackFissures, FISSURE_FILE,
            [this](const std::string& json) {
                m_state.setFissures(m_fallbackParser.parseFissures(json), DataSource::Fallback);
            });
    });

    QFuture<bool> cetus = QtConcurrent::run([this, &urls]() {
        return refreshFallbackPart(urls.fallbackCetus, CETUS_FILE,
            [this](const std::string& json) {
                m_state.setCetusCycle(m_fallbackParser.parseCetusCycle(json), DataSource::Fallback);
            });
    });

    QFuture<bool> invasions = QtConcurrent::run([this, &urls]() {
        return refreshFallbackPart(urls.fallbackInvasions, INVASION_FILE,
            [this](const std::string& json) {
                m_state.setInvasions(m_fallbackParser.parseInvasions(json), DataSource::Fallback);
            });
    });

    int succeeded = 0;
    for (auto* future : {&fissures, &cetus, &invasions}) {
        future->waitForFinished();
        if (future->result()) {
            ++succeeded;
        }
    }

    spdlog::info("Fallback refresh: {} of 3 sources updated", succeeded);
    return succeeded;
}

bool RefreshScheduler::refreshFallbackPart(const std::string& url,
                                           const char* cacheFile,
                                           const std::function<void(const std::string&)>& store) {
    auto body = m_fetcher.fetch(QString::fromStdString(url));
    if (!body) {
        spdlog::warn("Fallback fetch failed: {}", url);
        return false;
    }

    try {
        store(body->toStdString());
    } catch (const ParseError& e) {
        spdlog::warn("Bad fallback document from {}: {}", url, e.what());
        return false;
    }

    writeDataFile(dataFile(cacheFile), *body);
    m_inbox.post(SchedulerMessage::Kind::Updated);
    return true;
}

// ============ Notifications ============

void RefreshScheduler::playNotifications(TimePoint now) {
    auto hits = evaluateTriggers(m_state.snapshot(), now);
    if (hits.empty()) {
        return;
    }

    auto maxHistory = m_settings.maxNotificationHistory;
    for (const auto& hit : hits) {
        spdlog::info("Notification: {} spotted", triggerName(hit.kind).toStdString());
        m_tasks.addFuture(QtConcurrent::run([this]() { m_player.play(); }));
    }

    m_state.updatePreferences([&hits, maxHistory](Preferences& p) {
        for (const auto& hit : hits) {
            p.recordNotification(hit.key, maxHistory);
        }
    });
    persistPreferences();
}

// ============ Helpers ============

void RefreshScheduler::releaseFinishedTasks() {
    const auto futures = m_tasks.futures();
    bool allFinished = std::all_of(futures.begin(), futures.end(),
                                   [](const QFuture<void>& f) { return f.isFinished(); });
    if (allFinished) {
        m_tasks.clearFutures();
    }
}

void RefreshScheduler::persistPreferences() {
    if (!m_state.persistPreferences(m_settings.preferencesPath)) {
        m_state.recordError("Cannot write preferences file");
    }
}

void RefreshScheduler::recordFailure(const QString& message) {
    spdlog::warn("{}", message.toStdString());
    m_state.recordError(message);
}

std::filesystem::path RefreshScheduler::dataFile(const char* name) const {
    return m_settings.dataDirectory / name;
}

} // namespace voidrat
