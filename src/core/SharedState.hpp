/**
 * Voidrat - Shared State
 *
 * The single live copy of world data and preferences, shared between
 * the refresh scheduler (writer) and the presentation layer (reader).
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include <QReadWriteLock>
#include <QString>

#include "Preferences.hpp"
#include "model/WorldData.hpp"

namespace voidrat {

/**
 * Where the current world data came from
 */
enum class DataSource {
    None,
    Cache,          // Local files at start-up
    WorldState,     // Primary endpoint
    Fallback        // Aggregator endpoints
};

QString dataSourceName(DataSource source);

/**
 * Outcome of the most recent refresh attempts
 */
struct RefreshStatus {
    DataSource source = DataSource::None;
    std::optional<TimePoint> lastSuccess;
    QString lastError;                      // Empty after a success
};

/**
 * Copy of everything the presentation layer may show
 */
struct WorldSnapshot {
    bool initialized = false;
    std::vector<Fissure> fissures;
    CetusCycle cetusCycle;
    std::vector<Invasion> invasions;
    Preferences preferences;
    RefreshStatus status;
};

/**
 * Read/write locked snapshot holder
 *
 * Any number of concurrent readers or one writer. Each write method
 * takes the lock once, so readers see either the old or the new group
 * of fields, never a mix.
 */
class SharedState {
public:
    explicit SharedState(Preferences preferences);

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    WorldSnapshot snapshot() const;
    bool isInitialized() const;
    Preferences preferences() const;

    void setInitialized();

    /**
     * Replace all three entity lists at once
     */
    void replaceWorld(std::vector<Fissure> fissures,
                      CetusCycle cetusCycle,
                      std::vector<Invasion> invasions,
                      DataSource source);

    void setFissures(std::vector<Fissure> fissures, DataSource source);
    void setCetusCycle(CetusCycle cetusCycle, DataSource source);
    void setInvasions(std::vector<Invasion> invasions, DataSource source);

    /**
     * Apply `fn` to the live preferences under the write lock
     *
     * @return Copy of the preferences after the change
     */
    template<typename Fn>
    Preferences updatePreferences(Fn&& fn) {
        QWriteLocker locker(&m_lock);
        fn(m_snapshot.preferences);
        return m_snapshot.preferences;
    }

    /**
     * Write the live preferences to `path`
     *
     * Holds the write lock for the duration of the write, so concurrent
     * callers never let an older copy overwrite a newer one.
     */
    bool persistPreferences(const std::filesystem::path& path);

    void recordSuccess(TimePoint when);
    void recordError(const QString& message);

private:
    mutable QReadWriteLock m_lock;
    WorldSnapshot m_snapshot;
};

} // namespace voidrat
