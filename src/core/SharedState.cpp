/**
 * Voidrat - Shared State Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SharedState.hpp"

namespace voidrat {

QString dataSourceName(DataSource source) {
    switch (source) {
        case DataSource::Cache: return "cache";
        case DataSource::WorldState: return "world state";
        case DataSource::Fallback: return "fallback";
        default: return "none";
    }
}

SharedState::SharedState(Preferences preferences) {
    m_snapshot.preferences = std::move(preferences);
}

WorldSnapshot SharedState::snapshot() const {
    QReadLocker locker(&m_lock);
    return m_snapshot;
}

bool SharedState::isInitialized() const {
    QReadLocker locker(&m_lock);
    return m_snapshot.initialized;
}

Preferences SharedState::preferences() const {
    QReadLocker locker(&m_lock);
    return m_snapshot.preferences;
}

void SharedState::setInitialized() {
    QWriteLocker locker(&m_lock);
    m_snapshot.initialized = true;
}

void SharedState::replaceWorld(std::vector<Fissure> fissures,
                               CetusCycle cetusCycle,
                               std::vector<Invasion> invasions,
                               DataSource source) {
    QWriteLocker locker(&m_lock);
    m_snapshot.fissures = std::move(fissures);
    m_snapshot.cetusCycle = cetusCycle;
    m_snapshot.invasions = std::move(invasions);
    m_snapshot.status.source = source;
}

void SharedState::setFissures(std::vector<Fissure> fissures, DataSource source) {
    QWriteLocker locker(&m_lock);
    m_snapshot.fissures = std::move(fissures);
    m_snapshot.status.source = source;
}

void SharedState::setCetusCycle(CetusCycle cetusCycle, DataSource source) {
    QWriteLocker locker(&m_lock);
    m_snapshot.cetusCycle = cetusCycle;
    m_snapshot.status.source = source;
}

void SharedState::setInvasions(std::vector<Invasion> invasions, DataSource source) {
    QWriteLocker locker(&m_lock);
    m_snapshot.invasions = std::move(invasions);
    m_snapshot.status.source = source;
}

bool SharedState::persistPreferences(const std::filesystem::path& path) {
    QWriteLocker locker(&m_lock);
    return m_snapshot.preferences.persist(path);
}

void SharedState::recordSuccess(TimePoint when) {
    QWriteLocker locker(&m_lock);
    m_snapshot.status.lastSuccess = when;
    m_snapshot.status.lastError.clear();
}

void SharedState::recordError(const QString& message) {
    QWriteLocker locker(&m_lock);
    m_snapshot.status.lastError = message;
}

} // namespace voidrat
