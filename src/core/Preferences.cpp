/**
 * Voidrat - Persistent Preferences Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Preferences.hpp"

#include <algorithm>
#include <optional>

#include <QDataStream>
#include <QFile>

#include <spdlog/spdlog.h>

namespace voidrat {

namespace {
    constexpr quint32 STORAGE_MAGIC = 0x56524154;  // "VRAT"
    constexpr quint16 STORAGE_VERSION = 1;
    constexpr quint32 MAX_HISTORY_ON_DISK = 1000000;

std::optional<Preferences> decode(QDataStream& in) {
    quint32 magic = 0;
    quint16 version = 0;
    in >> magic >> version;
    if (in.status() != QDataStream::Ok || magic != STORAGE_MAGIC) {
        return std::nullopt;
    }
    if (version != STORAGE_VERSION) {
        spdlog::error("Unsupported preferences version: {}", version);
        return std::nullopt;
    }

    Preferences prefs;
    qint64 cooldown = 0;
    qint64 lastUpdate = 0;
    quint32 count = 0;
    in >> cooldown >> lastUpdate >> prefs.notifyVoidCapture >> prefs.notifyEpicInvasion >> count;
    if (in.status() != QDataStream::Ok || count > MAX_HISTORY_ON_DISK) {
        return std::nullopt;
    }

    prefs.updateCooldown = cooldown;
    prefs.lastUpdate = lastUpdate;
    prefs.notified.reserve(count);
    for (quint32 i = 0; i < count; ++i) {
        qint64 timestamp = 0;
        in >> timestamp;
        prefs.notified.push_back(timestamp);
    }

    if (in.status() != QDataStream::Ok || !in.atEnd()) {
        return std::nullopt;
    }
    return prefs;
}

} // anonymous namespace

Preferences Preferences::load(const std::filesystem::path& path) {
    QString filePath = QString::fromStdString(path.string());
    QFile file(filePath);

    if (!file.exists()) {
        spdlog::info("No preferences at {}, creating defaults", path.string());
        Preferences defaults;
        if (!defaults.persist(path)) {
            throw PreferencesError("Cannot create preferences file: " + path.string());
        }
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw PreferencesError("Cannot open preferences file: " + path.string());
    }

    QDataStream in(&file);
    in.setVersion(QDataStream::Qt_6_0);

    auto prefs = decode(in);
    if (!prefs) {
        throw PreferencesError("Cannot decode preferences file: " + path.string());
    }

    spdlog::debug("Loaded preferences: cooldown={}s lastUpdate={} notified={}",
                  prefs->updateCooldown, prefs->lastUpdate, prefs->notified.size());
    return *prefs;
}

bool Preferences::persist(const std::filesystem::path& path) const {
    QFile file(QString::fromStdString(path.string()));
    // Full overwrite, no atomic rename
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        spdlog::error("Failed to open preferences for writing: {}",
                      file.errorString().toStdString());
        return false;
    }

    QDataStream out(&file);
    out.setVersion(QDataStream::Qt_6_0);
    out << STORAGE_MAGIC << STORAGE_VERSION
        << static_cast<qint64>(updateCooldown)
        << static_cast<qint64>(lastUpdate)
        << notifyVoidCapture
        << notifyEpicInvasion
        << static_cast<quint32>(notified.size());
    for (auto timestamp : notified) {
        out << static_cast<qint64>(timestamp);
    }

    if (out.status() != QDataStream::Ok) {
        spdlog::error("Failed to write preferences to {}", path.string());
        return false;
    }

    spdlog::debug("Preferences written to {}", path.string());
    return true;
}

bool Preferences::wasNotified(std::int64_t key) const {
    return std::find(notified.begin(), notified.end(), key) != notified.end();
}

void Preferences::recordNotification(std::int64_t key, size_t maxHistory) {
    if (wasNotified(key)) {
        return;
    }
    notified.push_back(key);
    if (maxHistory > 0 && notified.size() > maxHistory) {
        notified.erase(notified.begin(),
                       notified.begin() + static_cast<std::ptrdiff_t>(notified.size() - maxHistory));
    }
}

} // namespace voidrat
