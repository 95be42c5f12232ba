/**
 * Voidrat - Notification Player Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "NotificationPlayer.hpp"

#include <QFile>
#include <QProcess>

#include <spdlog/spdlog.h>

namespace voidrat {

namespace {
    constexpr const char* BUNDLED_SOUND = ":/audio/notification.wav";
    constexpr const char* SOUND_FILE_NAME = "notification.wav";
    constexpr int PLAYBACK_TIMEOUT_MS = 5000;
}

CommandSoundPlayer::CommandSoundPlayer(const std::string& command,
                                       const std::vector<std::string>& arguments,
                                       const std::filesystem::path& soundFile)
    : m_command(QString::fromStdString(command))
{
    for (const auto& arg : arguments) {
        m_arguments << QString::fromStdString(arg);
    }
    m_arguments << QString::fromStdString(soundFile.string());
}

void CommandSoundPlayer::play() {
    QProcess process;
    process.start(m_command, m_arguments);

    if (!process.waitForStarted()) {
        spdlog::warn("Cannot start sound command '{}': {}",
                     m_command.toStdString(), process.errorString().toStdString());
        return;
    }

    if (!process.waitForFinished(PLAYBACK_TIMEOUT_MS)) {
        spdlog::warn("Notification sound did not finish, stopping it");
        process.kill();
        process.waitForFinished();
        return;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        spdlog::warn("Sound command failed: {}",
                     process.readAllStandardError().trimmed().toStdString());
        return;
    }

    spdlog::debug("Notification sound played");
}

std::optional<std::filesystem::path> CommandSoundPlayer::extractBundledSound(
    const std::filesystem::path& directory) {
    auto target = directory / SOUND_FILE_NAME;
    if (std::filesystem::exists(target)) {
        return target;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", directory.string(), ec.message());
        return std::nullopt;
    }

    if (!QFile::copy(BUNDLED_SOUND, QString::fromStdString(target.string()))) {
        spdlog::error("Cannot extract notification sound to {}", target.string());
        return std::nullopt;
    }

    // Resource copies are read-only
    QFile::setPermissions(QString::fromStdString(target.string()),
                          QFile::ReadOwner | QFile::WriteOwner | QFile::ReadGroup | QFile::ReadOther);
    return target;
}

} // namespace voidrat
