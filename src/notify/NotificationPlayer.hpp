/**
 * Voidrat - Notification Player
 *
 * Plays the notification sound when a watched event shows up.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

namespace voidrat {

/**
 * Sound playback capability
 *
 * play() blocks the calling thread until the sound has finished.
 */
class NotificationPlayer {
public:
    virtual ~NotificationPlayer() = default;

    virtual void play() = 0;
};

/**
 * Plays a sound file through an external command (e.g. `aplay -q file.wav`)
 */
class CommandSoundPlayer : public NotificationPlayer {
public:
    CommandSoundPlayer(const std::string& command,
                       const std::vector<std::string>& arguments,
                       const std::filesystem::path& soundFile);

    void play() override;

    /**
     * Copy the bundled notification sound into `directory`
     *
     * @return Path of the copy, std::nullopt if it could not be written
     */
    static std::optional<std::filesystem::path> extractBundledSound(
        const std::filesystem::path& directory);

private:
    QString m_command;
    QStringList m_arguments;
};

} // namespace voidrat
