/**
 * Voidrat - World Tracker
 *
 * Owns the shared state and the background refresh loop, and is the
 * only entry point the presentation layer needs.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <memory>

#include <QObject>

#include "SharedState.hpp"
#include "config/AppConfig.hpp"

namespace voidrat {

class HttpFetcher;
class NotificationPlayer;

/**
 * Background world data tracker
 *
 * The refresh loop runs on its own thread; snapshot() may be called from
 * any thread at any time.
 */
class WorldTracker : public QObject {
    Q_OBJECT

public:
    /**
     * Tracker using the network fetcher and the command sound player
     * described by `config`
     */
    WorldTracker(const AppConfig& config,
                 Preferences preferences,
                 const std::filesystem::path& soundFile,
                 QObject* parent = nullptr);

    /**
     * Tracker with injected capabilities
     */
    WorldTracker(const AppConfig& config,
                 Preferences preferences,
                 std::unique_ptr<HttpFetcher> fetcher,
                 std::unique_ptr<NotificationPlayer> player,
                 QObject* parent = nullptr);

    ~WorldTracker() override;

    /**
     * Start the refresh loop thread
     */
    void start();

    /**
     * Stop the loop and wait for in-flight work
     */
    void stop();

    bool isRunning() const;

    WorldSnapshot snapshot() const;

    /**
     * Change both notification toggles and persist them
     *
     * @return false if the preferences file could not be written
     */
    bool saveNotificationToggles(bool voidCapture, bool epicInvasion);

    /**
     * Play the notification sound once, off the calling thread
     */
    void playTestSound();

signals:
    void initialized();
    void updated();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace voidrat
