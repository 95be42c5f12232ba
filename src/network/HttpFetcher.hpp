/**
 * Voidrat - HTTP Fetcher
 *
 * Blocking HTTP GET used by the refresh tasks.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>

#include <QByteArray>
#include <QString>

namespace voidrat {

/**
 * Blocking GET capability
 *
 * Implementations must be callable from several worker threads at once.
 * Failures never throw: a transport error, a timeout or a non-success
 * status all yield std::nullopt.
 */
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;

    virtual std::optional<QByteArray> fetch(const QString& url) const = 0;
};

/**
 * QNetworkAccessManager based fetcher
 *
 * Runs a private event loop on the calling thread for the duration of
 * the request, so it must be called from a worker thread.
 */
class QtHttpFetcher : public HttpFetcher {
public:
    explicit QtHttpFetcher(int timeoutMs = 8000);

    std::optional<QByteArray> fetch(const QString& url) const override;

    int timeout() const { return m_timeoutMs; }

private:
    int m_timeoutMs;
};

} // namespace voidrat
