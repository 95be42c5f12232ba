/**
 * Voidrat - HTTP Fetcher Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "HttpFetcher.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <spdlog/spdlog.h>

namespace voidrat {

QtHttpFetcher::QtHttpFetcher(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

std::optional<QByteArray> QtHttpFetcher::fetch(const QString& url) const {
    spdlog::debug("Fetching {}", url.toStdString());

    QNetworkAccessManager manager;
    QNetworkRequest request{QUrl(url)};
    request.setHeader(QNetworkRequest::UserAgentHeader, "Voidrat/1.0");

    QEventLoop loop;
    QNetworkReply* reply = manager.get(request);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(m_timeoutMs);

    loop.exec();

    if (!timer.isActive()) {
        spdlog::warn("Request to {} timed out after {} ms", url.toStdString(), m_timeoutMs);
        reply->abort();
        reply->deleteLater();
        return std::nullopt;
    }
    timer.stop();

    if (reply->error() != QNetworkReply::NoError) {
        spdlog::warn("Request to {} failed: {}",
                     url.toStdString(), reply->errorString().toStdString());
        reply->deleteLater();
        return std::nullopt;
    }

    int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status < 200 || status >= 300) {
        spdlog::warn("Request to {} returned HTTP {}", url.toStdString(), status);
        reply->deleteLater();
        return std::nullopt;
    }

    QByteArray body = reply->readAll();
    reply->deleteLater();

    spdlog::debug("Fetched {} bytes from {}", body.size(), url.toStdString());
    return body;
}

} // namespace voidrat
