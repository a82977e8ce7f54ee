
/************************************************************************\

    Modelman - Model library manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "CivitaiClient.h"

#include <QCoreApplication>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QThread>
#include <QTimer>

#include <algorithm>

#include "CivitaiResponseParser.h"
#include "ModelmanLogging.h"

namespace {
struct CivitaiConstants {
    static constexpr int waitSliceMs = 25;
    static constexpr int httpOk = 200;
    static constexpr int httpNotFound = 404;
    static constexpr int httpTooManyRequests = 429;
    static constexpr int httpServerError = 500;
};
} // namespace

/**
 * @brief Builds a client from the provider section of the settings.
 * @param settings Scanner settings holding base URL, credentials and limits.
 */
CivitaiClient::CivitaiClient(const ScannerSettings &settings)
    : m_baseUrl(settings.providerBaseUrl)
    , m_apiKey(settings.providerApiKey)
    , m_extraHeaders(settings.providerHeaders)
    , m_timeoutMs(settings.requestTimeoutMs)
    , m_delayMs(settings.requestDelayMs)
    , m_maxRetries(settings.maxRetries)
    , m_backoffBaseMs(settings.backoffBaseMs)
{
    while (m_baseUrl.endsWith('/')) {
        m_baseUrl.chop(1);
    }
}

/**
 * @brief Looks a fingerprint up in the catalog and checks for a newer version.
 * @param request Fingerprint, optional known version id and cancellation check.
 * @return Found with enrichment, NotFound, NetworkError or Cancelled.
 */
MetadataFetchResult CivitaiClient::fetch(const MetadataFetchRequest &request)
{
    QMutexLocker locker(&m_mutex);
    MetadataFetchResult result;

    if (request.fingerprint.isEmpty()) {
        result.error = QCoreApplication::translate("CivitaiClient", "Missing fingerprint");
        return result;
    }

    QJsonObject version;
    QString error;
    int httpStatus = 0;
    CallOutcome outcome = getJson(QStringLiteral("/model-versions/by-hash/%1").arg(request.fingerprint),
                                  request, &version, &httpStatus, &error);

    if (outcome == CallOutcome::NotFound && !request.knownVersionId.isEmpty()) {
        qCDebug(lcProvider) << "Hash" << request.fingerprint << "unknown, retrying with version id" << request.knownVersionId;
        outcome = getJson(QStringLiteral("/model-versions/%1").arg(request.knownVersionId),
                          request, &version, &httpStatus, &error);
    }

    result.httpStatus = httpStatus;
    switch (outcome) {
    case CallOutcome::Cancelled:
        result.status = MetadataFetchResult::Status::Cancelled;
        return result;
    case CallOutcome::NotFound:
        result.status = MetadataFetchResult::Status::NotFound;
        qCInfo(lcProvider) << "No catalog entry for" << request.fingerprint;
        return result;
    case CallOutcome::Failed:
        result.status = MetadataFetchResult::Status::NetworkError;
        result.error = error;
        qCWarning(lcProvider) << "Lookup failed for" << request.fingerprint << error;
        return result;
    case CallOutcome::Ok:
        break;
    }

    result.status = MetadataFetchResult::Status::Found;
    result.enrichment = CivitaiResponseParser::enrichmentFromVersion(version);

    const QString modelId = CivitaiResponseParser::idToString(version.value("modelId"));
    const QString versionId = CivitaiResponseParser::idToString(version.value("id"));
    if (!modelId.isEmpty() && !versionId.isEmpty()) {
        QJsonObject model;
        QString updateError;
        int updateStatus = 0;
        const CallOutcome updateOutcome = getJson(QStringLiteral("/models/%1").arg(modelId),
                                                  request, &model, &updateStatus, &updateError);
        if (updateOutcome == CallOutcome::Ok) {
            const QString latest = CivitaiResponseParser::latestVersionId(model);
            result.updateAvailable = !latest.isEmpty() && latest != versionId;
        } else if (updateOutcome == CallOutcome::Failed) {
            qCWarning(lcProvider) << "Update check failed for model" << modelId << updateError;
        }
    }
    qCInfo(lcProvider) << "Retrieved catalog entry for" << request.fingerprint
                       << (result.updateAvailable ? "(update available)" : "");
    return result;
}

int CivitaiClient::requestCount() const
{
    return m_requestCount.loadRelaxed();
}

/**
 * @brief Performs a rate-limited GET with retries and parses the JSON object body.
 * @param path Path below the base URL.
 * @param request Fetch request supplying the cancellation check.
 * @param response Output object on success.
 * @param httpStatus Output status of the last attempt.
 * @param error Output error message on failure.
 * @return Outcome of the call.
 */
CivitaiClient::CallOutcome CivitaiClient::getJson(const QString &path,
                                                  const MetadataFetchRequest &request,
                                                  QJsonObject *response,
                                                  int *httpStatus,
                                                  QString *error)
{
    const QUrl url(m_baseUrl + path);
    const QMap<QByteArray, QByteArray> headers = requestHeaders();

    for (int attempt = 0; attempt <= m_maxRetries; ++attempt) {
        if (!waitForRequestSlot(request)) {
            return CallOutcome::Cancelled;
        }
        m_requestCount.fetchAndAddRelaxed(1);
        const HttpResponse reply = sendGet(url, headers, m_timeoutMs);
        *httpStatus = reply.status;

        if (reply.status == CivitaiConstants::httpOk) {
            QString parseError;
            *response = CivitaiResponseParser::parseObject(reply.body, &parseError);
            if (!parseError.isEmpty()) {
                *error = parseError;
                return CallOutcome::Failed;
            }
            return CallOutcome::Ok;
        }
        if (reply.status == CivitaiConstants::httpNotFound) {
            return CallOutcome::NotFound;
        }

        *error = reply.timedOut
            ? QCoreApplication::translate("CivitaiClient", "HTTP timeout")
            : (reply.status > 0
                   ? QStringLiteral("HTTP %1 %2").arg(reply.status).arg(reply.error).trimmed()
                   : QStringLiteral("HTTP error: %1").arg(reply.error));

        if (!isRetryable(reply) || attempt == m_maxRetries) {
            return CallOutcome::Failed;
        }
        const qint64 backoff = static_cast<qint64>(m_backoffBaseMs) << attempt;
        qCInfo(lcProvider) << *error << "for" << url.toString() << "- retrying in" << backoff << "ms";
        if (!waitCancellable(backoff, request)) {
            return CallOutcome::Cancelled;
        }
    }
    return CallOutcome::Failed;
}

/**
 * @brief Sleeps until the configured delay since the previous request has elapsed.
 * @param request Fetch request supplying the cancellation check.
 * @return False when cancelled while waiting.
 */
bool CivitaiClient::waitForRequestSlot(const MetadataFetchRequest &request)
{
    if (m_lastRequest.isValid()) {
        const qint64 remaining = m_delayMs - m_lastRequest.elapsed();
        if (remaining > 0 && !waitCancellable(remaining, request)) {
            return false;
        }
    }
    if (request.isCancelled && request.isCancelled()) {
        return false;
    }
    m_lastRequest.start();
    return true;
}

bool CivitaiClient::waitCancellable(qint64 ms, const MetadataFetchRequest &request)
{
    QElapsedTimer timer;
    timer.start();
    while (true) {
        if (request.isCancelled && request.isCancelled()) {
            return false;
        }
        const qint64 remaining = ms - timer.elapsed();
        if (remaining <= 0) {
            return true;
        }
        sleepMs(static_cast<int>(std::min<qint64>(remaining, CivitaiConstants::waitSliceMs)));
    }
}

QMap<QByteArray, QByteArray> CivitaiClient::requestHeaders() const
{
    QMap<QByteArray, QByteArray> headers;
    headers.insert("Accept", "application/json");
    headers.insert("User-Agent", "Modelman/1.0");
    if (!m_apiKey.isEmpty()) {
        headers.insert("Authorization", "Bearer " + m_apiKey.toUtf8());
    }
    for (auto it = m_extraHeaders.constBegin(); it != m_extraHeaders.constEnd(); ++it) {
        headers.insert(it.key().toUtf8(), it.value().toUtf8());
    }
    return headers;
}

bool CivitaiClient::isRetryable(const HttpResponse &response)
{
    if (response.timedOut) {
        return true;
    }
    return response.status == CivitaiConstants::httpTooManyRequests
        || response.status >= CivitaiConstants::httpServerError
        || response.status == 0;
}

/**
 * @brief Performs a blocking HTTP GET on the calling thread.
 * @param url Target URL.
 * @param headers Raw request headers.
 * @param timeoutMs Timeout in milliseconds for the request.
 * @return Status, body and error of the reply.
 */
CivitaiClient::HttpResponse CivitaiClient::sendGet(const QUrl &url,
                                                   const QMap<QByteArray, QByteArray> &headers,
                                                   int timeoutMs)
{
    QNetworkAccessManager manager;
    QNetworkRequest request{url};
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        request.setRawHeader(it.key(), it.value());
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    QNetworkReply *reply = manager.get(request);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    loop.exec();

    HttpResponse response;
    if (!reply->isFinished()) {
        reply->abort();
        response.timedOut = true;
        response.error = QStringLiteral("timeout");
    } else {
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        response.status = status.isValid() ? status.toInt() : 0;
        response.body = reply->readAll();
        if (reply->error() != QNetworkReply::NoError) {
            response.error = reply->errorString();
        }
    }

    reply->deleteLater();
    return response;
}

void CivitaiClient::sleepMs(int ms)
{
    QThread::msleep(static_cast<unsigned long>(ms));
}
