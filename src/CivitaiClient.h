#pragma once

#include <QAtomicInt>
#include <QByteArray>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QUrl>

#include "MetadataProvider.h"
#include "ScannerSettings.h"

/**
 * @brief Civitai catalog client with rate limiting and retry with backoff.
 *
 * Every outbound request waits until at least the configured delay has passed
 * since the previous one. Throttled (429), server (5xx) and timed-out requests
 * are retried with exponential backoff. Waits observe the request's
 * cancellation check.
 */
class CivitaiClient : public MetadataProvider
{
public:
    struct HttpResponse {
        int status = 0;
        QByteArray body;
        bool timedOut = false;
        QString error;
    };

    explicit CivitaiClient(const ScannerSettings &settings);

    MetadataFetchResult fetch(const MetadataFetchRequest &request) override;

    int requestCount() const;

protected:
    virtual HttpResponse sendGet(const QUrl &url, const QMap<QByteArray, QByteArray> &headers, int timeoutMs);
    virtual void sleepMs(int ms);

private:
    enum class CallOutcome {
        Ok,
        NotFound,
        Failed,
        Cancelled
    };

    CallOutcome getJson(const QString &path,
                        const MetadataFetchRequest &request,
                        QJsonObject *response,
                        int *httpStatus,
                        QString *error);
    bool waitForRequestSlot(const MetadataFetchRequest &request);
    bool waitCancellable(qint64 ms, const MetadataFetchRequest &request);
    QMap<QByteArray, QByteArray> requestHeaders() const;
    static bool isRetryable(const HttpResponse &response);

    QString m_baseUrl;
    QString m_apiKey;
    QMap<QString, QString> m_extraHeaders;
    int m_timeoutMs = 30000;
    int m_delayMs = 2000;
    int m_maxRetries = 3;
    int m_backoffBaseMs = 5000;

    QMutex m_mutex;
    QElapsedTimer m_lastRequest;
    QAtomicInt m_requestCount = 0;
};
