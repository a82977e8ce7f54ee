
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

// =============================================================================
// Unit tests for CivitaiClient and CivitaiResponseParser
// The transport hook is overridden; no network access happens here.
// =============================================================================
#include <gtest/gtest.h>

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrl>

#include <atomic>
#include <functional>

#include "CivitaiClient.h"
#include "CivitaiResponseParser.h"
#include "ScannerSettings.h"

namespace {
const char versionBody[] = R"({
    "id": 100,
    "modelId": 10,
    "name": "v1.0",
    "baseModel": "SDXL 1.0",
    "trainedWords": ["detailed"],
    "model": {"name": "Detail Tweaker", "type": "LORA", "nsfw": false, "poi": false},
    "files": [{"hashes": {"AutoV2": "ABCDEF0123", "SHA256": "ABCDEF0123456789"}}],
    "images": [{"url": "https://img/1.png", "nsfwLevel": 1, "width": 512, "height": 768}, {"width": 1}]
})";

const char modelBodyWithNewerVersion[] = R"({
    "id": 10,
    "modelVersions": [
        {"id": 101, "status": "Published", "availability": "Public", "createdAt": "2026-02-01T00:00:00.000Z"},
        {"id": 100, "status": "Published", "availability": "Public", "createdAt": "2026-01-01T00:00:00.000Z"}
    ]
})";

const char modelBodyCurrent[] = R"({
    "id": 10,
    "modelVersions": [
        {"id": 102, "status": "Draft", "availability": "Public", "createdAt": "2026-03-01T00:00:00.000Z"},
        {"id": 100, "status": "Published", "availability": "Public", "createdAt": "2026-01-01T00:00:00.000Z"}
    ]
})";

CivitaiClient::HttpResponse reply(int status, const QByteArray &body = QByteArray())
{
    CivitaiClient::HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

CivitaiClient::HttpResponse timeoutReply()
{
    CivitaiClient::HttpResponse response;
    response.timedOut = true;
    response.error = QStringLiteral("timeout");
    return response;
}

ScannerSettings fastSettings()
{
    ScannerSettings settings;
    settings.providerBaseUrl = QStringLiteral("https://catalog.test/api/v1/");
    settings.requestDelayMs = 0;
    settings.backoffBaseMs = 1;
    settings.maxRetries = 3;
    return settings;
}

class ScriptedCivitaiClient : public CivitaiClient {
public:
    using Responder = std::function<HttpResponse(const QUrl &)>;

    ScriptedCivitaiClient(const ScannerSettings &settings, Responder responder)
        : CivitaiClient(settings)
        , m_responder(std::move(responder))
    {
        m_clock.start();
    }

    QList<QUrl> urls;
    QList<qint64> callTimes;
    QMap<QByteArray, QByteArray> lastHeaders;

protected:
    HttpResponse sendGet(const QUrl &url, const QMap<QByteArray, QByteArray> &headers, int) override {
        urls.append(url);
        callTimes.append(m_clock.elapsed());
        lastHeaders = headers;
        return m_responder(url);
    }

private:
    Responder m_responder;
    QElapsedTimer m_clock;
};

MetadataFetchRequest requestFor(const QString &fingerprint, const QString &knownVersionId = QString())
{
    MetadataFetchRequest request;
    request.fingerprint = fingerprint;
    request.knownVersionId = knownVersionId;
    return request;
}
}

// ---------------------------------------------------------------------------
// Found, with update check
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, FoundWithNewerVersionFlagsUpdate) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &url) {
        if (url.path().endsWith("/model-versions/by-hash/abcdef0123")) {
            return reply(200, versionBody);
        }
        if (url.path().endsWith("/models/10")) {
            return reply(200, modelBodyWithNewerVersion);
        }
        return reply(404);
    });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    ASSERT_EQ(result.status, MetadataFetchResult::Status::Found);
    EXPECT_TRUE(result.updateAvailable);
    EXPECT_EQ(result.enrichment.value("name").toString(), "v1.0");
    EXPECT_EQ(result.enrichment.value("baseModel").toString(), "SDXL 1.0");
    EXPECT_EQ(result.enrichment.value("model").toObject().value("name").toString(), "Detail Tweaker");
    EXPECT_EQ(result.enrichment.value("hashes").toObject().value("AutoV2").toString(), "ABCDEF0123");
    EXPECT_EQ(result.enrichment.value("images").toArray().size(), 1);
    ASSERT_EQ(client.urls.size(), 2);
    EXPECT_EQ(client.urls.at(0).toString(), "https://catalog.test/api/v1/model-versions/by-hash/abcdef0123");
    EXPECT_EQ(client.urls.at(1).toString(), "https://catalog.test/api/v1/models/10");
    EXPECT_EQ(client.requestCount(), 2);
}

TEST(CivitaiClientTest, UnpublishedVersionsDoNotCountAsUpdates) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &url) {
        if (url.path().contains("/model-versions/by-hash/")) {
            return reply(200, versionBody);
        }
        return reply(200, modelBodyCurrent);
    });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    ASSERT_EQ(result.status, MetadataFetchResult::Status::Found);
    EXPECT_FALSE(result.updateAvailable);
}

TEST(CivitaiClientTest, FailedUpdateCheckKeepsResult) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &url) {
        if (url.path().contains("/model-versions/by-hash/")) {
            return reply(200, versionBody);
        }
        return reply(400);
    });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::Found);
    EXPECT_FALSE(result.updateAvailable);
}

// ---------------------------------------------------------------------------
// Not found and version id fallback
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, NotFoundWithoutFallback) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &) { return reply(404); });

    const MetadataFetchResult result = client.fetch(requestFor("0000000000"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::NotFound);
    EXPECT_EQ(result.httpStatus, 404);
    EXPECT_EQ(client.urls.size(), 1);
}

TEST(CivitaiClientTest, FallsBackToKnownVersionId) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &url) {
        if (url.path().endsWith("/model-versions/100")) {
            return reply(200, versionBody);
        }
        if (url.path().endsWith("/models/10")) {
            return reply(200, modelBodyCurrent);
        }
        return reply(404);
    });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123", "100"));
    ASSERT_EQ(result.status, MetadataFetchResult::Status::Found);
    ASSERT_GE(client.urls.size(), 2);
    EXPECT_TRUE(client.urls.at(1).path().endsWith("/model-versions/100"));
}

// ---------------------------------------------------------------------------
// Retries
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, RetriesThrottledAndServerErrors) {
    int calls = 0;
    ScriptedCivitaiClient client(fastSettings(), [&calls](const QUrl &url) {
        if (url.path().contains("/models/")) {
            return reply(200, modelBodyCurrent);
        }
        calls += 1;
        if (calls == 1) {
            return reply(429);
        }
        if (calls == 2) {
            return reply(503);
        }
        if (calls == 3) {
            return timeoutReply();
        }
        return reply(200, versionBody);
    });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::Found);
    EXPECT_EQ(calls, 4);
}

TEST(CivitaiClientTest, ExhaustedRetriesGiveNetworkError) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &) { return reply(500); });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::NetworkError);
    EXPECT_EQ(result.httpStatus, 500);
    EXPECT_FALSE(result.error.isEmpty());
    EXPECT_EQ(client.urls.size(), 4);
}

TEST(CivitaiClientTest, ClientErrorsAreNotRetried) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &) { return reply(401); });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::NetworkError);
    EXPECT_EQ(client.urls.size(), 1);
}

TEST(CivitaiClientTest, InvalidJsonIsNetworkError) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &) { return reply(200, "<html>"); });

    const MetadataFetchResult result = client.fetch(requestFor("abcdef0123"));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::NetworkError);
    EXPECT_TRUE(result.error.contains("JSON"));
}

// ---------------------------------------------------------------------------
// Rate limiting
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, KeepsConfiguredDelayBetweenCalls) {
    ScannerSettings settings = fastSettings();
    settings.requestDelayMs = 60;
    ScriptedCivitaiClient client(settings, [](const QUrl &) { return reply(404); });

    client.fetch(requestFor("aaaaaaaaaa"));
    client.fetch(requestFor("bbbbbbbbbb"));
    client.fetch(requestFor("cccccccccc"));

    ASSERT_EQ(client.callTimes.size(), 3);
    for (int i = 1; i < client.callTimes.size(); ++i) {
        EXPECT_GE(client.callTimes.at(i) - client.callTimes.at(i - 1), settings.requestDelayMs - 1);
    }
}

// ---------------------------------------------------------------------------
// Cancellation during a wait
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, CancelledWaitSkipsTheCall) {
    ScannerSettings settings = fastSettings();
    settings.requestDelayMs = 10000;
    ScriptedCivitaiClient client(settings, [](const QUrl &) { return reply(404); });

    client.fetch(requestFor("aaaaaaaaaa"));

    std::atomic<int> checks{0};
    MetadataFetchRequest request = requestFor("bbbbbbbbbb");
    request.isCancelled = [&checks]() { return ++checks > 3; };

    QElapsedTimer timer;
    timer.start();
    const MetadataFetchResult result = client.fetch(request);
    EXPECT_EQ(result.status, MetadataFetchResult::Status::Cancelled);
    EXPECT_LT(timer.elapsed(), 5000);
    EXPECT_EQ(client.urls.size(), 1);
}

// ---------------------------------------------------------------------------
// Headers
// ---------------------------------------------------------------------------
TEST(CivitaiClientTest, SendsApiKeyAndPassthroughHeaders) {
    ScannerSettings settings = fastSettings();
    settings.providerApiKey = QStringLiteral("secret");
    settings.providerHeaders.insert("X-Client", "modelman-tests");
    ScriptedCivitaiClient client(settings, [](const QUrl &) { return reply(404); });

    client.fetch(requestFor("aaaaaaaaaa"));
    EXPECT_EQ(client.lastHeaders.value("Authorization"), QByteArray("Bearer secret"));
    EXPECT_EQ(client.lastHeaders.value("X-Client"), QByteArray("modelman-tests"));
}

TEST(CivitaiClientTest, EmptyFingerprintIsRejectedWithoutCalls) {
    ScriptedCivitaiClient client(fastSettings(), [](const QUrl &) { return reply(404); });
    const MetadataFetchResult result = client.fetch(requestFor(QString()));
    EXPECT_EQ(result.status, MetadataFetchResult::Status::NetworkError);
    EXPECT_TRUE(client.urls.isEmpty());
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------
TEST(CivitaiResponseParserTest, LatestVersionFallsBackToFirstEntry) {
    const QJsonObject model = QJsonDocument::fromJson(R"({"modelVersions": [
        {"id": 7, "status": "Draft"}, {"id": 6, "status": "Draft"}]})").object();
    EXPECT_EQ(CivitaiResponseParser::latestVersionId(model), "7");
    EXPECT_TRUE(CivitaiResponseParser::latestVersionId(QJsonObject()).isEmpty());
}

TEST(CivitaiResponseParserTest, IdsAreStringified) {
    EXPECT_EQ(CivitaiResponseParser::idToString(QJsonValue(12345)), "12345");
    EXPECT_EQ(CivitaiResponseParser::idToString(QJsonValue(QStringLiteral("abc"))), "abc");
    EXPECT_TRUE(CivitaiResponseParser::idToString(QJsonValue()).isEmpty());
}

TEST(CivitaiResponseParserTest, RejectsNonObjectBodies) {
    QString error;
    EXPECT_TRUE(CivitaiResponseParser::parseObject("[1, 2]", &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
}
