
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
// Unit tests for ModelScanWorker: the per-file scan state machine
// The worker runs synchronously on the test thread; signals are direct.
// =============================================================================
#include <gtest/gtest.h>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>

#include <memory>

#include "FingerprintUtils.h"
#include "ModelCacheStore.h"
#include "ModelScanWorker.h"
#include "ScanSession.h"
#include "TestHelpers.h"

namespace {
class HookedScanWorker : public ModelScanWorker {
public:
    using ModelScanWorker::ModelScanWorker;

    QSet<QString> failingPaths;
    QStringList hashedPaths;

protected:
    FingerprintUtils::FingerprintResult fingerprintFile(const QString &path) override {
        hashedPaths.append(path);
        if (failingPaths.contains(path)) {
            FingerprintUtils::FingerprintResult result;
            result.error = QStringLiteral("%1: permission denied").arg(path);
            return result;
        }
        return ModelScanWorker::fingerprintFile(path);
    }
};
}

class ModelScanWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        root = TestHelpers::canonicalDir(dir.filePath("models/loras"));
        store = std::make_unique<ModelCacheStore>(dir.filePath("cache"));
        settings.requestDelayMs = 0;
        settings.checkpointInterval = 100;
    }

    QString addModel(const QString &name, const QByteArray &content) {
        return TestHelpers::writeFile(QDir(root).filePath(name), content);
    }

    QVariantMap runScan(bool force = false, bool includeCached = true) {
        ScanOptions options;
        options.roots = {root};
        options.force = force;
        options.includeCached = includeCached;
        HookedScanWorker worker(&session, store.get(), &provider, settings, options);
        worker.failingPaths = failing;
        QVariantMap result;
        QObject::connect(&worker, &ModelScanWorker::progress, [this](int current, int total) {
            progressEvents.append(qMakePair(current, total));
        });
        QObject::connect(&worker, &ModelScanWorker::finished, [&result](const QVariantMap &map) {
            result = map;
        });
        session.reset();
        worker.start();
        lastHashed = worker.hashedPaths;
        return result;
    }

    QTemporaryDir dir;
    QString root;
    std::unique_ptr<ModelCacheStore> store;
    ScannerSettings settings;
    FakeMetadataProvider provider;
    ScanSession session;
    QSet<QString> failing;
    QStringList lastHashed;
    QList<QPair<int, int>> progressEvents;
};

// ---------------------------------------------------------------------------
// Three files, one already cached: two lookups, completed, no errors
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, CachedFileIsNotLookedUpAgain) {
    const QString a = addModel("a.safetensors", "alpha");
    addModel("b.safetensors", "bravo");
    addModel("c.safetensors", "charlie");

    const QString fingerprint = FingerprintUtils::computeFileFingerprint(a).fingerprint;
    CacheEntry entry;
    entry.enrichment = TestHelpers::foundResult(fingerprint).enrichment;
    store->upsert(a, PathRecord::fromFile(fingerprint, QFileInfo(a)), entry);

    const QVariantMap result = runScan();
    const ScanProgress progress = session.snapshot();

    EXPECT_EQ(progress.status, ScanStatus::Completed);
    EXPECT_EQ(progress.total, 3);
    EXPECT_EQ(progress.current, 3);
    EXPECT_EQ(progress.errorCount, 0);
    EXPECT_FALSE(progress.active);
    EXPECT_EQ(provider.callCount(), 2);
    EXPECT_FALSE(provider.requests().contains(fingerprint));
    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_EQ(result.value("fetched").toInt(), 2);
}

// ---------------------------------------------------------------------------
// Repeated scans keep fingerprints and skip hashing
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, RepeatedScanIsIdempotent) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString b = addModel("sub/b.gguf", "bravo");

    runScan();
    const auto firstA = store->lookupByPath(a);
    const auto firstB = store->lookupByPath(b);
    ASSERT_TRUE(firstA.has_value());
    ASSERT_TRUE(firstB.has_value());
    EXPECT_EQ(lastHashed.size(), 2);
    EXPECT_EQ(provider.callCount(), 2);

    runScan();
    EXPECT_EQ(store->lookupByPath(a), firstA);
    EXPECT_EQ(store->lookupByPath(b), firstB);
    EXPECT_TRUE(lastHashed.isEmpty());
    EXPECT_EQ(provider.callCount(), 2);
    EXPECT_EQ(session.snapshot().status, ScanStatus::Completed);
}

TEST_F(ModelScanWorkerTest, ChangedFileIsHashedAgain) {
    const QString a = addModel("a.safetensors", "alpha");
    runScan();
    const auto before = store->lookupByPath(a);

    TestHelpers::writeFile(a, "alpha, retrained with more steps");
    runScan();

    EXPECT_EQ(lastHashed, QStringList({a}));
    EXPECT_NE(store->lookupByPath(a), before);
    EXPECT_EQ(provider.callCount(), 2);

    // The entry of the old content stays in the cache without a path.
    const QVector<CacheEntry> unreferenced = store->listUnreferencedEntries();
    ASSERT_EQ(unreferenced.size(), 1);
    EXPECT_EQ(unreferenced.first().fingerprint, *before);
    EXPECT_TRUE(unreferenced.first().hasEnrichment());
}

TEST_F(ModelScanWorkerTest, ForceRehashesEveryFile) {
    addModel("a.safetensors", "alpha");
    addModel("b.safetensors", "bravo");
    runScan();

    runScan(true, false);
    EXPECT_EQ(lastHashed.size(), 2);
    // Enriched entries are kept when cached entries are excluded.
    EXPECT_EQ(provider.callCount(), 2);

    runScan(true, true);
    EXPECT_EQ(provider.callCount(), 4);
}

// ---------------------------------------------------------------------------
// Blacklisted entries are only looked up on a forced refresh
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, BlacklistedEntryNeedsForce) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString fingerprint = FingerprintUtils::computeFileFingerprint(a).fingerprint;
    CacheEntry entry;
    entry.blacklisted = true;
    store->upsert(a, PathRecord::fromFile(fingerprint, QFileInfo(a)), entry);

    runScan(false);
    EXPECT_EQ(provider.callCount(), 0);

    runScan(true, true);
    EXPECT_EQ(provider.callCount(), 1);
    EXPECT_FALSE(store->lookupByFingerprint(fingerprint)->blacklisted);
}

TEST_F(ModelScanWorkerTest, BlacklistedEntryIsRefreshedOnForceWithoutCached) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString fingerprint = FingerprintUtils::computeFileFingerprint(a).fingerprint;
    CacheEntry entry;
    entry.blacklisted = true;
    store->upsert(a, PathRecord::fromFile(fingerprint, QFileInfo(a)), entry);

    runScan(true, false);
    EXPECT_EQ(provider.requests(), QStringList({fingerprint}));
    EXPECT_FALSE(store->lookupByFingerprint(fingerprint)->blacklisted);
}

// ---------------------------------------------------------------------------
// Changes made to an entry while its lookup is in flight are kept
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, UsageRecordedDuringLookupIsKept) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString fingerprint = FingerprintUtils::computeFileFingerprint(a).fingerprint;
    store->upsert(a, PathRecord::fromFile(fingerprint, QFileInfo(a)), CacheEntry());
    const QDateTime usedAt = QDateTime::currentDateTime().addSecs(-60);
    provider.setHandler([this, a, usedAt](const MetadataFetchRequest &request) {
        EXPECT_TRUE(store->touchByPath(a, usedAt));
        return TestHelpers::foundResult(request.fingerprint);
    });

    runScan();

    EXPECT_EQ(provider.callCount(), 1);
    const auto entry = store->lookupByFingerprint(fingerprint);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->hasEnrichment());
    ASSERT_TRUE(entry->lastUsedAt.isValid());
    EXPECT_EQ(entry->lastUsedAt.toMSecsSinceEpoch(), usedAt.toMSecsSinceEpoch());
}

TEST_F(ModelScanWorkerTest, BlacklistSetDuringLookupIsKept) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString fingerprint = FingerprintUtils::computeFileFingerprint(a).fingerprint;
    store->upsert(a, PathRecord::fromFile(fingerprint, QFileInfo(a)), CacheEntry());
    provider.setHandler([this](const MetadataFetchRequest &request) {
        EXPECT_TRUE(store->setBlacklisted(request.fingerprint, true));
        return TestHelpers::notFoundResult();
    });

    runScan();

    EXPECT_EQ(provider.callCount(), 1);
    const auto entry = store->lookupByFingerprint(fingerprint);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->blacklisted);
    EXPECT_EQ(entry->notFoundCount, 1);
}

TEST_F(ModelScanWorkerTest, NotFoundBlacklistsAtThreshold) {
    const QString a = addModel("a.safetensors", "alpha");
    settings.notFoundBlacklistThreshold = 2;
    provider.setHandler([](const MetadataFetchRequest &) { return TestHelpers::notFoundResult(); });

    runScan();
    const QString fingerprint = *store->lookupByPath(a);
    EXPECT_EQ(store->lookupByFingerprint(fingerprint)->notFoundCount, 1);
    EXPECT_FALSE(store->lookupByFingerprint(fingerprint)->blacklisted);
    EXPECT_EQ(session.snapshot().errorCount, 0);

    runScan();
    EXPECT_EQ(store->lookupByFingerprint(fingerprint)->notFoundCount, 2);
    EXPECT_TRUE(store->lookupByFingerprint(fingerprint)->blacklisted);

    runScan();
    EXPECT_EQ(provider.callCount(), 2);
}

// ---------------------------------------------------------------------------
// Consecutive network failures end the session in error
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, ConsecutiveNetworkFailuresAreFatal) {
    for (int i = 0; i < 6; ++i) {
        addModel(QStringLiteral("m%1.safetensors").arg(i), QByteArray("model ") + QByteArray::number(i));
    }
    settings.maxConsecutiveFailures = 3;
    provider.setHandler([](const MetadataFetchRequest &) { return TestHelpers::networkErrorResult(); });

    const QVariantMap result = runScan();
    const ScanProgress progress = session.snapshot();

    EXPECT_EQ(progress.status, ScanStatus::Error);
    EXPECT_EQ(progress.errorCount, 3);
    EXPECT_EQ(progress.current, 3);
    EXPECT_FALSE(progress.fatalError.isEmpty());
    EXPECT_EQ(provider.callCount(), 3);
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_EQ(result.value("status").toString(), "error");
}

TEST_F(ModelScanWorkerTest, SuccessResetsFailureCounter) {
    for (int i = 0; i < 4; ++i) {
        addModel(QStringLiteral("m%1.safetensors").arg(i), QByteArray("model ") + QByteArray::number(i));
    }
    settings.maxConsecutiveFailures = 2;
    int calls = 0;
    provider.setHandler([&calls](const MetadataFetchRequest &request) {
        calls += 1;
        return calls % 2 == 1 ? TestHelpers::networkErrorResult() : TestHelpers::foundResult(request.fingerprint);
    });

    runScan();
    const ScanProgress progress = session.snapshot();
    EXPECT_EQ(progress.status, ScanStatus::Completed);
    EXPECT_EQ(progress.errorCount, 2);
    EXPECT_EQ(progress.current, 4);
}

TEST_F(ModelScanWorkerTest, FailedLookupIsRetriedNextScan) {
    addModel("a.safetensors", "alpha");
    provider.setHandler([](const MetadataFetchRequest &) { return TestHelpers::networkErrorResult(); });
    runScan();
    EXPECT_EQ(session.snapshot().errorCount, 1);

    provider.setHandler(FakeMetadataProvider::Handler());
    runScan();
    EXPECT_EQ(provider.callCount(), 2);
    EXPECT_EQ(session.snapshot().errorCount, 0);
}

// ---------------------------------------------------------------------------
// Unreadable files count as errors and the scan continues
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, UnreadableFileIsCountedAndSkipped) {
    const QString a = addModel("a.safetensors", "alpha");
    const QString b = addModel("b.safetensors", "bravo");
    const QString c = addModel("c.safetensors", "charlie");
    failing.insert(b);

    runScan();
    const ScanProgress progress = session.snapshot();

    EXPECT_EQ(progress.status, ScanStatus::Completed);
    EXPECT_EQ(progress.errorCount, 1);
    EXPECT_EQ(progress.current, 3);
    EXPECT_TRUE(store->lookupByPath(a).has_value());
    EXPECT_FALSE(store->lookupByPath(b).has_value());
    EXPECT_TRUE(store->lookupByPath(c).has_value());
}

// ---------------------------------------------------------------------------
// Cancellation stops before the next file and keeps earlier writes
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, CancelKeepsEarlierWrites) {
    for (int i = 0; i < 5; ++i) {
        addModel(QStringLiteral("m%1.safetensors").arg(i), QByteArray("model ") + QByteArray::number(i));
    }
    int calls = 0;
    provider.setHandler([this, &calls](const MetadataFetchRequest &request) {
        calls += 1;
        if (calls == 2) {
            session.requestCancel();
        }
        return TestHelpers::foundResult(request.fingerprint);
    });

    const QVariantMap result = runScan();
    const ScanProgress progress = session.snapshot();

    EXPECT_EQ(progress.status, ScanStatus::Cancelled);
    EXPECT_EQ(progress.current, 2);
    EXPECT_EQ(provider.callCount(), 2);
    EXPECT_TRUE(result.value("cancelled").toBool());

    ModelCacheStore reloaded(store->directory());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.pathCount(), 2);
}

TEST_F(ModelScanWorkerTest, CancelledProviderCallEndsScan) {
    addModel("a.safetensors", "alpha");
    addModel("b.safetensors", "bravo");
    provider.setHandler([](const MetadataFetchRequest &) {
        MetadataFetchResult result;
        result.status = MetadataFetchResult::Status::Cancelled;
        return result;
    });

    runScan();
    EXPECT_EQ(session.snapshot().status, ScanStatus::Cancelled);
    EXPECT_EQ(session.snapshot().current, 0);
    EXPECT_EQ(provider.callCount(), 1);
}

// ---------------------------------------------------------------------------
// Progress is monotonic and bounded
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, ProgressIsMonotonic) {
    for (int i = 0; i < 7; ++i) {
        addModel(QStringLiteral("m%1.safetensors").arg(i), QByteArray("model ") + QByteArray::number(i));
    }
    runScan();

    ASSERT_FALSE(progressEvents.isEmpty());
    int previous = 0;
    for (const auto &event : progressEvents) {
        EXPECT_GE(event.first, previous);
        EXPECT_LE(event.first, event.second);
        EXPECT_EQ(event.second, 7);
        previous = event.first;
    }
    EXPECT_EQ(previous, 7);
}

// ---------------------------------------------------------------------------
// Empty walk, disabled provider, checkpoints
// ---------------------------------------------------------------------------
TEST_F(ModelScanWorkerTest, EmptyWalkEndsInError) {
    addModel("notes.txt", "not a model");
    const QVariantMap result = runScan();
    EXPECT_EQ(session.snapshot().status, ScanStatus::Error);
    EXPECT_EQ(session.snapshot().fatalError, "No model files found");
    EXPECT_FALSE(result.value("ok").toBool());
}

TEST_F(ModelScanWorkerTest, DisabledProviderOnlyFingerprints) {
    const QString a = addModel("a.safetensors", "alpha");
    settings.providerEnabled = false;

    runScan();
    EXPECT_EQ(provider.callCount(), 0);
    const auto fingerprint = store->lookupByPath(a);
    ASSERT_TRUE(fingerprint.has_value());
    ASSERT_TRUE(store->lookupByFingerprint(*fingerprint).has_value());
    EXPECT_FALSE(store->lookupByFingerprint(*fingerprint)->hasEnrichment());
    EXPECT_EQ(session.snapshot().status, ScanStatus::Completed);
}

TEST_F(ModelScanWorkerTest, CheckpointSavesDuringScan) {
    for (int i = 0; i < 3; ++i) {
        addModel(QStringLiteral("m%1.safetensors").arg(i), QByteArray("model ") + QByteArray::number(i));
    }
    settings.checkpointInterval = 2;
    bool savedBeforeThirdCall = false;
    int calls = 0;
    provider.setHandler([this, &calls, &savedBeforeThirdCall](const MetadataFetchRequest &request) {
        calls += 1;
        if (calls == 3) {
            ModelCacheStore onDisk(store->directory());
            savedBeforeThirdCall = onDisk.load() && onDisk.pathCount() == 2;
        }
        return TestHelpers::foundResult(request.fingerprint);
    });

    runScan();
    EXPECT_TRUE(savedBeforeThirdCall);
    EXPECT_FALSE(store->isDirty());
}

TEST(ModelScanWorkerFetchPolicyTest, DecidesWhenToFetch) {
    CacheEntry bare;
    CacheEntry enriched;
    enriched.enrichment.insert("name", QStringLiteral("v1"));
    CacheEntry blacklisted;
    blacklisted.blacklisted = true;

    EXPECT_TRUE(ModelScanWorker::needsFetch(std::nullopt, false, true));
    EXPECT_TRUE(ModelScanWorker::needsFetch(bare, false, true));
    EXPECT_FALSE(ModelScanWorker::needsFetch(enriched, false, true));
    EXPECT_FALSE(ModelScanWorker::needsFetch(enriched, true, false));
    EXPECT_TRUE(ModelScanWorker::needsFetch(enriched, true, true));
    EXPECT_FALSE(ModelScanWorker::needsFetch(blacklisted, false, true));
    EXPECT_TRUE(ModelScanWorker::needsFetch(blacklisted, true, false));
    EXPECT_TRUE(ModelScanWorker::needsFetch(blacklisted, true, true));
}
