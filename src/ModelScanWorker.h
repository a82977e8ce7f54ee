#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <optional>

#include "FingerprintUtils.h"
#include "ModelCacheStore.h"
#include "ScanSession.h"
#include "ScannerSettings.h"

class MetadataProvider;

struct ScanOptions {
    QStringList roots;
    // Re-hash every file and refresh cached entries.
    bool force = false;
    // With force, also refresh entries that already have metadata.
    bool includeCached = true;
};

class ModelScanWorker : public QObject
{
    Q_OBJECT

public:
    ModelScanWorker(ScanSession *session,
                    ModelCacheStore *store,
                    MetadataProvider *provider,
                    const ScannerSettings &settings,
                    const ScanOptions &options,
                    QObject *parent = nullptr);

    static bool needsFetch(const std::optional<CacheEntry> &entry, bool force, bool includeCached);

public slots:
    void start();
    void cancel();

signals:
    void progress(int current, int total);
    void finished(QVariantMap result);

protected:
    virtual FingerprintUtils::FingerprintResult fingerprintFile(const QString &path);

private:
    enum class FileOutcome {
        Processed,
        Failed,
        Cancelled,
        Fatal
    };

    bool isCancelled() const;
    FileOutcome processFile(const QString &path);
    FileOutcome fetchMetadata(const QString &path, const PathRecord &record, const QString &knownVersionId);
    void checkpoint(int processed);
    QVariantMap finish(ScanStatus status, const QString &fatalError = QString());

    ScanSession *m_session = nullptr;
    ModelCacheStore *m_store = nullptr;
    MetadataProvider *m_provider = nullptr;
    ScannerSettings m_settings;
    ScanOptions m_options;

    int m_consecutiveFailures = 0;
    int m_hashed = 0;
    int m_fetched = 0;
    int m_notFound = 0;
    QString m_fatalError;
    QString m_saveError;
};
