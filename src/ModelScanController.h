#pragma once

#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QThread>
#include <QVariantList>
#include <QVariantMap>

#include "ScanSession.h"
#include "ScannerSettings.h"

class MetadataProvider;
class ModelCacheStore;
class ModelScanWorker;

class ModelScanController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool active READ isActive NOTIFY progressChanged)

public:
    ModelScanController(const ScannerSettings &settings,
                        ModelCacheStore *store,
                        MetadataProvider *provider,
                        QObject *parent = nullptr);
    ~ModelScanController() override;

    Q_INVOKABLE QVariantMap startScan(const QStringList &folders, bool force = false, bool includeCached = true);
    Q_INVOKABLE QVariantMap scanProgress() const;
    Q_INVOKABLE QVariantMap cancelScan();
    Q_INVOKABLE QVariantMap resetScan();
    Q_INVOKABLE QVariantList availableFolders() const;

    bool isActive() const;
    ScanProgress progressSnapshot() const;

signals:
    void progressChanged();
    void scanFinished(QVariantMap result);

private:
    QVariantMap validationError(const QString &message) const;
    void joinFinishedThread();

    ScannerSettings m_settings;
    ModelCacheStore *m_store = nullptr;
    MetadataProvider *m_provider = nullptr;
    ScanSession m_session;
    QPointer<QThread> m_scanThread;
    QPointer<ModelScanWorker> m_scanWorker;
};
