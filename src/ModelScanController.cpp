
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

#include "ModelScanController.h"

#include "ModelFolderWalker.h"
#include "ModelScanWorker.h"
#include "ModelmanLogging.h"
#include "ScanProgressReporter.h"

/**
 * @brief Creates the scan controller.
 * @param settings Scanner settings.
 * @param store Cache store shared with the browsing side; must outlive the controller.
 * @param provider Metadata provider, or nullptr to disable lookups.
 * @param parent Parent QObject for ownership.
 */
ModelScanController::ModelScanController(const ScannerSettings &settings,
                                         ModelCacheStore *store,
                                         MetadataProvider *provider,
                                         QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_store(store)
    , m_provider(provider)
{
}

/**
 * @brief Cancels a running scan and waits for its thread to end.
 */
ModelScanController::~ModelScanController()
{
    if (m_scanThread) {
        m_session.requestCancel();
        m_scanThread->quit();
        m_scanThread->wait();
    }
    delete m_scanWorker.data();
}

/**
 * @brief Starts an asynchronous scan of the requested folders.
 * @param folders Category names or folder paths; empty for every configured root.
 * @param force True to re-hash files and refresh blacklisted entries.
 * @param includeCached With force, also refresh entries that already have metadata.
 * @return Map with ok, and error and errorType when rejected.
 */
QVariantMap ModelScanController::startScan(const QStringList &folders, bool force, bool includeCached)
{
    if (m_session.isActive()) {
        return validationError(tr("A scan is already in progress"));
    }

    const QStringList roots = ModelFolderWalker::resolveRoots(folders, m_settings);
    const QStringList existing = ModelFolderWalker::existingRoots(roots);
    if (existing.isEmpty()) {
        return validationError(tr("None of the requested folders exist"));
    }
    if (!ModelFolderWalker::containsModelFile(existing, m_settings.extensions)) {
        return validationError(tr("No model files found"));
    }

    joinFinishedThread();

    ScanOptions options;
    options.roots = roots;
    options.force = force;
    options.includeCached = includeCached;

    m_session.begin();

    auto *thread = new QThread(this);
    auto *worker = new ModelScanWorker(&m_session, m_store, m_provider, m_settings, options);
    worker->moveToThread(thread);

    m_scanThread = thread;
    m_scanWorker = worker;

    connect(thread, &QThread::started, worker, &ModelScanWorker::start);
    connect(worker, &ModelScanWorker::progress, this, [this](int, int) {
        emit progressChanged();
    });
    connect(worker, &ModelScanWorker::finished, this,
            [this, scanThread = QPointer<QThread>(thread)](const QVariantMap &result) {
        // A newer scan may already own the members.
        if (scanThread && m_scanThread == scanThread.data()) {
            m_scanWorker = nullptr;
            m_scanThread = nullptr;
        }
        if (scanThread) {
            scanThread->quit();
        }
        emit progressChanged();
        emit scanFinished(result);
    });
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();

    emit progressChanged();

    QVariantMap result;
    result.insert("ok", true);
    return result;
}

/**
 * @brief Joins the thread of a scan that already reached a terminal state.
 *
 * The worker's finished signal may still be queued when this runs.
 */
void ModelScanController::joinFinishedThread()
{
    if (!m_scanThread) {
        return;
    }
    m_scanThread->quit();
    m_scanThread->wait();
    m_scanThread = nullptr;
    m_scanWorker = nullptr;
}

/**
 * @brief Returns the current progress without side effects.
 * @return Poll response map.
 */
QVariantMap ModelScanController::scanProgress() const
{
    return ScanProgressReporter::toVariantMap(m_session.snapshot());
}

/**
 * @brief Requests cancellation of the running scan.
 * @return Map with ok and message; the scan stops at its next file step.
 */
QVariantMap ModelScanController::cancelScan()
{
    QVariantMap result;
    if (!m_session.isActive()) {
        result.insert("ok", false);
        result.insert("message", tr("No scan in progress"));
        return result;
    }
    m_session.requestCancel();
    qCInfo(lcScan) << "Scan cancellation requested";
    result.insert("ok", true);
    result.insert("message", tr("Cancellation requested"));
    return result;
}

/**
 * @brief Acknowledges a finished scan and returns the session to idle.
 * @return Map with ok, and error when a scan is still running.
 */
QVariantMap ModelScanController::resetScan()
{
    QVariantMap result;
    if (m_session.isActive()) {
        result.insert("ok", false);
        result.insert("error", tr("A scan is still in progress"));
        return result;
    }
    m_session.reset();
    emit progressChanged();
    result.insert("ok", true);
    return result;
}

QVariantList ModelScanController::availableFolders() const
{
    return ModelFolderWalker::availableFolders(m_settings);
}

bool ModelScanController::isActive() const
{
    return m_session.isActive();
}

ScanProgress ModelScanController::progressSnapshot() const
{
    return m_session.snapshot();
}

QVariantMap ModelScanController::validationError(const QString &message) const
{
    qCInfo(lcScan) << "Scan request rejected:" << message;
    QVariantMap result;
    result.insert("ok", false);
    result.insert("error", message);
    result.insert("errorType", QStringLiteral("validation"));
    return result;
}
