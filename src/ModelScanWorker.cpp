
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

#include "ModelScanWorker.h"

#include <QDateTime>
#include <QFileInfo>

#include "MetadataProvider.h"
#include "ModelFolderWalker.h"
#include "ModelPathUtils.h"
#include "ModelmanLogging.h"

/**
 * @brief Creates a scan worker over a session, a cache and a metadata provider.
 * @param session Session receiving the progress; must outlive the worker.
 * @param store Cache store to read and update; must outlive the worker.
 * @param provider Metadata provider, or nullptr to disable lookups.
 * @param settings Scanner settings.
 * @param options Roots and refresh flags of this scan.
 * @param parent Parent QObject for ownership.
 */
ModelScanWorker::ModelScanWorker(ScanSession *session,
                                 ModelCacheStore *store,
                                 MetadataProvider *provider,
                                 const ScannerSettings &settings,
                                 const ScanOptions &options,
                                 QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_store(store)
    , m_provider(provider)
    , m_settings(settings)
    , m_options(options)
{
}

/**
 * @brief Decides whether the provider must be asked about a fingerprint.
 * @param entry Cached entry for the fingerprint, if any.
 * @param force True for a forced refresh.
 * @param includeCached True to refresh entries that already carry metadata.
 * @return True when a lookup is needed.
 */
bool ModelScanWorker::needsFetch(const std::optional<CacheEntry> &entry, bool force, bool includeCached)
{
    if (!entry) {
        return true;
    }
    if (entry->blacklisted) {
        return force;
    }
    if (!entry->hasEnrichment()) {
        return true;
    }
    return force && includeCached;
}

/**
 * @brief Requests cancellation; honoured before the next file and inside provider waits.
 */
void ModelScanWorker::cancel()
{
    m_session->requestCancel();
}

bool ModelScanWorker::isCancelled() const
{
    return m_session->isCancelRequested();
}

/**
 * @brief Runs the whole scan: discovery, then each file in order.
 */
void ModelScanWorker::start()
{
    if (!m_session->isActive()) {
        m_session->begin();
    }
    m_session->setStatus(ScanStatus::Discovering);
    qCInfo(lcScan) << "Scan started on" << m_options.roots.size() << "folders"
                   << "force:" << m_options.force << "includeCached:" << m_options.includeCached;

    const ModelFolderWalker::WalkResult walked = ModelFolderWalker::walk(
        m_options.roots, m_settings.extensions, [this]() { return isCancelled(); });
    if (walked.cancelled || isCancelled()) {
        emit finished(finish(ScanStatus::Cancelled));
        return;
    }
    if (walked.files.isEmpty()) {
        emit finished(finish(ScanStatus::Error, tr("No model files found")));
        return;
    }

    const int total = walked.files.size();
    m_session->setTotal(total);
    m_session->setStatus(ScanStatus::Scanning);
    emit progress(0, total);

    int processed = 0;
    for (const QString &path : walked.files) {
        if (isCancelled()) {
            emit finished(finish(ScanStatus::Cancelled));
            return;
        }

        const FileOutcome outcome = processFile(path);
        if (outcome == FileOutcome::Cancelled) {
            emit finished(finish(ScanStatus::Cancelled));
            return;
        }

        processed += 1;
        m_session->advance();
        checkpoint(processed);
        emit progress(processed, total);

        if (outcome == FileOutcome::Fatal) {
            emit finished(finish(ScanStatus::Error, m_fatalError));
            return;
        }
    }

    emit finished(finish(ScanStatus::Completed));
}

/**
 * @brief Computes the content fingerprint of a file.
 * @param path File path.
 * @return Fingerprint result; invalid with an error on read failure.
 */
FingerprintUtils::FingerprintResult ModelScanWorker::fingerprintFile(const QString &path)
{
    return FingerprintUtils::computeFileFingerprint(path);
}

/**
 * @brief Classifies, fingerprints and enriches one file.
 * @param path Normalized file path.
 * @return Outcome of the file step.
 */
ModelScanWorker::FileOutcome ModelScanWorker::processFile(const QString &path)
{
    m_session->setCurrentFile(path);
    m_session->setStatus(ScanStatus::Scanning);

    const QFileInfo info(path);
    qCDebug(lcScan) << "Processing" << path
                    << ModelPathUtils::categoryName(ModelPathUtils::folderCategoryForPath(path));

    const std::optional<PathRecord> record = m_store->lookupPathRecord(path);
    const bool needsHash = m_options.force || !record || !record->matchesFile(info);

    QString fingerprint;
    if (needsHash) {
        m_session->setStatus(ScanStatus::Hashing);
        const FingerprintUtils::FingerprintResult hashed = fingerprintFile(path);
        if (!hashed.valid) {
            qCWarning(lcScan) << "Cannot fingerprint" << path << hashed.error;
            m_session->addError();
            return FileOutcome::Failed;
        }
        fingerprint = hashed.fingerprint;
        m_hashed += 1;
    } else {
        fingerprint = record->fingerprint;
    }

    const std::optional<CacheEntry> existing = m_store->lookupByFingerprint(fingerprint);
    const PathRecord updatedRecord = PathRecord::fromFile(fingerprint, info);

    const bool providerEnabled = m_settings.providerEnabled && m_provider;
    if (!providerEnabled || !needsFetch(existing, m_options.force, m_options.includeCached)) {
        if (needsHash || !existing) {
            m_store->updateEntry(path, updatedRecord);
        }
        return FileOutcome::Processed;
    }

    m_session->setStatus(ScanStatus::FetchingMetadata);
    return fetchMetadata(path, updatedRecord, existing ? existing->versionId() : QString());
}

/**
 * @brief Asks the provider about a fingerprint and applies the answer to the cached entry.
 *
 * Only the lookup fields are written; the usage time of the entry is left as stored.
 * @param path File path.
 * @param record Path record carrying the fingerprint.
 * @param knownVersionId Catalog version id already known for the entry, if any.
 * @return Processed, Failed, Cancelled or Fatal once failures reach the limit.
 */
ModelScanWorker::FileOutcome ModelScanWorker::fetchMetadata(const QString &path,
                                                            const PathRecord &record,
                                                            const QString &knownVersionId)
{
    MetadataFetchRequest request;
    request.fingerprint = record.fingerprint;
    request.knownVersionId = knownVersionId;
    request.isCancelled = [this]() { return isCancelled(); };

    const MetadataFetchResult result = m_provider->fetch(request);
    switch (result.status) {
    case MetadataFetchResult::Status::Cancelled:
        m_store->updateEntry(path, record);
        return FileOutcome::Cancelled;
    case MetadataFetchResult::Status::Found: {
        const QDateTime checkedAt = QDateTime::currentDateTime();
        m_store->updateEntry(path, record, [&result, &checkedAt](CacheEntry &entry) {
            entry.enrichment = result.enrichment;
            entry.updateAvailable = result.updateAvailable;
            entry.blacklisted = false;
            entry.notFoundCount = 0;
            entry.lastCheckedAt = checkedAt;
        });
        m_consecutiveFailures = 0;
        m_fetched += 1;
        return FileOutcome::Processed;
    }
    case MetadataFetchResult::Status::NotFound: {
        const QDateTime checkedAt = QDateTime::currentDateTime();
        const int threshold = m_settings.notFoundBlacklistThreshold;
        int notFoundCount = 0;
        bool blacklistedNow = false;
        m_store->updateEntry(path, record, [&](CacheEntry &entry) {
            entry.notFoundCount += 1;
            entry.lastCheckedAt = checkedAt;
            if (threshold > 0 && entry.notFoundCount >= threshold && !entry.blacklisted) {
                entry.blacklisted = true;
                blacklistedNow = true;
            }
            notFoundCount = entry.notFoundCount;
        });
        if (blacklistedNow) {
            qCInfo(lcScan) << "Blacklisting" << record.fingerprint << "after" << notFoundCount << "lookups";
        }
        m_consecutiveFailures = 0;
        m_notFound += 1;
        return FileOutcome::Processed;
    }
    case MetadataFetchResult::Status::NetworkError:
        break;
    }

    // Keep the fingerprint so the lookup is retried on the next scan.
    m_store->updateEntry(path, record);
    m_session->addError();
    m_consecutiveFailures += 1;
    qCWarning(lcScan) << "Metadata lookup failed for" << record.fingerprint << result.error
                      << "(" << m_consecutiveFailures << "consecutive)";
    if (m_settings.maxConsecutiveFailures > 0 && m_consecutiveFailures >= m_settings.maxConsecutiveFailures) {
        m_fatalError = tr("Too many consecutive network errors: %1").arg(result.error);
        return FileOutcome::Fatal;
    }
    return FileOutcome::Failed;
}

/**
 * @brief Saves the cache every checkpoint interval.
 * @param processed Number of files processed so far.
 */
void ModelScanWorker::checkpoint(int processed)
{
    const int interval = m_settings.checkpointInterval;
    if (interval <= 0 || processed % interval != 0) {
        return;
    }
    QString error;
    if (!m_store->save(&error)) {
        qCWarning(lcScan) << "Checkpoint save failed:" << error;
        m_saveError = error;
    } else {
        qCDebug(lcScan) << "Checkpoint saved after" << processed << "files";
    }
}

/**
 * @brief Saves the cache, moves the session to its terminal state and builds the result.
 * @param status Terminal status.
 * @param fatalError Summary for the Error state.
 * @return Result map for the finished signal.
 */
QVariantMap ModelScanWorker::finish(ScanStatus status, const QString &fatalError)
{
    QString error;
    if (!m_store->save(&error)) {
        qCWarning(lcScan) << "Final save failed:" << error;
        m_saveError = error;
    }
    m_session->finish(status, fatalError);

    const ScanProgress progress = m_session->snapshot();
    QVariantMap result;
    result.insert("ok", status == ScanStatus::Completed);
    result.insert("status", ScanSession::statusName(status));
    result.insert("processed", progress.current);
    result.insert("total", progress.total);
    result.insert("errorCount", progress.errorCount);
    result.insert("hashed", m_hashed);
    result.insert("fetched", m_fetched);
    result.insert("notFound", m_notFound);
    if (status == ScanStatus::Cancelled) {
        result.insert("cancelled", true);
        result.insert("error", tr("Scan cancelled"));
    } else if (!fatalError.isEmpty()) {
        result.insert("error", fatalError);
    }
    if (!m_saveError.isEmpty()) {
        result.insert("saveError", m_saveError);
    }
    qCInfo(lcScan) << "Scan" << ScanSession::statusName(status) << "-" << progress.current << "of"
                   << progress.total << "files," << progress.errorCount << "errors";
    return result;
}
