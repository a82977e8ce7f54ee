
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

#include "ModelCacheStore.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QSet>

#include <algorithm>

#include "ModelmanLogging.h"
#include "PlatformUtils.h"

namespace {
constexpr char hashFileName[] = "model_cache_hash.json";
constexpr char infoFileName[] = "model_cache_info.json";
constexpr char errorBackupSuffix[] = "error";
constexpr int maxErrorBackups = 7;

QString dateToString(const QDateTime &value)
{
    return value.isValid() ? value.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime dateFromValue(const QJsonValue &value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return QDateTime();
    }
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}
} // namespace

QString CacheEntry::modelName() const
{
    return enrichment.value("model").toObject().value("name").toString();
}

QString CacheEntry::versionName() const
{
    return enrichment.value("name").toString();
}

QString CacheEntry::versionId() const
{
    const QJsonValue id = enrichment.value("id");
    if (id.isDouble()) {
        return QString::number(id.toInteger());
    }
    return id.toString();
}

QJsonObject CacheEntry::toJson() const
{
    QJsonObject object;
    object.insert("fingerprint", fingerprint);
    object.insert("enrichment", enrichment);
    object.insert("lastUsed", dateToString(lastUsedAt));
    object.insert("lastChecked", dateToString(lastCheckedAt));
    object.insert("blacklisted", blacklisted);
    object.insert("updateAvailable", updateAvailable);
    object.insert("notFoundCount", notFoundCount);
    return object;
}

CacheEntry CacheEntry::fromJson(const QString &fingerprint, const QJsonObject &object)
{
    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.enrichment = object.value("enrichment").toObject();
    entry.lastUsedAt = dateFromValue(object.value("lastUsed"));
    entry.lastCheckedAt = dateFromValue(object.value("lastChecked"));
    entry.blacklisted = object.value("blacklisted").toBool();
    entry.updateAvailable = object.value("updateAvailable").toBool();
    entry.notFoundCount = std::max(0, object.value("notFoundCount").toInt());
    return entry;
}

/**
 * @brief Checks whether the recorded size and modification time still describe a file.
 * @param info File to compare against.
 * @return True when nothing was recorded or the recorded values match.
 */
bool PathRecord::matchesFile(const QFileInfo &info) const
{
    if (sizeBytes >= 0 && sizeBytes != info.size()) {
        return false;
    }
    if (modified.isValid() && modified.toMSecsSinceEpoch() != info.lastModified().toMSecsSinceEpoch()) {
        return false;
    }
    return true;
}

PathRecord PathRecord::fromFile(const QString &fingerprint, const QFileInfo &info)
{
    PathRecord record;
    record.fingerprint = fingerprint;
    record.sizeBytes = info.size();
    record.modified = info.lastModified();
    return record;
}

/**
 * @brief Creates a store persisted in the given folder.
 * @param directory Folder holding the cache files; created on first save.
 */
ModelCacheStore::ModelCacheStore(const QString &directory)
    : m_directory(directory)
{
}

QString ModelCacheStore::directory() const
{
    return m_directory;
}

QString ModelCacheStore::hashFilePath() const
{
    return QDir(m_directory).filePath(QLatin1String(hashFileName));
}

QString ModelCacheStore::infoFilePath() const
{
    return QDir(m_directory).filePath(QLatin1String(infoFileName));
}

/**
 * @brief Reads a cache file, backing it up when it cannot be parsed.
 * @param path File to read.
 * @param label Human-readable name used in messages.
 * @param ok Set to false when the file exists but is unusable.
 * @param error Optional output error message.
 * @return Parsed object, empty when missing or unusable.
 */
QJsonObject ModelCacheStore::loadJsonFile(const QString &path, const char *label, bool *ok, QString *error) const
{
    *ok = true;
    QFile file(path);
    if (!file.exists()) {
        return QJsonObject();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        *ok = false;
        if (error) {
            *error = QCoreApplication::translate("ModelCacheStore", "Unable to open %1: %2")
                         .arg(path, file.errorString());
        }
        qCWarning(lcCache) << "Unable to open" << label << path << file.errorString();
        return QJsonObject();
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        return doc.object();
    }

    *ok = false;
    const QString reason = parseError.error == QJsonParseError::NoError
        ? QCoreApplication::translate("ModelCacheStore", "top level is not an object")
        : parseError.errorString();
    if (error) {
        *error = QCoreApplication::translate("ModelCacheStore", "Unable to load %1 from %2: %3")
                     .arg(QLatin1String(label), path, reason);
    }
    qCWarning(lcCache) << "Unable to load" << label << "from" << path << reason;

    const QString suffix = QLatin1String(errorBackupSuffix);
    QString backupPath;
    QString backupError;
    if (!PlatformUtils::copyToTimestampedBackup(path, suffix, &backupPath, &backupError)) {
        qCWarning(lcCache) << "Unable to back up" << path << backupError;
        return QJsonObject();
    }
    qCInfo(lcCache) << "Backed up problematic file to" << backupPath;

    const QFileInfo info(path);
    const QString prefix = QStringLiteral("%1-%2-").arg(info.completeBaseName(), suffix);
    int removed = 0;
    QString pruneError;
    if (!PlatformUtils::pruneBackups(info.absolutePath(), prefix, maxErrorBackups, &removed, &pruneError)) {
        qCWarning(lcCache) << "Unable to prune backups of" << path << pruneError;
    } else if (removed > 0) {
        qCDebug(lcCache) << "Pruned" << removed << "old backups of" << path;
    }
    return QJsonObject();
}

/**
 * @brief Loads both cache files, replacing the in-memory contents.
 * @param error Optional output error message for the first failure.
 * @return True when every existing file was read, false when one had to be discarded.
 */
bool ModelCacheStore::load(QString *error)
{
    bool hashOk = true;
    bool infoOk = true;
    const QJsonObject hashObject = loadJsonFile(hashFilePath(), "hash cache", &hashOk, error);
    const QJsonObject infoObject = loadJsonFile(infoFilePath(), "info cache", &infoOk, hashOk ? error : nullptr);

    QHash<QString, PathRecord> paths;
    paths.reserve(hashObject.size());
    for (auto it = hashObject.constBegin(); it != hashObject.constEnd(); ++it) {
        PathRecord record;
        if (it.value().isString()) {
            // Older caches stored a bare fingerprint per path.
            record.fingerprint = it.value().toString();
        } else {
            const QJsonObject object = it.value().toObject();
            record.fingerprint = object.value("fingerprint").toString();
            record.sizeBytes = static_cast<qint64>(object.value("size").toDouble(-1));
            record.modified = dateFromValue(object.value("modified"));
        }
        if (record.fingerprint.isEmpty()) {
            continue;
        }
        paths.insert(PlatformUtils::normalizePath(it.key()), record);
    }

    QHash<QString, CacheEntry> entries;
    entries.reserve(infoObject.size());
    for (auto it = infoObject.constBegin(); it != infoObject.constEnd(); ++it) {
        if (it.key().isEmpty() || !it.value().isObject()) {
            continue;
        }
        entries.insert(it.key(), CacheEntry::fromJson(it.key(), it.value().toObject()));
    }

    {
        QWriteLocker locker(&m_lock);
        m_paths = paths;
        m_entries = entries;
        m_generation += 1;
        m_savedGeneration = m_generation;
    }
    qCInfo(lcCache) << "Loaded" << paths.size() << "paths and" << entries.size() << "entries from" << m_directory;
    return hashOk && infoOk;
}

/**
 * @brief Writes a JSON object atomically through a temporary file.
 * @param path Destination file.
 * @param object Content to write.
 * @param error Optional output error message.
 * @return True when the file was committed.
 */
bool ModelCacheStore::writeJsonFile(const QString &path, const QJsonObject &object, QString *error) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QCoreApplication::translate("ModelCacheStore", "Unable to write %1: %2")
                         .arg(path, file.errorString());
        }
        return false;
    }
    const QByteArray data = QJsonDocument(object).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        if (error) {
            *error = QCoreApplication::translate("ModelCacheStore", "Unable to write %1: %2")
                         .arg(path, file.errorString());
        }
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        if (error) {
            *error = QCoreApplication::translate("ModelCacheStore", "Unable to commit %1: %2")
                         .arg(path, file.errorString());
        }
        return false;
    }
    return true;
}

/**
 * @brief Persists both maps when they changed since the last save or load.
 * @param error Optional output error message.
 * @return True when the files are up to date on disk.
 */
bool ModelCacheStore::save(QString *error)
{
    QMutexLocker saveLocker(&m_saveMutex);

    QJsonObject hashObject;
    QJsonObject infoObject;
    quint64 generation = 0;
    {
        QReadLocker locker(&m_lock);
        if (m_generation == m_savedGeneration) {
            return true;
        }
        generation = m_generation;
        for (auto it = m_paths.constBegin(); it != m_paths.constEnd(); ++it) {
            QJsonObject object;
            object.insert("fingerprint", it.value().fingerprint);
            object.insert("size", static_cast<double>(it.value().sizeBytes));
            object.insert("modified", dateToString(it.value().modified));
            hashObject.insert(it.key(), object);
        }
        for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
            infoObject.insert(it.key(), it.value().toJson());
        }
    }

    if (!QDir().mkpath(m_directory)) {
        if (error) {
            *error = QCoreApplication::translate("ModelCacheStore", "Cannot create cache folder %1").arg(m_directory);
        }
        qCWarning(lcCache) << "Cannot create cache folder" << m_directory;
        return false;
    }

    QString writeError;
    if (!writeJsonFile(hashFilePath(), hashObject, &writeError)
        || !writeJsonFile(infoFilePath(), infoObject, &writeError)) {
        qCWarning(lcCache) << writeError;
        if (error) {
            *error = writeError;
        }
        return false;
    }

    QWriteLocker locker(&m_lock);
    m_savedGeneration = std::max(m_savedGeneration, generation);
    qCDebug(lcCache) << "Saved" << hashObject.size() << "paths and" << infoObject.size() << "entries";
    return true;
}

bool ModelCacheStore::isDirty() const
{
    QReadLocker locker(&m_lock);
    return m_generation != m_savedGeneration;
}

std::optional<QString> ModelCacheStore::lookupByPath(const QString &path) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_paths.constFind(PlatformUtils::normalizePath(path));
    if (it == m_paths.constEnd()) {
        return std::nullopt;
    }
    return it.value().fingerprint;
}

std::optional<PathRecord> ModelCacheStore::lookupPathRecord(const QString &path) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_paths.constFind(PlatformUtils::normalizePath(path));
    if (it == m_paths.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::optional<CacheEntry> ModelCacheStore::lookupByFingerprint(const QString &fingerprint) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_entries.constFind(fingerprint);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void ModelCacheStore::upsert(const QString &path, const QString &fingerprint, const CacheEntry &entry)
{
    PathRecord record;
    record.fingerprint = fingerprint;
    upsert(path, record, entry);
}

/**
 * @brief Records a path and its entry in one atomic step.
 * @param path File path; normalized before use as a key.
 * @param record Fingerprint and file stamp for the path.
 * @param entry Entry stored under the record's fingerprint.
 */
void ModelCacheStore::upsert(const QString &path, const PathRecord &record, const CacheEntry &entry)
{
    if (record.fingerprint.isEmpty()) {
        qCWarning(lcCache) << "Ignoring upsert without fingerprint for" << path;
        return;
    }
    CacheEntry stored = entry;
    stored.fingerprint = record.fingerprint;

    QWriteLocker locker(&m_lock);
    m_paths.insert(PlatformUtils::normalizePath(path), record);
    m_entries.insert(record.fingerprint, stored);
    m_generation += 1;
}

/**
 * @brief Records a path and changes the current entry of its fingerprint in one atomic step.
 *
 * Fields the callback leaves alone keep the value the store holds at that moment.
 * @param path File path; normalized before use as a key.
 * @param record Fingerprint and file stamp for the path.
 * @param apply Optional change applied to the entry; it runs under the write lock.
 */
void ModelCacheStore::updateEntry(const QString &path,
                                  const PathRecord &record,
                                  const std::function<void(CacheEntry &)> &apply)
{
    if (record.fingerprint.isEmpty()) {
        qCWarning(lcCache) << "Ignoring update without fingerprint for" << path;
        return;
    }

    QWriteLocker locker(&m_lock);
    m_paths.insert(PlatformUtils::normalizePath(path), record);
    auto entry = m_entries.find(record.fingerprint);
    if (entry == m_entries.end()) {
        CacheEntry created;
        created.fingerprint = record.fingerprint;
        entry = m_entries.insert(record.fingerprint, created);
    }
    if (apply) {
        apply(entry.value());
        entry.value().fingerprint = record.fingerprint;
    }
    m_generation += 1;
}

/**
 * @brief Lists every known path with its fingerprint and entry, sorted by path.
 * @return Snapshot of the path map.
 */
QVector<CacheListing> ModelCacheStore::listAll() const
{
    QVector<CacheListing> listing;
    {
        QReadLocker locker(&m_lock);
        listing.reserve(m_paths.size());
        for (auto it = m_paths.constBegin(); it != m_paths.constEnd(); ++it) {
            CacheListing item;
            item.path = it.key();
            item.fingerprint = it.value().fingerprint;
            const auto entry = m_entries.constFind(item.fingerprint);
            if (entry != m_entries.constEnd()) {
                item.entry = entry.value();
            }
            listing.append(item);
        }
    }
    std::sort(listing.begin(), listing.end(), [](const CacheListing &left, const CacheListing &right) {
        return left.path < right.path;
    });
    return listing;
}

/**
 * @brief Lists entries that no path refers to any more, sorted by fingerprint.
 * @return Entries left behind when their file changed content or was forgotten.
 */
QVector<CacheEntry> ModelCacheStore::listUnreferencedEntries() const
{
    QVector<CacheEntry> entries;
    {
        QReadLocker locker(&m_lock);
        QSet<QString> referenced;
        referenced.reserve(m_paths.size());
        for (auto it = m_paths.constBegin(); it != m_paths.constEnd(); ++it) {
            referenced.insert(it.value().fingerprint);
        }
        for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
            if (!referenced.contains(it.key())) {
                entries.append(it.value());
            }
        }
    }
    std::sort(entries.begin(), entries.end(), [](const CacheEntry &left, const CacheEntry &right) {
        return left.fingerprint < right.fingerprint;
    });
    return entries;
}

bool ModelCacheStore::touchByPath(const QString &path, const QDateTime &when)
{
    QWriteLocker locker(&m_lock);
    const auto record = m_paths.constFind(PlatformUtils::normalizePath(path));
    if (record == m_paths.constEnd()) {
        return false;
    }
    auto entry = m_entries.find(record.value().fingerprint);
    if (entry == m_entries.end()) {
        CacheEntry created;
        created.fingerprint = record.value().fingerprint;
        entry = m_entries.insert(created.fingerprint, created);
    }
    entry.value().lastUsedAt = when;
    m_generation += 1;
    return true;
}

bool ModelCacheStore::setBlacklisted(const QString &fingerprint, bool blacklisted)
{
    QWriteLocker locker(&m_lock);
    auto entry = m_entries.find(fingerprint);
    if (entry == m_entries.end()) {
        return false;
    }
    if (entry.value().blacklisted != blacklisted) {
        entry.value().blacklisted = blacklisted;
        m_generation += 1;
    }
    return true;
}

/**
 * @brief Forgets a path; its entry goes too unless another path shares the fingerprint.
 * @param path File path to remove.
 * @return True when the path was known.
 */
bool ModelCacheStore::removePath(const QString &path)
{
    QWriteLocker locker(&m_lock);
    const auto record = m_paths.find(PlatformUtils::normalizePath(path));
    if (record == m_paths.end()) {
        return false;
    }
    const QString fingerprint = record.value().fingerprint;
    m_paths.erase(record);
    const bool shared = std::any_of(m_paths.constBegin(), m_paths.constEnd(), [&](const PathRecord &other) {
        return other.fingerprint == fingerprint;
    });
    if (!shared) {
        m_entries.remove(fingerprint);
    }
    m_generation += 1;
    return true;
}

int ModelCacheStore::pathCount() const
{
    QReadLocker locker(&m_lock);
    return m_paths.size();
}

int ModelCacheStore::entryCount() const
{
    QReadLocker locker(&m_lock);
    return m_entries.size();
}
