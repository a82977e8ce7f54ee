#pragma once

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QReadWriteLock>
#include <QString>
#include <QVector>

#include <functional>
#include <optional>

class QFileInfo;

struct CacheEntry {
    QString fingerprint;
    QJsonObject enrichment;
    QDateTime lastUsedAt;
    QDateTime lastCheckedAt;
    bool blacklisted = false;
    bool updateAvailable = false;
    int notFoundCount = 0;

    bool hasEnrichment() const { return !enrichment.isEmpty(); }
    QString modelName() const;
    QString versionName() const;
    QString versionId() const;

    QJsonObject toJson() const;
    static CacheEntry fromJson(const QString &fingerprint, const QJsonObject &object);
};

struct PathRecord {
    QString fingerprint;
    qint64 sizeBytes = -1;
    QDateTime modified;

    bool matchesFile(const QFileInfo &info) const;
    static PathRecord fromFile(const QString &fingerprint, const QFileInfo &info);
};

struct CacheListing {
    QString path;
    QString fingerprint;
    std::optional<CacheEntry> entry;
};

/**
 * @brief Persistent path -> fingerprint and fingerprint -> entry maps.
 *
 * All accessors are thread-safe; every mutation is applied under a write
 * lock so readers always see whole records. Changes reach disk on save().
 */
class ModelCacheStore
{
public:
    explicit ModelCacheStore(const QString &directory);

    QString directory() const;
    QString hashFilePath() const;
    QString infoFilePath() const;

    bool load(QString *error = nullptr);
    bool save(QString *error = nullptr);
    bool isDirty() const;

    std::optional<QString> lookupByPath(const QString &path) const;
    std::optional<PathRecord> lookupPathRecord(const QString &path) const;
    std::optional<CacheEntry> lookupByFingerprint(const QString &fingerprint) const;

    void upsert(const QString &path, const QString &fingerprint, const CacheEntry &entry);
    void upsert(const QString &path, const PathRecord &record, const CacheEntry &entry);
    void updateEntry(const QString &path,
                     const PathRecord &record,
                     const std::function<void(CacheEntry &)> &apply = {});
    QVector<CacheListing> listAll() const;
    QVector<CacheEntry> listUnreferencedEntries() const;

    bool touchByPath(const QString &path, const QDateTime &when = QDateTime::currentDateTime());
    bool setBlacklisted(const QString &fingerprint, bool blacklisted);
    bool removePath(const QString &path);

    int pathCount() const;
    int entryCount() const;

private:
    QJsonObject loadJsonFile(const QString &path, const char *label, bool *ok, QString *error) const;
    bool writeJsonFile(const QString &path, const QJsonObject &object, QString *error) const;

    QString m_directory;
    mutable QReadWriteLock m_lock;
    QMutex m_saveMutex;
    QHash<QString, PathRecord> m_paths;
    QHash<QString, CacheEntry> m_entries;
    quint64 m_generation = 0;
    quint64 m_savedGeneration = 0;
};
