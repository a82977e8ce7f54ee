#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "ModelCacheStore.h"
#include "ModelPathUtils.h"

struct ModelFileRecord {
    QString path;
    QString fileName;
    QString fingerprint;
    ModelPathUtils::FolderCategory folderCategory = ModelPathUtils::FolderCategory::Unknown;
    bool cached = false;
    // Known to the cache but not found on disk by the last walk.
    bool orphan = false;
    qint64 sizeBytes = -1;
    std::optional<CacheEntry> entry;

    QString displayName() const;
    QDateTime lastUsedAt() const;
    bool isBlacklisted() const;
    bool hasUpdate() const;
};

struct ModelLibraryQuery {
    enum class LastUsedFilter {
        Any = 0,
        Today,
        Week,
        Month,
        Never
    };

    enum class UpdateFilter {
        All = 0,
        Available,
        None
    };

    enum class SortKey {
        Name = 0,
        LastUsed,
        Size,
        Category
    };

    QString search;
    LastUsedFilter lastUsed = LastUsedFilter::Any;
    UpdateFilter updates = UpdateFilter::All;
    std::optional<ModelPathUtils::FolderCategory> category;
    bool showBlacklisted = true;
    SortKey sortKey = SortKey::Name;
    Qt::SortOrder sortOrder = Qt::AscendingOrder;
    // Reference time for the last-used windows; current time when invalid.
    QDateTime now;

    static std::optional<LastUsedFilter> lastUsedFilterFromName(const QString &name);
    static std::optional<UpdateFilter> updateFilterFromName(const QString &name);
    static std::optional<SortKey> sortKeyFromName(const QString &name);
};

namespace ModelLibraryView {

QVector<ModelFileRecord> merge(const QStringList &files, const ModelCacheStore &store);
bool matches(const ModelFileRecord &record, const ModelLibraryQuery &query);
void applyFilterAndSort(QVector<ModelFileRecord> &records, const ModelLibraryQuery &query);
QVector<ModelFileRecord> build(const QStringList &files, const ModelCacheStore &store, const ModelLibraryQuery &query);

} // namespace ModelLibraryView
