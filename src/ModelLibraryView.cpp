
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

#include "ModelLibraryView.h"

#include <QCollator>
#include <QFileInfo>
#include <QSet>

#include <algorithm>

#include "PlatformUtils.h"

namespace {
struct LibraryViewConstants {
    static constexpr int weekDays = 7;
    static constexpr int monthDays = 30;
};

ModelFileRecord recordFor(const QString &path,
                          const std::optional<QString> &fingerprint,
                          const ModelCacheStore &store)
{
    ModelFileRecord record;
    record.path = path;
    record.fileName = QFileInfo(path).fileName();
    record.folderCategory = ModelPathUtils::folderCategoryForPath(path);
    if (fingerprint) {
        record.fingerprint = *fingerprint;
        record.entry = store.lookupByFingerprint(*fingerprint);
        record.cached = record.entry.has_value();
    }
    return record;
}
}

QString ModelFileRecord::displayName() const
{
    if (entry) {
        const QString modelName = entry->modelName();
        if (!modelName.isEmpty()) {
            return modelName;
        }
    }
    return fileName;
}

QDateTime ModelFileRecord::lastUsedAt() const
{
    return entry ? entry->lastUsedAt : QDateTime();
}

bool ModelFileRecord::isBlacklisted() const
{
    return entry && entry->blacklisted;
}

bool ModelFileRecord::hasUpdate() const
{
    return entry && entry->updateAvailable;
}

std::optional<ModelLibraryQuery::LastUsedFilter> ModelLibraryQuery::lastUsedFilterFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key.isEmpty() || key == "all" || key == "any") {
        return LastUsedFilter::Any;
    }
    if (key == "today") {
        return LastUsedFilter::Today;
    }
    if (key == "week") {
        return LastUsedFilter::Week;
    }
    if (key == "month") {
        return LastUsedFilter::Month;
    }
    if (key == "never") {
        return LastUsedFilter::Never;
    }
    return std::nullopt;
}

std::optional<ModelLibraryQuery::UpdateFilter> ModelLibraryQuery::updateFilterFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key.isEmpty() || key == "all") {
        return UpdateFilter::All;
    }
    if (key == "available") {
        return UpdateFilter::Available;
    }
    if (key == "none") {
        return UpdateFilter::None;
    }
    return std::nullopt;
}

std::optional<ModelLibraryQuery::SortKey> ModelLibraryQuery::sortKeyFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key.isEmpty() || key == "name") {
        return SortKey::Name;
    }
    if (key == "lastused") {
        return SortKey::LastUsed;
    }
    if (key == "size") {
        return SortKey::Size;
    }
    if (key == "type" || key == "category") {
        return SortKey::Category;
    }
    return std::nullopt;
}

namespace ModelLibraryView {

/**
 * @brief Joins the walked files with the cache contents.
 * @param files Paths found on disk.
 * @param store Cache store to read.
 * @return One record per distinct path; cached paths missing on disk and
 *         entries without any path are orphans.
 */
QVector<ModelFileRecord> merge(const QStringList &files, const ModelCacheStore &store)
{
    QVector<ModelFileRecord> records;
    QSet<QString> seen;
    records.reserve(files.size());

    for (const QString &file : files) {
        const QString path = PlatformUtils::normalizePath(file);
        if (path.isEmpty() || seen.contains(path)) {
            continue;
        }
        seen.insert(path);
        ModelFileRecord record = recordFor(path, store.lookupByPath(path), store);
        const QFileInfo info(path);
        record.sizeBytes = info.exists() ? info.size() : -1;
        records.append(record);
    }

    const QVector<CacheListing> listings = store.listAll();
    for (const CacheListing &listing : listings) {
        if (seen.contains(listing.path)) {
            continue;
        }
        seen.insert(listing.path);
        ModelFileRecord record = recordFor(listing.path, listing.fingerprint, store);
        record.orphan = true;
        records.append(record);
    }

    // Entries whose file now has other content, or was forgotten, have no path left.
    const QVector<CacheEntry> unreferenced = store.listUnreferencedEntries();
    for (const CacheEntry &entry : unreferenced) {
        ModelFileRecord record;
        record.fileName = entry.fingerprint;
        record.fingerprint = entry.fingerprint;
        record.entry = entry;
        record.cached = true;
        record.orphan = true;
        records.append(record);
    }
    return records;
}

/**
 * @brief Tests a record against the query filters.
 * @param record Record to test.
 * @param query Filters to apply.
 * @return True when the record is kept.
 */
bool matches(const ModelFileRecord &record, const ModelLibraryQuery &query)
{
    const QString needle = query.search.trimmed();
    if (!needle.isEmpty()) {
        const bool nameMatch = record.fileName.contains(needle, Qt::CaseInsensitive);
        const bool modelMatch = record.entry && record.entry->modelName().contains(needle, Qt::CaseInsensitive);
        const bool versionMatch = record.entry && record.entry->versionName().contains(needle, Qt::CaseInsensitive);
        if (!nameMatch && !modelMatch && !versionMatch) {
            return false;
        }
    }

    if (!query.showBlacklisted && record.isBlacklisted()) {
        return false;
    }

    if (query.category && record.folderCategory != *query.category) {
        return false;
    }

    switch (query.updates) {
    case ModelLibraryQuery::UpdateFilter::Available:
        if (!record.hasUpdate()) {
            return false;
        }
        break;
    case ModelLibraryQuery::UpdateFilter::None:
        if (record.hasUpdate()) {
            return false;
        }
        break;
    case ModelLibraryQuery::UpdateFilter::All:
        break;
    }

    const QDateTime lastUsed = record.lastUsedAt();
    const QDateTime now = query.now.isValid() ? query.now : QDateTime::currentDateTime();
    switch (query.lastUsed) {
    case ModelLibraryQuery::LastUsedFilter::Any:
        return true;
    case ModelLibraryQuery::LastUsedFilter::Never:
        return !lastUsed.isValid();
    case ModelLibraryQuery::LastUsedFilter::Today:
        return lastUsed.isValid() && lastUsed.date() == now.date();
    case ModelLibraryQuery::LastUsedFilter::Week:
        return lastUsed.isValid() && lastUsed >= now.addDays(-LibraryViewConstants::weekDays);
    case ModelLibraryQuery::LastUsedFilter::Month:
        return lastUsed.isValid() && lastUsed >= now.addDays(-LibraryViewConstants::monthDays);
    }
    return true;
}

/**
 * @brief Filters records in place and sorts them stably, ties broken by path.
 * @param records Records to filter and sort.
 * @param query Filters and sort settings.
 */
void applyFilterAndSort(QVector<ModelFileRecord> &records, const ModelLibraryQuery &query)
{
    records.erase(std::remove_if(records.begin(), records.end(), [&](const ModelFileRecord &record) {
        return !matches(record, query);
    }), records.end());

    QCollator collator;
    collator.setCaseSensitivity(Qt::CaseInsensitive);

    // Negative, zero or positive like a three-way comparison.
    auto compareKey = [&](const ModelFileRecord &left, const ModelFileRecord &right) -> int {
        switch (query.sortKey) {
        case ModelLibraryQuery::SortKey::LastUsed: {
            const QDateTime leftTime = left.lastUsedAt();
            const QDateTime rightTime = right.lastUsedAt();
            if (leftTime.isValid() != rightTime.isValid()) {
                return leftTime.isValid() ? 1 : -1;
            }
            if (leftTime == rightTime) {
                return 0;
            }
            return leftTime < rightTime ? -1 : 1;
        }
        case ModelLibraryQuery::SortKey::Size:
            if (left.sizeBytes == right.sizeBytes) {
                return 0;
            }
            return left.sizeBytes < right.sizeBytes ? -1 : 1;
        case ModelLibraryQuery::SortKey::Category:
            return static_cast<int>(left.folderCategory) - static_cast<int>(right.folderCategory);
        case ModelLibraryQuery::SortKey::Name:
            break;
        }
        return collator.compare(left.displayName(), right.displayName());
    };

    auto compare = [&](const ModelFileRecord &left, const ModelFileRecord &right) {
        const int result = compareKey(left, right);
        if (result != 0) {
            return query.sortOrder == Qt::AscendingOrder ? result < 0 : result > 0;
        }
        if (left.path != right.path) {
            return left.path < right.path;
        }
        return left.fingerprint < right.fingerprint;
    };

    std::stable_sort(records.begin(), records.end(), compare);
}

QVector<ModelFileRecord> build(const QStringList &files, const ModelCacheStore &store, const ModelLibraryQuery &query)
{
    QVector<ModelFileRecord> records = merge(files, store);
    applyFilterAndSort(records, query);
    return records;
}

} // namespace ModelLibraryView
