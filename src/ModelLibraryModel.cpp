
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

#include "ModelLibraryModel.h"

#include "ModelCacheStore.h"

/**
 * @brief Creates the library model over a cache store.
 * @param store Cache store to read; must outlive the model.
 * @param parent Parent QObject for ownership.
 */
ModelLibraryModel::ModelLibraryModel(ModelCacheStore *store, QObject *parent)
    : QAbstractListModel(parent)
    , m_store(store)
{
}

ModelLibraryQuery ModelLibraryModel::query() const
{
    return m_query;
}

/**
 * @brief Replaces the filters and sort settings and rebuilds the rows.
 * @param query New query.
 */
void ModelLibraryModel::setQuery(const ModelLibraryQuery &query)
{
    m_query = query;
    emit queryChanged();
    refresh();
}

QString ModelLibraryModel::search() const
{
    return m_query.search;
}

void ModelLibraryModel::setSearch(const QString &search)
{
    if (m_query.search == search) {
        return;
    }
    m_query.search = search;
    emit queryChanged();
    refresh();
}

bool ModelLibraryModel::showBlacklisted() const
{
    return m_query.showBlacklisted;
}

void ModelLibraryModel::setShowBlacklisted(bool show)
{
    if (m_query.showBlacklisted == show) {
        return;
    }
    m_query.showBlacklisted = show;
    emit queryChanged();
    refresh();
}

/**
 * @brief Sets the files found on disk and rebuilds the rows.
 * @param files Walked file paths.
 */
void ModelLibraryModel::setFiles(const QStringList &files)
{
    m_files = files;
    refresh();
}

int ModelLibraryModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_records.size();
}

/**
 * @brief Returns data for the given index and role.
 * @param index Model index to query.
 * @param role Role to return.
 * @return Data for the role, or an invalid QVariant.
 */
QVariant ModelLibraryModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_records.size()) {
        return {};
    }

    const ModelFileRecord &record = m_records.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
    case DisplayNameRole:
        return record.displayName();
    case PathRole:
        return record.path;
    case FileNameRole:
        return record.fileName;
    case FingerprintRole:
        return record.fingerprint;
    case CategoryRole:
        return ModelPathUtils::categoryName(record.folderCategory);
    case CachedRole:
        return record.cached;
    case OrphanRole:
        return record.orphan;
    case SizeRole:
        return record.sizeBytes;
    case ModelNameRole:
        return record.entry ? record.entry->modelName() : QString();
    case VersionNameRole:
        return record.entry ? record.entry->versionName() : QString();
    case BaseModelRole:
        return record.entry ? record.entry->enrichment.value("baseModel").toString() : QString();
    case LastUsedRole:
        return record.lastUsedAt();
    case BlacklistedRole:
        return record.isBlacklisted();
    case UpdateAvailableRole:
        return record.hasUpdate();
    default:
        return {};
    }
}

QHash<int, QByteArray> ModelLibraryModel::roleNames() const
{
    return {
        {PathRole, "path"},
        {FileNameRole, "fileName"},
        {DisplayNameRole, "displayName"},
        {FingerprintRole, "fingerprint"},
        {CategoryRole, "category"},
        {CachedRole, "cached"},
        {OrphanRole, "orphan"},
        {SizeRole, "sizeBytes"},
        {ModelNameRole, "modelName"},
        {VersionNameRole, "versionName"},
        {BaseModelRole, "baseModel"},
        {LastUsedRole, "lastUsed"},
        {BlacklistedRole, "blacklisted"},
        {UpdateAvailableRole, "updateAvailable"}
    };
}

/**
 * @brief Rebuilds the rows from the files and the cache.
 */
void ModelLibraryModel::refresh()
{
    beginResetModel();
    m_records = ModelLibraryView::build(m_files, *m_store, m_query);
    endResetModel();
}

QString ModelLibraryModel::pathForRow(int row) const
{
    if (row < 0 || row >= m_records.size()) {
        return {};
    }
    return m_records.at(row).path;
}

/**
 * @brief Records that the model on a row was just used.
 * @param row Row index.
 * @return True when the cache knew the path.
 */
bool ModelLibraryModel::markUsed(int row)
{
    const QString path = pathForRow(row);
    if (path.isEmpty() || !m_store->touchByPath(path)) {
        return false;
    }
    refresh();
    return true;
}

/**
 * @brief Sets or clears the blacklist flag of the entry on a row.
 * @param row Row index.
 * @param blacklisted New flag value.
 * @return True when the row had a cached entry.
 */
bool ModelLibraryModel::setBlacklisted(int row, bool blacklisted)
{
    if (row < 0 || row >= m_records.size() || m_records.at(row).fingerprint.isEmpty()) {
        return false;
    }
    if (!m_store->setBlacklisted(m_records.at(row).fingerprint, blacklisted)) {
        return false;
    }
    refresh();
    return true;
}

const QVector<ModelFileRecord> &ModelLibraryModel::records() const
{
    return m_records;
}
