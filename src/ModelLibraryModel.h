#pragma once

#include <QAbstractListModel>
#include <QStringList>
#include <QVector>

#include "ModelLibraryView.h"

class ModelCacheStore;

class ModelLibraryModel : public QAbstractListModel
{
    Q_OBJECT
    Q_PROPERTY(QString search READ search WRITE setSearch NOTIFY queryChanged)
    Q_PROPERTY(bool showBlacklisted READ showBlacklisted WRITE setShowBlacklisted NOTIFY queryChanged)

public:
    enum Role {
        PathRole = Qt::UserRole + 1,
        FileNameRole,
        DisplayNameRole,
        FingerprintRole,
        CategoryRole,
        CachedRole,
        OrphanRole,
        SizeRole,
        ModelNameRole,
        VersionNameRole,
        BaseModelRole,
        LastUsedRole,
        BlacklistedRole,
        UpdateAvailableRole
    };

    explicit ModelLibraryModel(ModelCacheStore *store, QObject *parent = nullptr);

    ModelLibraryQuery query() const;
    void setQuery(const ModelLibraryQuery &query);

    QString search() const;
    void setSearch(const QString &search);

    bool showBlacklisted() const;
    void setShowBlacklisted(bool show);

    void setFiles(const QStringList &files);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE void refresh();
    Q_INVOKABLE QString pathForRow(int row) const;
    Q_INVOKABLE bool markUsed(int row);
    Q_INVOKABLE bool setBlacklisted(int row, bool blacklisted);

    const QVector<ModelFileRecord> &records() const;

signals:
    void queryChanged();

private:
    ModelCacheStore *m_store = nullptr;
    QStringList m_files;
    ModelLibraryQuery m_query;
    QVector<ModelFileRecord> m_records;
};
