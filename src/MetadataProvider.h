#pragma once

#include <QJsonObject>
#include <QString>

#include <functional>

struct MetadataFetchRequest {
    QString fingerprint;
    // Catalog version id from an earlier lookup, used when the hash is unknown.
    QString knownVersionId;
    std::function<bool()> isCancelled;
};

struct MetadataFetchResult {
    enum class Status {
        Found = 0,
        NotFound,
        NetworkError,
        Cancelled
    };

    Status status = Status::NetworkError;
    QJsonObject enrichment;
    bool updateAvailable = false;
    int httpStatus = 0;
    QString error;
};

/**
 * @brief Source of enrichment metadata keyed by content fingerprint.
 *
 * Implementations may block; callers invoke fetch() from a worker thread and
 * one request at a time.
 */
class MetadataProvider
{
public:
    virtual ~MetadataProvider() = default;

    virtual MetadataFetchResult fetch(const MetadataFetchRequest &request) = 0;
};
