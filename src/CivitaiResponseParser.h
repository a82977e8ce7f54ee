#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

class CivitaiResponseParser
{
public:
    static QJsonObject parseObject(const QByteArray &body, QString *error);
    static QJsonObject enrichmentFromVersion(const QJsonObject &version);
    static QString latestVersionId(const QJsonObject &model);
    static QString idToString(const QJsonValue &value);

private:
    static QJsonObject modelSummary(const QJsonObject &model);
    static QJsonArray imageSummaries(const QJsonArray &images);
};
