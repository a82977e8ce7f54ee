
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

#include "CivitaiResponseParser.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

/**
 * @brief Parses a response body that must hold a JSON object.
 * @param body Raw response body.
 * @param error Optional output error message.
 * @return Parsed object, or an empty object on failure.
 */
QJsonObject CivitaiResponseParser::parseObject(const QByteArray &body, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QCoreApplication::translate("CivitaiResponseParser", "Invalid catalog JSON: %1")
                .arg(parseError.error != QJsonParseError::NoError
                         ? parseError.errorString()
                         : QCoreApplication::translate("CivitaiResponseParser", "not an object"));
        }
        return {};
    }
    return doc.object();
}

/**
 * @brief Reduces a model-version payload to the fields kept in the cache.
 * @param version Model-version object returned by the catalog.
 * @return Enrichment object with name, ids, model summary, words, files and images.
 */
QJsonObject CivitaiResponseParser::enrichmentFromVersion(const QJsonObject &version)
{
    QJsonObject enrichment;
    enrichment.insert("name", version.value("name").toString());
    enrichment.insert("baseModel", version.value("baseModel").toString());
    enrichment.insert("id", version.value("id"));
    enrichment.insert("modelId", version.value("modelId"));
    enrichment.insert("model", modelSummary(version.value("model").toObject()));
    enrichment.insert("trainedWords", version.value("trainedWords").toArray());
    enrichment.insert("downloadUrl", version.value("downloadUrl").toString());
    enrichment.insert("createdAt", version.value("createdAt").toString());

    const QJsonArray files = version.value("files").toArray();
    QJsonObject hashes;
    if (!files.isEmpty()) {
        hashes = files.first().toObject().value("hashes").toObject();
    }
    enrichment.insert("hashes", hashes);
    enrichment.insert("images", imageSummaries(version.value("images").toArray()));
    return enrichment;
}

/**
 * @brief Picks the newest published, public version of a model.
 * @param model Model object with a modelVersions array.
 * @return Version id, or an empty string when the model lists no versions.
 */
QString CivitaiResponseParser::latestVersionId(const QJsonObject &model)
{
    const QJsonArray versions = model.value("modelVersions").toArray();
    QString latestId;
    QDateTime latestDate;
    for (const QJsonValue &value : versions) {
        const QJsonObject version = value.toObject();
        const QString status = version.value("status").toString("Published");
        const QString availability = version.value("availability").toString("Public");
        if (status != "Published" || availability != "Public") {
            continue;
        }
        const QDateTime created = QDateTime::fromString(version.value("createdAt").toString(), Qt::ISODateWithMs);
        if (latestId.isEmpty() || (created.isValid() && (!latestDate.isValid() || created > latestDate))) {
            latestId = idToString(version.value("id"));
            latestDate = created;
        }
    }
    if (latestId.isEmpty() && !versions.isEmpty()) {
        // The catalog lists versions newest first.
        latestId = idToString(versions.first().toObject().value("id"));
    }
    return latestId;
}

QString CivitaiResponseParser::idToString(const QJsonValue &value)
{
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return value.toString();
}

QJsonObject CivitaiResponseParser::modelSummary(const QJsonObject &model)
{
    QJsonObject summary;
    summary.insert("name", model.value("name").toString());
    summary.insert("type", model.value("type").toString());
    summary.insert("nsfw", model.value("nsfw").toBool());
    summary.insert("poi", model.value("poi").toBool());
    return summary;
}

QJsonArray CivitaiResponseParser::imageSummaries(const QJsonArray &images)
{
    QJsonArray summaries;
    for (const QJsonValue &value : images) {
        const QJsonObject image = value.toObject();
        const QString url = image.value("url").toString();
        if (url.isEmpty()) {
            continue;
        }
        QJsonObject summary;
        summary.insert("url", url);
        summary.insert("nsfwLevel", image.value("nsfwLevel").toInt());
        summary.insert("width", image.value("width").toInt());
        summary.insert("height", image.value("height").toInt());
        summaries.append(summary);
    }
    return summaries;
}
