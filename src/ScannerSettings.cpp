
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

#include "ScannerSettings.h"

#include <QDir>
#include <QSettings>

#include "ModelPathUtils.h"
#include "PlatformUtils.h"

namespace {
constexpr char providerGroup[] = "provider";
constexpr char headersGroup[] = "headers";
constexpr char scanGroup[] = "scan";
constexpr char cacheGroup[] = "cache";
constexpr char rootsGroup[] = "roots";

int boundedInt(const QVariant &value, int fallback, int minimum)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed < minimum) {
        return fallback;
    }
    return parsed;
}
}

/**
 * @brief Returns every configured root folder, without duplicates, in category order.
 * @return Root folder paths.
 */
QStringList ScannerSettings::allRoots() const
{
    QStringList roots;
    for (auto it = modelRoots.constBegin(); it != modelRoots.constEnd(); ++it) {
        for (const QString &path : it.value()) {
            const QString normalized = PlatformUtils::normalizePath(path);
            if (!normalized.isEmpty() && !roots.contains(normalized)) {
                roots.append(normalized);
            }
        }
    }
    return roots;
}

/**
 * @brief Builds settings with the ComfyUI default model folders as roots.
 * @return Default settings.
 */
ScannerSettings ScannerSettings::defaults()
{
    ScannerSettings result;
    result.extensions = ModelPathUtils::defaultModelExtensions();
    result.cacheDirectory = PlatformUtils::defaultCacheDir();
    const QString modelsDir = PlatformUtils::comfyDefaultModelsDir();
    for (ModelPathUtils::FolderCategory category : ModelPathUtils::knownCategories()) {
        QStringList paths;
        for (const QString &folder : ModelPathUtils::categoryFolderNames(category)) {
            paths.append(QDir(modelsDir).filePath(folder));
        }
        result.modelRoots.insert(ModelPathUtils::categoryName(category), paths);
    }
    return result;
}

/**
 * @brief Reads settings, falling back to defaults for missing or invalid values.
 * @param settings Settings store to read.
 * @return Loaded settings.
 */
ScannerSettings ScannerSettings::load(QSettings &settings)
{
    ScannerSettings result = defaults();

    settings.beginGroup(QLatin1String(providerGroup));
    result.providerEnabled = settings.value("enabled", result.providerEnabled).toBool();
    result.providerBaseUrl = settings.value("baseUrl", result.providerBaseUrl).toString().trimmed();
    result.providerApiKey = settings.value("apiKey").toString().trimmed();
    result.requestTimeoutMs = boundedInt(settings.value("requestTimeoutMs"), result.requestTimeoutMs, 1);
    result.requestDelayMs = boundedInt(settings.value("requestDelayMs"), result.requestDelayMs, 0);
    result.maxRetries = boundedInt(settings.value("maxRetries"), result.maxRetries, 0);
    result.backoffBaseMs = boundedInt(settings.value("backoffBaseMs"), result.backoffBaseMs, 0);
    settings.beginGroup(QLatin1String(headersGroup));
    const QStringList headerKeys = settings.childKeys();
    for (const QString &key : headerKeys) {
        result.providerHeaders.insert(key, settings.value(key).toString());
    }
    settings.endGroup();
    settings.endGroup();

    settings.beginGroup(QLatin1String(scanGroup));
    result.maxConsecutiveFailures = boundedInt(settings.value("maxConsecutiveFailures"), result.maxConsecutiveFailures, 1);
    result.notFoundBlacklistThreshold = boundedInt(settings.value("notFoundBlacklistThreshold"), result.notFoundBlacklistThreshold, 0);
    result.checkpointInterval = boundedInt(settings.value("checkpointInterval"), result.checkpointInterval, 1);
    const QStringList extensions = settings.value("extensions").toStringList();
    if (!extensions.isEmpty()) {
        result.extensions = extensions;
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(cacheGroup));
    const QString cacheDirectory = settings.value("directory").toString().trimmed();
    if (!cacheDirectory.isEmpty()) {
        result.cacheDirectory = cacheDirectory;
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(rootsGroup));
    const QStringList categories = settings.childKeys();
    if (!categories.isEmpty()) {
        result.modelRoots.clear();
        for (const QString &category : categories) {
            result.modelRoots.insert(category, settings.value(category).toStringList());
        }
    }
    settings.endGroup();

    return result;
}

ScannerSettings ScannerSettings::loadUserSettings()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Modelman", "Modelman");
    return load(settings);
}

void ScannerSettings::save(QSettings &settings) const
{
    settings.beginGroup(QLatin1String(providerGroup));
    settings.setValue("enabled", providerEnabled);
    settings.setValue("baseUrl", providerBaseUrl);
    settings.setValue("apiKey", providerApiKey);
    settings.setValue("requestTimeoutMs", requestTimeoutMs);
    settings.setValue("requestDelayMs", requestDelayMs);
    settings.setValue("maxRetries", maxRetries);
    settings.setValue("backoffBaseMs", backoffBaseMs);
    settings.beginGroup(QLatin1String(headersGroup));
    settings.remove(QLatin1String(""));
    for (auto it = providerHeaders.constBegin(); it != providerHeaders.constEnd(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.endGroup();
    settings.endGroup();

    settings.beginGroup(QLatin1String(scanGroup));
    settings.setValue("maxConsecutiveFailures", maxConsecutiveFailures);
    settings.setValue("notFoundBlacklistThreshold", notFoundBlacklistThreshold);
    settings.setValue("checkpointInterval", checkpointInterval);
    settings.setValue("extensions", extensions);
    settings.endGroup();

    settings.beginGroup(QLatin1String(cacheGroup));
    settings.setValue("directory", cacheDirectory);
    settings.endGroup();

    settings.beginGroup(QLatin1String(rootsGroup));
    settings.remove(QLatin1String(""));
    for (auto it = modelRoots.constBegin(); it != modelRoots.constEnd(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.endGroup();
    settings.sync();
}
