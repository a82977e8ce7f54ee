
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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QStandardPaths>

namespace PlatformUtils {

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward separators, or an empty string for empty input.
 */
QString normalizePath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    QString normalized = QDir::fromNativeSeparators(trimmed);
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Returns the default ComfyUI models folder for the current platform.
 * @return Default models folder path.
 */
QString comfyDefaultModelsDir()
{
#ifdef Q_OS_WIN
    const QString documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    const QString base = documents.isEmpty() ? QDir::home().filePath("Documents") : documents;
    return QDir(base).filePath("ComfyUI/models");
#else
    return QDir::home().filePath("ComfyUI/models");
#endif
}

/**
 * @brief Returns the folder holding the model cache files.
 * @return Application data folder, or a folder below the home directory when none is available.
 */
QString defaultCacheDir()
{
    const QString location = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!location.isEmpty()) {
        return location;
    }
    return QDir::home().filePath(".modelman");
}

/**
 * @brief Copies a file next to itself with a suffix and a timestamp in its name.
 * @param path File to back up.
 * @param suffix Label inserted between the base name and the timestamp.
 * @param backupPath Optional output path of the created copy.
 * @param error Optional output error message.
 * @return True when the copy was written, false otherwise.
 */
bool copyToTimestampedBackup(const QString &path, const QString &suffix, QString *backupPath, QString *error)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    const QString stamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-ddTHH-mm-ss"));
    QString targetPath = info.dir().filePath(QStringLiteral("%1-%2-%3.%4")
                                                 .arg(info.completeBaseName(), suffix, stamp, info.suffix()));
    int attempt = 1;
    while (QFileInfo::exists(targetPath)) {
        targetPath = info.dir().filePath(QStringLiteral("%1-%2-%3-%4.%5")
                                             .arg(info.completeBaseName(), suffix, stamp)
                                             .arg(attempt)
                                             .arg(info.suffix()));
        attempt += 1;
    }
    if (!QFile::copy(path, targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Backup failed");
        }
        return false;
    }
    if (backupPath) {
        *backupPath = targetPath;
    }
    return true;
}

/**
 * @brief Removes duplicate and surplus backups, newest first.
 * @param directory Folder holding the backups.
 * @param prefix File name prefix shared by the backups of one file.
 * @param maxBackups Number of distinct backups to keep; 0 or less keeps them all.
 * @param removed Optional output count of deleted files.
 * @param error Optional output error message for the first failure.
 * @return True when every file that had to go was deleted.
 */
bool pruneBackups(const QString &directory, const QString &prefix, int maxBackups, int *removed, QString *error)
{
    const QFileInfoList backups = QDir(directory).entryInfoList({prefix + QStringLiteral("*.json")},
                                                                QDir::Files,
                                                                QDir::Time);
    bool ok = true;
    int removedCount = 0;
    int kept = 0;
    QSet<QByteArray> seen;
    for (const QFileInfo &info : backups) {
        QFile file(info.filePath());
        if (!file.open(QIODevice::ReadOnly)) {
            if (ok && error) {
                *error = QCoreApplication::translate("PlatformUtils", "Unable to read %1: %2")
                             .arg(info.filePath(), file.errorString());
            }
            ok = false;
            continue;
        }
        QCryptographicHash hash(QCryptographicHash::Sha256);
        hash.addData(&file);
        file.close();

        const QByteArray digest = hash.result();
        const bool duplicate = seen.contains(digest);
        seen.insert(digest);
        if (!duplicate && (maxBackups <= 0 || kept < maxBackups)) {
            kept += 1;
            continue;
        }
        if (!QFile::remove(info.filePath())) {
            if (ok && error) {
                *error = QCoreApplication::translate("PlatformUtils", "Unable to remove %1").arg(info.filePath());
            }
            ok = false;
            continue;
        }
        removedCount += 1;
    }
    if (removed) {
        *removed = removedCount;
    }
    return ok;
}

} // namespace PlatformUtils
