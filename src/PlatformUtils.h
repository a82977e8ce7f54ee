#pragma once

#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
QString comfyDefaultModelsDir();
QString defaultCacheDir();
bool copyToTimestampedBackup(const QString &path, const QString &suffix, QString *backupPath, QString *error);
bool pruneBackups(const QString &directory, const QString &prefix, int maxBackups, int *removed, QString *error);

} // namespace PlatformUtils
