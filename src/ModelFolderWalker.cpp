
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

#include "ModelFolderWalker.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QVariantMap>

#include <algorithm>

#include "ModelPathUtils.h"
#include "ModelmanLogging.h"
#include "PlatformUtils.h"
#include "ScannerSettings.h"

namespace {
bool isUsableRoot(const QString &path)
{
    const QFileInfo info(path);
    return info.exists() && info.isDir() && info.isReadable();
}
}

namespace ModelFolderWalker {

/**
 * @brief Recursively lists model files below the given roots.
 * @param roots Root folders to walk; missing or unreadable ones are skipped.
 * @param extensions Accepted file extensions; empty for the default model extensions.
 * @param isCancelled Optional check polled between entries.
 * @return Sorted unique file paths and the roots that were skipped.
 */
WalkResult walk(const QStringList &roots,
                const QStringList &extensions,
                const std::function<bool()> &isCancelled)
{
    WalkResult result;
    QSet<QString> seen;
    const QStringList &accepted = extensions.isEmpty() ? ModelPathUtils::defaultModelExtensions() : extensions;

    for (const QString &root : roots) {
        const QString normalizedRoot = PlatformUtils::normalizePath(root);
        if (normalizedRoot.isEmpty()) {
            continue;
        }
        if (!isUsableRoot(normalizedRoot)) {
            qCInfo(lcWalker) << "Skipping missing or unreadable folder" << normalizedRoot;
            result.skippedRoots.append(normalizedRoot);
            continue;
        }

        QDirIterator it(normalizedRoot,
                        QDir::Files | QDir::NoDotAndDotDot | QDir::Readable,
                        QDirIterator::Subdirectories | QDirIterator::FollowSymlinks);
        while (it.hasNext()) {
            if (isCancelled && isCancelled()) {
                result.cancelled = true;
                return result;
            }
            const QString path = it.next();
            if (!ModelPathUtils::isModelFile(path, accepted)) {
                continue;
            }
            const QString canonical = QFileInfo(path).canonicalFilePath();
            const QString normalized = PlatformUtils::normalizePath(canonical.isEmpty() ? path : canonical);
            if (seen.contains(normalized)) {
                continue;
            }
            seen.insert(normalized);
            result.files.append(normalized);
        }
    }

    std::sort(result.files.begin(), result.files.end());
    qCDebug(lcWalker) << "Found" << result.files.size() << "model files in" << roots.size() << "folders";
    return result;
}

/**
 * @brief Expands a scan request into root folders.
 * @param requested Category names or folder paths; empty means every configured root.
 * @param settings Settings holding the configured roots.
 * @return Normalized root paths without duplicates.
 */
QStringList resolveRoots(const QStringList &requested, const ScannerSettings &settings)
{
    if (requested.isEmpty()) {
        return settings.allRoots();
    }

    QStringList roots;
    const auto append = [&roots](const QString &path) {
        const QString normalized = PlatformUtils::normalizePath(path);
        if (!normalized.isEmpty() && !roots.contains(normalized)) {
            roots.append(normalized);
        }
    };

    for (const QString &item : requested) {
        const QString key = item.trimmed();
        const ModelPathUtils::FolderCategory category = ModelPathUtils::categoryFromName(key);
        const QString name = category == ModelPathUtils::FolderCategory::Unknown
            ? key
            : ModelPathUtils::categoryName(category);
        if (settings.modelRoots.contains(name)) {
            for (const QString &path : settings.modelRoots.value(name)) {
                append(path);
            }
        } else {
            append(key);
        }
    }
    return roots;
}

/**
 * @brief Filters roots down to existing readable folders.
 * @param roots Candidate roots.
 * @return Roots that can be walked.
 */
QStringList existingRoots(const QStringList &roots)
{
    QStringList result;
    for (const QString &root : roots) {
        if (isUsableRoot(root)) {
            result.append(root);
        }
    }
    return result;
}

/**
 * @brief Tells whether any root holds at least one model file, stopping at the first one.
 * @param roots Root folders; missing or unreadable ones are ignored.
 * @param extensions Accepted file extensions; empty for the default model extensions.
 * @return True when a model file exists below one of the roots.
 */
bool containsModelFile(const QStringList &roots, const QStringList &extensions)
{
    const QStringList &accepted = extensions.isEmpty() ? ModelPathUtils::defaultModelExtensions() : extensions;
    for (const QString &root : roots) {
        const QString normalizedRoot = PlatformUtils::normalizePath(root);
        if (normalizedRoot.isEmpty() || !isUsableRoot(normalizedRoot)) {
            continue;
        }
        QDirIterator it(normalizedRoot,
                        QDir::Files | QDir::NoDotAndDotDot | QDir::Readable,
                        QDirIterator::Subdirectories | QDirIterator::FollowSymlinks);
        while (it.hasNext()) {
            if (ModelPathUtils::isModelFile(it.next(), accepted)) {
                return true;
            }
        }
    }
    return false;
}

/**
 * @brief Lists configured categories that currently hold model files.
 * @param settings Settings holding the configured roots.
 * @return One map per category with name, paths and count.
 */
QVariantList availableFolders(const ScannerSettings &settings)
{
    QVariantList folders;
    for (auto it = settings.modelRoots.constBegin(); it != settings.modelRoots.constEnd(); ++it) {
        QStringList paths;
        int count = 0;
        for (const QString &root : it.value()) {
            const WalkResult walked = walk({root}, settings.extensions);
            if (walked.files.isEmpty()) {
                continue;
            }
            paths.append(PlatformUtils::normalizePath(root));
            count += walked.files.size();
        }
        if (paths.isEmpty()) {
            continue;
        }
        QVariantMap folder;
        folder.insert("name", it.key());
        folder.insert("paths", paths);
        folder.insert("count", count);
        folders.append(folder);
    }
    return folders;
}

} // namespace ModelFolderWalker
