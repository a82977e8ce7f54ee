
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

#include "ModelPathUtils.h"

#include <QDir>
#include <QFileInfo>

namespace {

struct CategoryFolders {
    ModelPathUtils::FolderCategory category;
    const char *canonical;
    QStringList aliases;
};

// Priority order matters: the first category with a matching segment wins.
const QList<CategoryFolders> &categoryTable()
{
    static const QList<CategoryFolders> table = {
        {ModelPathUtils::FolderCategory::Checkpoints, "checkpoints", {}},
        {ModelPathUtils::FolderCategory::Loras, "loras", {}},
        {ModelPathUtils::FolderCategory::Vae, "vae", {QStringLiteral("vae_approx")}},
        {ModelPathUtils::FolderCategory::TextEncoders, "text_encoders", {QStringLiteral("clip"), QStringLiteral("t5")}},
        {ModelPathUtils::FolderCategory::DiffusionModels, "diffusion_models", {QStringLiteral("unet")}},
    };
    return table;
}

QStringList pathSegments(const QString &path)
{
    QString normalized = path;
    normalized.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return normalized.split(QLatin1Char('/'), Qt::SkipEmptyParts);
}

bool segmentMatches(const QString &segment, const CategoryFolders &folders)
{
    if (segment.compare(QLatin1String(folders.canonical), Qt::CaseInsensitive) == 0) {
        return true;
    }
    for (const QString &alias : folders.aliases) {
        if (segment.compare(alias, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace ModelPathUtils {

/**
 * @brief Classifies a model path by the category folder it lives under.
 * @param path File path, absolute or relative, with either separator style.
 * @return Matching category, or Unknown when no segment names a category folder.
 */
FolderCategory folderCategoryForPath(const QString &path)
{
    const QStringList segments = pathSegments(path);
    if (segments.size() < 2) {
        return FolderCategory::Unknown;
    }
    // The last segment is the file name and never names a folder.
    const QStringList folders = segments.mid(0, segments.size() - 1);
    for (const CategoryFolders &entry : categoryTable()) {
        for (const QString &segment : folders) {
            if (segmentMatches(segment, entry)) {
                return entry.category;
            }
        }
    }
    return FolderCategory::Unknown;
}

QString categoryName(FolderCategory category)
{
    for (const CategoryFolders &entry : categoryTable()) {
        if (entry.category == category) {
            return QString::fromLatin1(entry.canonical);
        }
    }
    return QStringLiteral("unknown");
}

FolderCategory categoryFromName(const QString &name)
{
    const QString trimmed = name.trimmed();
    for (const CategoryFolders &entry : categoryTable()) {
        if (segmentMatches(trimmed, entry)) {
            return entry.category;
        }
    }
    return FolderCategory::Unknown;
}

/**
 * @brief Returns the canonical folder name followed by its aliases.
 * @param category Category to describe.
 * @return Folder names recognized for the category, empty for Unknown.
 */
QStringList categoryFolderNames(FolderCategory category)
{
    for (const CategoryFolders &entry : categoryTable()) {
        if (entry.category == category) {
            QStringList names{QString::fromLatin1(entry.canonical)};
            names.append(entry.aliases);
            return names;
        }
    }
    return QStringList();
}

QList<FolderCategory> knownCategories()
{
    QList<FolderCategory> categories;
    for (const CategoryFolders &entry : categoryTable()) {
        categories.append(entry.category);
    }
    return categories;
}

const QStringList &defaultModelExtensions()
{
    static const QStringList extensions = {
        QStringLiteral("ckpt"),
        QStringLiteral("pt"),
        QStringLiteral("pt2"),
        QStringLiteral("bin"),
        QStringLiteral("pth"),
        QStringLiteral("safetensors"),
        QStringLiteral("pkl"),
        QStringLiteral("sft"),
        QStringLiteral("gguf"),
        QStringLiteral("nf4"),
    };
    return extensions;
}

bool isModelFile(const QString &path)
{
    return isModelFile(path, defaultModelExtensions());
}

/**
 * @brief Checks a path's suffix against a list of model extensions.
 * @param path File path to inspect.
 * @param extensions Lowercase extensions, with or without a leading dot.
 * @return True when the last suffix matches one of the extensions.
 */
bool isModelFile(const QString &path, const QStringList &extensions)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix.isEmpty()) {
        return false;
    }
    for (const QString &extension : extensions) {
        QString normalized = extension.trimmed().toLower();
        if (normalized.startsWith(QLatin1Char('.'))) {
            normalized.remove(0, 1);
        }
        if (normalized == suffix) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Strips everything up to and including the category folder.
 * @param path Model file path.
 * @return Path below the category folder, or the file name when the path is unclassified.
 */
QString relativeModelPath(const QString &path)
{
    const QStringList segments = pathSegments(path);
    if (segments.isEmpty()) {
        return QString();
    }
    const FolderCategory category = folderCategoryForPath(path);
    if (category != FolderCategory::Unknown) {
        for (const CategoryFolders &entry : categoryTable()) {
            if (entry.category != category) {
                continue;
            }
            for (int i = 0; i < segments.size() - 1; ++i) {
                if (segmentMatches(segments.at(i), entry)) {
                    return segments.mid(i + 1).join(QLatin1Char('/'));
                }
            }
        }
    }
    return segments.last();
}

} // namespace ModelPathUtils
