#pragma once

#include <QString>
#include <QStringList>

namespace ModelPathUtils {

enum class FolderCategory {
    Checkpoints = 0,
    Loras,
    Vae,
    TextEncoders,
    DiffusionModels,
    Unknown
};

FolderCategory folderCategoryForPath(const QString &path);
QString categoryName(FolderCategory category);
FolderCategory categoryFromName(const QString &name);
QStringList categoryFolderNames(FolderCategory category);
QList<FolderCategory> knownCategories();

const QStringList &defaultModelExtensions();
bool isModelFile(const QString &path);
bool isModelFile(const QString &path, const QStringList &extensions);
QString relativeModelPath(const QString &path);

} // namespace ModelPathUtils
