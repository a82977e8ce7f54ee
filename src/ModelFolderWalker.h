#pragma once

#include <QString>
#include <QStringList>
#include <QVariantList>

#include <functional>

struct ScannerSettings;

namespace ModelFolderWalker {

struct WalkResult {
    // Normalized absolute paths, sorted and unique.
    QStringList files;
    QStringList skippedRoots;
    bool cancelled = false;
};

WalkResult walk(const QStringList &roots,
                const QStringList &extensions,
                const std::function<bool()> &isCancelled = {});
QStringList resolveRoots(const QStringList &requested, const ScannerSettings &settings);
QStringList existingRoots(const QStringList &roots);
bool containsModelFile(const QStringList &roots, const QStringList &extensions);
QVariantList availableFolders(const ScannerSettings &settings);

} // namespace ModelFolderWalker
