
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

#include "ScanProgressReporter.h"

#include <QCoreApplication>
#include <QFileInfo>

namespace ScanProgressReporter {

/**
 * @brief Converts a snapshot into the poll response map.
 * @param progress Session snapshot.
 * @return Map with active, status, current, total, currentFile, errorCount, fatalError and elapsedMs.
 */
QVariantMap toVariantMap(const ScanProgress &progress)
{
    QVariantMap result;
    result.insert("active", progress.active);
    result.insert("status", ScanSession::statusName(progress.status));
    result.insert("current", progress.current);
    result.insert("total", progress.total);
    result.insert("currentFile", progress.currentFile);
    result.insert("errorCount", progress.errorCount);
    result.insert("fatalError", progress.fatalError);
    result.insert("elapsedMs", progress.elapsedMs);
    return result;
}

QJsonObject toJson(const ScanProgress &progress)
{
    return QJsonObject::fromVariantMap(toVariantMap(progress));
}

int percent(const ScanProgress &progress)
{
    if (progress.total <= 0) {
        return 0;
    }
    return static_cast<int>((static_cast<qint64>(progress.current) * 100) / progress.total);
}

/**
 * @brief Formats a snapshot as one human readable status line.
 * @param progress Session snapshot.
 * @return Status line.
 */
QString formatLine(const ScanProgress &progress)
{
    QString line = QStringLiteral("[%1] %2/%3 (%4%)")
        .arg(ScanSession::statusName(progress.status))
        .arg(progress.current)
        .arg(progress.total)
        .arg(percent(progress));
    if (progress.errorCount > 0) {
        line += QCoreApplication::translate("ScanProgressReporter", " errors: %1").arg(progress.errorCount);
    }
    line += QStringLiteral(" %1s").arg(progress.elapsedMs / 1000);
    if (!progress.currentFile.isEmpty()) {
        line += QStringLiteral(" %1").arg(QFileInfo(progress.currentFile).fileName());
    }
    if (!progress.fatalError.isEmpty()) {
        line += QStringLiteral(" - %1").arg(progress.fatalError);
    }
    return line;
}

} // namespace ScanProgressReporter
