#pragma once

#include <QJsonObject>
#include <QString>
#include <QVariantMap>

#include "ScanSession.h"

namespace ScanProgressReporter {

QVariantMap toVariantMap(const ScanProgress &progress);
QJsonObject toJson(const ScanProgress &progress);
QString formatLine(const ScanProgress &progress);
int percent(const ScanProgress &progress);

} // namespace ScanProgressReporter
