#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

class QSettings;

struct ScannerSettings {
    bool providerEnabled = true;
    QString providerBaseUrl = QStringLiteral("https://civitai.com/api/v1");
    QString providerApiKey;
    int requestTimeoutMs = 30000;
    int requestDelayMs = 2000;
    int maxRetries = 3;
    int backoffBaseMs = 5000;
    // Forwarded verbatim as request headers.
    QMap<QString, QString> providerHeaders;

    int maxConsecutiveFailures = 5;
    int notFoundBlacklistThreshold = 3;
    int checkpointInterval = 100;
    QStringList extensions;

    QString cacheDirectory;
    // Category name -> configured folders.
    QMap<QString, QStringList> modelRoots;

    QStringList allRoots() const;

    static ScannerSettings defaults();
    static ScannerSettings load(QSettings &settings);
    static ScannerSettings loadUserSettings();
    void save(QSettings &settings) const;
};
