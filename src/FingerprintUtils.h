#pragma once

#include <QString>

class QIODevice;

namespace FingerprintUtils {

struct FingerprintResult {
    bool valid = false;
    QString fingerprint;
    QString sha256;
    qint64 bytesRead = 0;
    QString error;
};

constexpr qint64 chunkSize = 1024 * 1024;
constexpr int fingerprintLength = 10;

FingerprintResult computeFingerprint(QIODevice &device);
FingerprintResult computeFileFingerprint(const QString &path);
QString fingerprintFromDigest(const QString &sha256);

} // namespace FingerprintUtils
