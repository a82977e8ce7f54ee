
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

#include "FingerprintUtils.h"

#include <QByteArray>
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QFile>

namespace FingerprintUtils {

/**
 * @brief Hashes a device from its current position to the end in bounded chunks.
 * @param device Open, readable device.
 * @return Fingerprint result; valid is false when a read fails.
 */
FingerprintResult computeFingerprint(QIODevice &device)
{
    FingerprintResult result;
    if (!device.isOpen() || !device.isReadable()) {
        result.error = QCoreApplication::translate("FingerprintUtils", "Device is not readable");
        return result;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer(static_cast<int>(chunkSize), Qt::Uninitialized);
    while (true) {
        const qint64 read = device.read(buffer.data(), chunkSize);
        if (read < 0) {
            result.error = QCoreApplication::translate("FingerprintUtils", "Read failed: %1")
                               .arg(device.errorString());
            return result;
        }
        if (read == 0) {
            if (!device.atEnd() && !device.isSequential()) {
                result.error = QCoreApplication::translate("FingerprintUtils", "Unexpected end of data");
                return result;
            }
            break;
        }
        hash.addData(QByteArrayView(buffer.constData(), read));
        result.bytesRead += read;
    }

    result.sha256 = QString::fromLatin1(hash.result().toHex());
    result.fingerprint = fingerprintFromDigest(result.sha256);
    result.valid = true;
    return result;
}

/**
 * @brief Opens a file and computes its content fingerprint.
 * @param path File to hash.
 * @return Fingerprint result; error names the path when the file cannot be read.
 */
FingerprintResult computeFileFingerprint(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        FingerprintResult result;
        result.error = QCoreApplication::translate("FingerprintUtils", "Cannot open %1: %2")
                           .arg(path, file.errorString());
        return result;
    }
    FingerprintResult result = computeFingerprint(file);
    if (!result.valid) {
        result.error = QStringLiteral("%1: %2").arg(path, result.error);
    }
    return result;
}

QString fingerprintFromDigest(const QString &sha256)
{
    return sha256.left(fingerprintLength).toLower();
}

} // namespace FingerprintUtils
