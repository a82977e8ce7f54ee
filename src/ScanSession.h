#pragma once

#include <QAtomicInt>
#include <QDateTime>
#include <QElapsedTimer>
#include <QMutex>
#include <QString>

enum class ScanStatus {
    Idle = 0,
    Discovering,
    Scanning,
    Hashing,
    FetchingMetadata,
    Completed,
    Cancelled,
    Error
};

struct ScanProgress {
    bool active = false;
    ScanStatus status = ScanStatus::Idle;
    int current = 0;
    int total = 0;
    QString currentFile;
    int errorCount = 0;
    QString fatalError;
    qint64 elapsedMs = 0;
    QDateTime startedAt;
};

/**
 * @brief Mutable state of the current or last scan.
 *
 * Written by the scan worker, read through snapshot() from any thread.
 * The cancellation flag is the only field other parties may set.
 */
class ScanSession
{
public:
    ScanSession() = default;

    ScanProgress snapshot() const;
    ScanStatus status() const;
    bool isActive() const;

    void begin();
    void setStatus(ScanStatus status);
    void setTotal(int total);
    void setCurrentFile(const QString &path);
    void advance();
    void addError();
    void finish(ScanStatus status, const QString &fatalError = QString());
    void reset();

    void requestCancel();
    bool isCancelRequested() const;

    static bool isTerminal(ScanStatus status);
    static QString statusName(ScanStatus status);

private:
    mutable QMutex m_mutex;
    ScanStatus m_status = ScanStatus::Idle;
    int m_current = 0;
    int m_total = 0;
    QString m_currentFile;
    int m_errorCount = 0;
    QString m_fatalError;
    QDateTime m_startedAt;
    QElapsedTimer m_timer;
    qint64 m_finalElapsedMs = -1;
    QAtomicInt m_cancelRequested = 0;
};
