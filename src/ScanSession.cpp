
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

#include "ScanSession.h"

#include <QMutexLocker>

/**
 * @brief Copies the session fields under the lock.
 * @return Consistent progress snapshot.
 */
ScanProgress ScanSession::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    ScanProgress progress;
    progress.active = m_status != ScanStatus::Idle && !isTerminal(m_status);
    progress.status = m_status;
    progress.current = m_current;
    progress.total = m_total;
    progress.currentFile = m_currentFile;
    progress.errorCount = m_errorCount;
    progress.fatalError = m_fatalError;
    progress.startedAt = m_startedAt;
    if (m_finalElapsedMs >= 0) {
        progress.elapsedMs = m_finalElapsedMs;
    } else if (m_timer.isValid()) {
        progress.elapsedMs = m_timer.elapsed();
    }
    return progress;
}

ScanStatus ScanSession::status() const
{
    QMutexLocker locker(&m_mutex);
    return m_status;
}

bool ScanSession::isActive() const
{
    QMutexLocker locker(&m_mutex);
    return m_status != ScanStatus::Idle && !isTerminal(m_status);
}

/**
 * @brief Starts a new session in the discovering state, replacing any terminal one.
 */
void ScanSession::begin()
{
    QMutexLocker locker(&m_mutex);
    m_status = ScanStatus::Discovering;
    m_current = 0;
    m_total = 0;
    m_currentFile.clear();
    m_errorCount = 0;
    m_fatalError.clear();
    m_startedAt = QDateTime::currentDateTime();
    m_timer.start();
    m_finalElapsedMs = -1;
    m_cancelRequested.storeRelaxed(0);
}

void ScanSession::setStatus(ScanStatus status)
{
    QMutexLocker locker(&m_mutex);
    if (isTerminal(m_status)) {
        return;
    }
    m_status = status;
}

void ScanSession::setTotal(int total)
{
    QMutexLocker locker(&m_mutex);
    m_total = qMax(0, total);
    m_current = qMin(m_current, m_total);
}

void ScanSession::setCurrentFile(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_currentFile = path;
}

/**
 * @brief Counts one more processed file, never past the total.
 */
void ScanSession::advance()
{
    QMutexLocker locker(&m_mutex);
    if (m_current < m_total) {
        m_current += 1;
    }
}

void ScanSession::addError()
{
    QMutexLocker locker(&m_mutex);
    m_errorCount += 1;
}

/**
 * @brief Moves the session to a terminal state and freezes the elapsed time.
 * @param status Completed, Cancelled or Error.
 * @param fatalError Summary for the Error state.
 */
void ScanSession::finish(ScanStatus status, const QString &fatalError)
{
    QMutexLocker locker(&m_mutex);
    if (isTerminal(m_status)) {
        return;
    }
    m_status = status;
    m_currentFile.clear();
    if (status == ScanStatus::Error) {
        m_fatalError = fatalError;
    }
    m_finalElapsedMs = m_timer.isValid() ? m_timer.elapsed() : 0;
}

/**
 * @brief Acknowledges a terminal session and returns to idle.
 */
void ScanSession::reset()
{
    QMutexLocker locker(&m_mutex);
    m_status = ScanStatus::Idle;
    m_current = 0;
    m_total = 0;
    m_currentFile.clear();
    m_errorCount = 0;
    m_fatalError.clear();
    m_startedAt = QDateTime();
    m_timer.invalidate();
    m_finalElapsedMs = -1;
    m_cancelRequested.storeRelaxed(0);
}

void ScanSession::requestCancel()
{
    m_cancelRequested.storeRelaxed(1);
}

bool ScanSession::isCancelRequested() const
{
    return m_cancelRequested.loadRelaxed() != 0;
}

bool ScanSession::isTerminal(ScanStatus status)
{
    return status == ScanStatus::Completed
        || status == ScanStatus::Cancelled
        || status == ScanStatus::Error;
}

/**
 * @brief Returns the wire name of a status.
 * @param status Session status.
 * @return Lowercase status name.
 */
QString ScanSession::statusName(ScanStatus status)
{
    switch (status) {
    case ScanStatus::Idle:
        return QStringLiteral("idle");
    case ScanStatus::Discovering:
        return QStringLiteral("discovering");
    case ScanStatus::Scanning:
        return QStringLiteral("scanning");
    case ScanStatus::Hashing:
        return QStringLiteral("hashing");
    case ScanStatus::FetchingMetadata:
        return QStringLiteral("fetching-metadata");
    case ScanStatus::Completed:
        return QStringLiteral("completed");
    case ScanStatus::Cancelled:
        return QStringLiteral("cancelled");
    case ScanStatus::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("idle");
}
