
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

// =============================================================================
// Unit tests for ScanSession and ScanProgressReporter
// =============================================================================
#include <gtest/gtest.h>

#include <QJsonObject>
#include <QThread>

#include "ScanProgressReporter.h"
#include "ScanSession.h"

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
TEST(ScanSessionTest, StartsIdle) {
    ScanSession session;
    const ScanProgress progress = session.snapshot();
    EXPECT_FALSE(progress.active);
    EXPECT_EQ(progress.status, ScanStatus::Idle);
    EXPECT_EQ(progress.current, 0);
    EXPECT_EQ(progress.total, 0);
    EXPECT_EQ(progress.elapsedMs, 0);
}

TEST(ScanSessionTest, BeginMakesSessionActive) {
    ScanSession session;
    session.requestCancel();
    session.begin();
    EXPECT_TRUE(session.isActive());
    EXPECT_EQ(session.status(), ScanStatus::Discovering);
    EXPECT_FALSE(session.isCancelRequested());
    EXPECT_TRUE(session.snapshot().startedAt.isValid());
}

TEST(ScanSessionTest, CurrentNeverExceedsTotal) {
    ScanSession session;
    session.begin();
    session.setTotal(2);
    session.advance();
    session.advance();
    session.advance();
    EXPECT_EQ(session.snapshot().current, 2);
}

TEST(ScanSessionTest, TerminalStateIsSticky) {
    ScanSession session;
    session.begin();
    session.setCurrentFile("/m/a.safetensors");
    session.finish(ScanStatus::Error, "boom");
    session.setStatus(ScanStatus::Scanning);
    session.finish(ScanStatus::Completed);

    const ScanProgress progress = session.snapshot();
    EXPECT_EQ(progress.status, ScanStatus::Error);
    EXPECT_EQ(progress.fatalError, "boom");
    EXPECT_TRUE(progress.currentFile.isEmpty());
    EXPECT_FALSE(progress.active);
}

TEST(ScanSessionTest, ElapsedTimeFreezesWhenFinished) {
    ScanSession session;
    session.begin();
    QThread::msleep(20);
    session.finish(ScanStatus::Completed);
    const qint64 frozen = session.snapshot().elapsedMs;
    EXPECT_GE(frozen, 15);
    QThread::msleep(20);
    EXPECT_EQ(session.snapshot().elapsedMs, frozen);
}

TEST(ScanSessionTest, ResetReturnsToIdle) {
    ScanSession session;
    session.begin();
    session.setTotal(3);
    session.addError();
    session.finish(ScanStatus::Cancelled);
    session.reset();

    const ScanProgress progress = session.snapshot();
    EXPECT_EQ(progress.status, ScanStatus::Idle);
    EXPECT_EQ(progress.errorCount, 0);
    EXPECT_EQ(progress.total, 0);
    EXPECT_FALSE(progress.startedAt.isValid());
}

TEST(ScanSessionTest, StatusNames) {
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Idle), "idle");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Discovering), "discovering");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Scanning), "scanning");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Hashing), "hashing");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::FetchingMetadata), "fetching-metadata");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Completed), "completed");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Cancelled), "cancelled");
    EXPECT_EQ(ScanSession::statusName(ScanStatus::Error), "error");
    EXPECT_TRUE(ScanSession::isTerminal(ScanStatus::Cancelled));
    EXPECT_FALSE(ScanSession::isTerminal(ScanStatus::Hashing));
}

// ---------------------------------------------------------------------------
// Reporter
// ---------------------------------------------------------------------------
TEST(ScanProgressReporterTest, PollResponseHasAllFields) {
    ScanProgress progress;
    progress.active = true;
    progress.status = ScanStatus::Hashing;
    progress.current = 4;
    progress.total = 8;
    progress.currentFile = "/m/loras/a.safetensors";
    progress.errorCount = 1;
    progress.elapsedMs = 1500;

    const QVariantMap map = ScanProgressReporter::toVariantMap(progress);
    EXPECT_TRUE(map.value("active").toBool());
    EXPECT_EQ(map.value("status").toString(), "hashing");
    EXPECT_EQ(map.value("current").toInt(), 4);
    EXPECT_EQ(map.value("total").toInt(), 8);
    EXPECT_EQ(map.value("currentFile").toString(), "/m/loras/a.safetensors");
    EXPECT_EQ(map.value("errorCount").toInt(), 1);
    EXPECT_TRUE(map.value("fatalError").toString().isEmpty());
    EXPECT_EQ(map.value("elapsedMs").toLongLong(), 1500);

    const QJsonObject json = ScanProgressReporter::toJson(progress);
    EXPECT_EQ(json.value("status").toString(), "hashing");
    EXPECT_EQ(json.value("current").toInt(), 4);
}

TEST(ScanProgressReporterTest, FormatsStatusLine) {
    ScanProgress progress;
    progress.status = ScanStatus::Scanning;
    progress.current = 1;
    progress.total = 4;
    progress.currentFile = "/m/loras/a.safetensors";
    progress.elapsedMs = 2500;

    EXPECT_EQ(ScanProgressReporter::percent(progress), 25);
    EXPECT_EQ(ScanProgressReporter::formatLine(progress), "[scanning] 1/4 (25%) 2s a.safetensors");

    progress.total = 0;
    EXPECT_EQ(ScanProgressReporter::percent(progress), 0);
}
