/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "capture_pipeline.h"
#include "failure_coordinator.h"
#include "testutils.h"

#include <QElapsedTimer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

using StageKind = CapturePipeline::StageKind;

class FailureCoordinatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDescribe();
    void testConnectTwice();
    void testSuccessfulChain();
    void testFailureAbortsChain();
    void testConcurrentFailuresReportedOnce();
    void testNonFatalExitIgnored();
    void testFailedToStart();
    void testRemoteStatusLine();
    void testFailureKind();
    void testStragglerKilledAfterGrace();
    void testFailReportedOnce();

private:
    QTemporaryDir m_dir;

    static int addShell(CapturePipeline &pipeline, const QString &name, const QString &script,
                        StageKind kind = StageKind::Local);
};

void FailureCoordinatorTest::initTestCase()
{
    qRegisterMetaType<CaptureError>();
    QVERIFY(m_dir.isValid());
}

int FailureCoordinatorTest::addShell(CapturePipeline &pipeline, const QString &name,
                                     const QString &script, StageKind kind)
{
    return pipeline.addStage(name, kind, QStringLiteral("sh"), {QStringLiteral("-c"), script});
}

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------

void FailureCoordinatorTest::testDescribe()
{
    CapturePipeline pipeline;
    const int a = addShell(pipeline, QStringLiteral("signature"), QStringLiteral("true"));
    const int b = addShell(pipeline, QStringLiteral("remote"), QStringLiteral("cat"), StageKind::Remote);
    QVERIFY(pipeline.connectStages(a, b));

    QCOMPARE(pipeline.stageCount(), 2);
    QCOMPARE(pipeline.describe(), QStringLiteral("signature | remote"));
    QCOMPARE(pipeline.channels().size(), 1);
    QCOMPARE(pipeline.indexOf(pipeline.stage(b).process), b);
}

void FailureCoordinatorTest::testConnectTwice()
{
    CapturePipeline pipeline;
    const int a = addShell(pipeline, QStringLiteral("a"), QStringLiteral("true"));
    const int b = addShell(pipeline, QStringLiteral("b"), QStringLiteral("cat"));
    const int c = addShell(pipeline, QStringLiteral("c"), QStringLiteral("cat"));

    QVERIFY(pipeline.connectStages(a, b));
    QVERIFY(!pipeline.connectStages(a, c));
    QVERIFY(!pipeline.connectStages(c, b));
    QVERIFY(!pipeline.connectStages(c, c));
    QVERIFY(!pipeline.connectStages(c, 7));
    QVERIFY(!pipeline.lastError().isEmpty());
}

// ---------------------------------------------------------------------------
// Supervision
// ---------------------------------------------------------------------------

void FailureCoordinatorTest::testSuccessfulChain()
{
    const QString output = m_dir.filePath(QStringLiteral("chain.txt"));

    CapturePipeline pipeline;
    const int source = addShell(pipeline, QStringLiteral("source"), QStringLiteral("printf hello"));
    const int sink = pipeline.addStage(QStringLiteral("sink"), StageKind::Local, QStringLiteral("cat"), {});
    QVERIFY(pipeline.connectStages(source, sink));
    pipeline.setOutputFile(sink, output);

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QVERIFY(coordinator.supervise(pipeline));
    QVERIFY(!coordinator.hasFailed());
    QCOMPARE(coordinator.error(), CaptureError::None);
    QCOMPARE(spy.count(), 0);
    QCOMPARE(TestUtils::readFile(output), QByteArrayLiteral("hello"));
}

void FailureCoordinatorTest::testFailureAbortsChain()
{
    CapturePipeline pipeline;
    const int source = pipeline.addStage(QStringLiteral("source"), StageKind::Local,
                                         QStringLiteral("sleep"), {QStringLiteral("30")});
    const int relay = pipeline.addStage(QStringLiteral("relay"), StageKind::Local, QStringLiteral("cat"), {});
    const int sink = addShell(pipeline, QStringLiteral("sink"), QStringLiteral("exit 4"));
    QVERIFY(pipeline.connectStages(source, relay));
    QVERIFY(pipeline.connectStages(relay, sink));

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!coordinator.supervise(pipeline));

    // The sleeping source must not hold the run open
    QVERIFY(timer.elapsed() < 10000);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).value<CaptureError>(), CaptureError::StreamBroken);
    QCOMPARE(coordinator.error(), CaptureError::StreamBroken);
    QCOMPARE(coordinator.failedStage(), QStringLiteral("sink"));
    for (int i = 0; i < pipeline.stageCount(); ++i) {
        QCOMPARE(pipeline.stage(i).process->state(), QProcess::NotRunning);
    }
}

void FailureCoordinatorTest::testConcurrentFailuresReportedOnce()
{
    CapturePipeline pipeline;
    addShell(pipeline, QStringLiteral("first"), QStringLiteral("exit 2"));
    addShell(pipeline, QStringLiteral("second"), QStringLiteral("exit 3"));

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QVERIFY(!coordinator.supervise(pipeline));
    QCOMPARE(spy.count(), 1);
    QVERIFY(coordinator.failedStage() == QStringLiteral("first")
            || coordinator.failedStage() == QStringLiteral("second"));
}

void FailureCoordinatorTest::testNonFatalExitIgnored()
{
    const QString output = m_dir.filePath(QStringLiteral("nonfatal.txt"));

    CapturePipeline pipeline;
    const int stage = addShell(pipeline, QStringLiteral("remote"), QStringLiteral("echo partial; exit 3"),
                               StageKind::Remote);
    pipeline.setExitCodeFatal(stage, false);
    pipeline.setOutputFile(stage, output);

    FailureCoordinator coordinator;
    QVERIFY(coordinator.supervise(pipeline));
    QCOMPARE(TestUtils::readFile(output), QByteArrayLiteral("partial\n"));
}

void FailureCoordinatorTest::testFailedToStart()
{
    CapturePipeline pipeline;
    const int missing = pipeline.addStage(QStringLiteral("patch"), StageKind::Local,
                                          m_dir.filePath(QStringLiteral("no-such-codec")), {});
    const int other = pipeline.addStage(QStringLiteral("waiting"), StageKind::Local,
                                        QStringLiteral("sleep"), {QStringLiteral("30")});
    Q_UNUSED(missing)
    Q_UNUSED(other)

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!coordinator.supervise(pipeline));
    QVERIFY(timer.elapsed() < 10000);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(coordinator.error(), CaptureError::Configuration);
    QCOMPARE(coordinator.failedStage(), QStringLiteral("patch"));
}

void FailureCoordinatorTest::testRemoteStatusLine()
{
    CapturePipeline pipeline;
    addShell(pipeline, QStringLiteral("remote"),
             QStringLiteral("echo 'ordinary diagnostic' >&2; "
                            "echo '@deltacapture-status unavailable' >&2; exit 127"),
             StageKind::Remote);

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QVERIFY(!coordinator.supervise(pipeline));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(coordinator.error(), CaptureError::RemoteUnavailable);
    QCOMPARE(coordinator.remoteStatus().kind, RemoteStatus::Unavailable);
    QCOMPARE(coordinator.failedStage(), QStringLiteral("remote"));
}

void FailureCoordinatorTest::testFailureKind()
{
    CapturePipeline pipeline;
    const int stage = addShell(pipeline, QStringLiteral("remote"), QStringLiteral("exit 4"),
                               StageKind::Remote);
    pipeline.setFailureKind(stage, CaptureError::RemoteCommandFailed);

    FailureCoordinator coordinator;
    QVERIFY(!coordinator.supervise(pipeline));
    QCOMPARE(coordinator.error(), CaptureError::RemoteCommandFailed);
    QCOMPARE(coordinator.remoteStatus().kind, RemoteStatus::None);
}

void FailureCoordinatorTest::testStragglerKilledAfterGrace()
{
    CapturePipeline pipeline;
    const int stubborn = addShell(pipeline, QStringLiteral("stubborn"),
                                  QStringLiteral("trap '' PIPE; exec sleep 30"));
    addShell(pipeline, QStringLiteral("failing"), QStringLiteral("sleep 0.2; exit 1"));

    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!coordinator.supervise(pipeline));
    const qint64 elapsed = timer.elapsed();

    QVERIFY(elapsed >= COORDINATOR_ABORT_GRACE_MS);
    QVERIFY(elapsed < 15000);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(coordinator.failedStage(), QStringLiteral("failing"));
    QCOMPARE(pipeline.stage(stubborn).process->state(), QProcess::NotRunning);
}

void FailureCoordinatorTest::testFailReportedOnce()
{
    FailureCoordinator coordinator;
    QSignalSpy spy(&coordinator, &FailureCoordinator::runFailed);

    coordinator.fail(CaptureError::Configuration, QStringLiteral("first"));
    coordinator.fail(CaptureError::Filesystem, QStringLiteral("second"));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(coordinator.error(), CaptureError::Configuration);
    QCOMPARE(coordinator.errorString(), QStringLiteral("first"));

    // A failed run never starts its stages
    CapturePipeline pipeline;
    addShell(pipeline, QStringLiteral("never"), QStringLiteral("true"));
    QVERIFY(!coordinator.supervise(pipeline));
    QCOMPARE(pipeline.stage(0).process->state(), QProcess::NotRunning);
    QCOMPARE(spy.count(), 1);
}

QTEST_GUILESS_MAIN(FailureCoordinatorTest)

#include "failurecoordinatortest.moc"
