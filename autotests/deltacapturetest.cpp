/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "delta_capture.h"
#include "testutils.h"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcess>
#include <QTemporaryDir>
#include <QTest>

// End-to-end runs. "sh -c" stands in for "ssh host", so the remote side is a
// local shell.
class DeltaCaptureTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testDumbCopy();
    void testDumbExitIgnoredWithoutCheck();
    void testDumbCheckExitKeepsDestination();
    void testDumbChannelFailureWarns();
    void testVerboseDumbCopy();

    void testDeltaCaptureWithBackup();
    void testDeltaCaptureEmptyBase();
    void testDeltaReplacesStaleTemp();
    void testCheckExitKeepsDestination();
    void testExitIgnoredWithoutCheck();
    void testRemoteCodecMissing();
    void testBrokenPatchAbortsRun();
    void testMissingLocalCodec();
    void testQuoteInCommand();
    void testDeltaDiesWithCheckExit();

    void testVerboseDeltaCapture();
    void testVerboseBrokenPatch();

    void testRdiffCapture();
    void testRdiffIdempotent();
    void testRdiffLargeChange();

private:
    QTemporaryDir m_tools;
    QString m_codec;
    QString m_brokenCodec;
    QString m_brokenDeltaCodec;
    QString m_progress;
    QTemporaryDir *m_dir = nullptr;
    QString m_destination;

    CaptureConfig deltaConfig(const QString &command) const;
    CaptureConfig dumbConfig(const QString &command) const;
    CaptureConfig rdiffConfig(const QString &command) const;
    CaptureConfig verbose(CaptureConfig config) const;
    static QByteArray runLocally(const QString &command);
};

void DeltaCaptureTest::initTestCase()
{
    qRegisterMetaType<CaptureError>();
    QVERIFY(m_tools.isValid());
    m_codec = m_tools.filePath(QStringLiteral("codec"));
    m_brokenCodec = m_tools.filePath(QStringLiteral("broken-codec"));
    QVERIFY(TestUtils::writeScript(m_codec, TestUtils::identityCodecScript()));
    QVERIFY(TestUtils::writeScript(m_brokenCodec, TestUtils::brokenPatchCodecScript()));
    m_brokenDeltaCodec = m_tools.filePath(QStringLiteral("broken-delta"));
    QVERIFY(TestUtils::writeScript(m_brokenDeltaCodec, TestUtils::brokenDeltaCodecScript()));
    m_progress = m_tools.filePath(QStringLiteral("progress"));
    QVERIFY(TestUtils::writeScript(m_progress, TestUtils::progressScript()));
}

void DeltaCaptureTest::init()
{
    m_dir = new QTemporaryDir;
    QVERIFY(m_dir->isValid());
    m_destination = m_dir->filePath(QStringLiteral("capture.txt"));
}

void DeltaCaptureTest::cleanup()
{
    QLoggingCategory::setFilterRules(QString());
    delete m_dir;
    m_dir = nullptr;
}

CaptureConfig DeltaCaptureTest::deltaConfig(const QString &command) const
{
    CaptureConfig config;
    config.remotePrefix = QStringLiteral("sh -c");
    config.remoteCommand = command;
    config.destination = m_destination;
    config.localCodec = m_codec;
    config.remoteCodec = m_codec;
    return config;
}

CaptureConfig DeltaCaptureTest::dumbConfig(const QString &command) const
{
    CaptureConfig config = deltaConfig(command);
    config.dumb = true;
    // Never consulted on the dumb path
    config.localCodec = m_tools.filePath(QStringLiteral("absent"));
    return config;
}

CaptureConfig DeltaCaptureTest::rdiffConfig(const QString &command) const
{
    CaptureConfig config;
    config.remotePrefix = QStringLiteral("sh -c");
    config.remoteCommand = command;
    config.destination = m_destination;
    config.backup = true;
    return config;
}

CaptureConfig DeltaCaptureTest::verbose(CaptureConfig config) const
{
    config.verbose = true;
    config.progressProgram = m_progress;
    QLoggingCategory::setFilterRules(QStringLiteral("deltacapture.info=true"));
    return config;
}

QByteArray DeltaCaptureTest::runLocally(const QString &command)
{
    QProcess process;
    process.start(QStringLiteral("sh"), {QStringLiteral("-c"), command});
    if (!process.waitForFinished(30000)) {
        return QByteArray();
    }
    return process.readAllStandardOutput();
}

// ---------------------------------------------------------------------------
// Dumb mode
// ---------------------------------------------------------------------------

void DeltaCaptureTest::testDumbCopy()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    DeltaCapture capture(dumbConfig(QStringLiteral("printf 'dumb copy'")));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(capture.error(), CaptureError::None);
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("dumb copy"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testDumbExitIgnoredWithoutCheck()
{
    DeltaCapture capture(dumbConfig(QStringLiteral("echo partial; exit 4")));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("partial\n"));
}

void DeltaCaptureTest::testDumbCheckExitKeepsDestination()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = dumbConfig(QStringLiteral("echo partial; exit 4"));
    config.checkExit = true;
    DeltaCapture capture(config);

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::RemoteCommandFailed);
    QCOMPARE(capture.failedStage(), QStringLiteral("remote"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testDumbChannelFailureWarns()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    // 255 is what ssh returns when the connection fails
    QTest::ignoreMessage(QtWarningMsg, "Remote side exited with status 255, keeping its output.");
    DeltaCapture capture(dumbConfig(QStringLiteral("exit 255")));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QVERIFY(TestUtils::readFile(m_destination).isEmpty());
}

void DeltaCaptureTest::testVerboseDumbCopy()
{
    const QString command = QStringLiteral("seq 1 20000");
    const QByteArray expected = runLocally(command);
    QVERIFY(!expected.isEmpty());
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    QTest::ignoreMessage(QtInfoMsg, qPrintable(QStringLiteral("Capture of %1 complete.").arg(m_destination)));
    DeltaCapture capture(verbose(dumbConfig(command)));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(TestUtils::readFile(m_destination), expected);
}

// ---------------------------------------------------------------------------
// Delta mode
// ---------------------------------------------------------------------------

void DeltaCaptureTest::testDeltaCaptureWithBackup()
{
    {
        CaptureConfig config = deltaConfig(QStringLiteral("printf \"hello world\""));
        config.backup = true;
        DeltaCapture capture(config);
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("hello world"));
    // Nothing to back up on the first run
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".bak")));

    {
        CaptureConfig config = deltaConfig(QStringLiteral("printf \"hello world!!\""));
        config.backup = true;
        DeltaCapture capture(config);
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("hello world!!"));
    QCOMPARE(TestUtils::readFile(m_destination + QStringLiteral(".bak")),
             QByteArrayLiteral("hello world"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testDeltaCaptureEmptyBase()
{
    QVERIFY(TestUtils::writeFile(m_destination, QByteArray()));

    CaptureConfig config = deltaConfig(QStringLiteral("echo first"));
    config.backup = true;
    DeltaCapture capture(config);
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("first\n"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".bak")));
}

void DeltaCaptureTest::testDeltaReplacesStaleTemp()
{
    QVERIFY(TestUtils::writeFile(m_destination + QStringLiteral(".tmp"), "left over from a crash"));

    DeltaCapture capture(deltaConfig(QStringLiteral("echo fresh")));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("fresh\n"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testCheckExitKeepsDestination()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = deltaConfig(QStringLiteral("echo partial; exit 3"));
    config.checkExit = true;
    DeltaCapture capture(config);

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::RemoteCommandFailed);
    QCOMPARE(capture.failedStage(), QStringLiteral("remote"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testExitIgnoredWithoutCheck()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    DeltaCapture capture(deltaConfig(QStringLiteral("echo partial; exit 3")));
    QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("partial\n"));
}

void DeltaCaptureTest::testRemoteCodecMissing()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = deltaConfig(QStringLiteral("echo hello"));
    config.remoteCodec = m_tools.filePath(QStringLiteral("not-installed"));
    DeltaCapture capture(config);

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::RemoteUnavailable);
    QCOMPARE(capture.failedStage(), QStringLiteral("remote"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testBrokenPatchAbortsRun()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = deltaConfig(QStringLiteral("sleep 20; echo late"));
    config.localCodec = m_brokenCodec;
    DeltaCapture capture(config);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!capture.run());

    // The slow remote command must not hold the run open
    QVERIFY(timer.elapsed() < 10000);
    QCOMPARE(capture.error(), CaptureError::StreamBroken);
    QCOMPARE(capture.failedStage(), QStringLiteral("patch"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testMissingLocalCodec()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = deltaConfig(QStringLiteral("echo hello"));
    config.localCodec = m_tools.filePath(QStringLiteral("not-installed"));
    DeltaCapture capture(config);

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::Configuration);
    QVERIFY(capture.failedStage().isEmpty());
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
}

void DeltaCaptureTest::testQuoteInCommand()
{
    DeltaCapture capture(deltaConfig(QStringLiteral("echo 'hello'")));

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::Configuration);
    QVERIFY(!QFileInfo::exists(m_destination));
}

void DeltaCaptureTest::testDeltaDiesWithCheckExit()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    // yes is killed by the broken pipe; that is not the command failing
    CaptureConfig config = deltaConfig(QStringLiteral("yes"));
    config.remoteCodec = m_brokenDeltaCodec;
    config.checkExit = true;
    DeltaCapture capture(config);

    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::StreamBroken);
    QCOMPARE(capture.failedStage(), QStringLiteral("remote"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

// ---------------------------------------------------------------------------
// Progress stages
// ---------------------------------------------------------------------------

void DeltaCaptureTest::testVerboseDeltaCapture()
{
    const QString command = QStringLiteral("seq 1 20000");
    const QByteArray expected = runLocally(command);
    QVERIFY(!expected.isEmpty());

    // Once without a base, once hashing the previous capture
    QVERIFY(!QFileInfo::exists(m_destination));
    for (int run = 0; run < 2; ++run) {
        QTest::ignoreMessage(QtInfoMsg, qPrintable(QStringLiteral("Capture of %1 complete.").arg(m_destination)));
        DeltaCapture capture(verbose(deltaConfig(command)));
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
        QCOMPARE(TestUtils::readFile(m_destination), expected);
    }
    QVERIFY(!QFileInfo::exists(m_destination + QStringLiteral(".tmp")));
}

void DeltaCaptureTest::testVerboseBrokenPatch()
{
    QVERIFY(TestUtils::writeFile(m_destination, "previous"));

    CaptureConfig config = verbose(deltaConfig(QStringLiteral("seq 1 20000")));
    config.localCodec = m_brokenCodec;
    DeltaCapture capture(config);

    QTest::ignoreMessage(QtInfoMsg,
                         qPrintable(QStringLiteral("Capture of %1 failed: stream broken.").arg(m_destination)));
    QVERIFY(!capture.run());
    QCOMPARE(capture.error(), CaptureError::StreamBroken);
    QCOMPARE(capture.failedStage(), QStringLiteral("patch"));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("previous"));
}

// ---------------------------------------------------------------------------
// Real codec
// ---------------------------------------------------------------------------

void DeltaCaptureTest::testRdiffCapture()
{
    if (findProgram(QStringLiteral("rdiff")).isEmpty()) {
        QSKIP("rdiff is not installed");
    }

    {
        DeltaCapture capture(rdiffConfig(QStringLiteral("echo hello")));
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("hello\n"));

    {
        DeltaCapture capture(rdiffConfig(QStringLiteral("echo hello world")));
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("hello world\n"));
    QCOMPARE(TestUtils::readFile(m_destination + QStringLiteral(".bak")), QByteArrayLiteral("hello\n"));
}

void DeltaCaptureTest::testRdiffIdempotent()
{
    if (findProgram(QStringLiteral("rdiff")).isEmpty()) {
        QSKIP("rdiff is not installed");
    }

    const QString command = QStringLiteral("seq 1 5000");
    for (int run = 0; run < 2; ++run) {
        DeltaCapture capture(rdiffConfig(command));
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    const QByteArray expected = runLocally(command);
    QVERIFY(!expected.isEmpty());
    QCOMPARE(TestUtils::readFile(m_destination), expected);
    QCOMPARE(TestUtils::readFile(m_destination + QStringLiteral(".bak")), expected);
}

void DeltaCaptureTest::testRdiffLargeChange()
{
    if (findProgram(QStringLiteral("rdiff")).isEmpty()) {
        QSKIP("rdiff is not installed");
    }

    const QString before = QStringLiteral("seq 1 50000");
    const QString after = QStringLiteral("seq 1 50000 | sed -e s/^2500$/changed/ -e /^40000$/d; seq 7 9");

    {
        CaptureConfig config = rdiffConfig(before);
        config.blockSize = 512;
        DeltaCapture capture(config);
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }
    {
        CaptureConfig config = rdiffConfig(after);
        config.blockSize = 512;
        config.checkExit = true;
        DeltaCapture capture(config);
        QVERIFY2(capture.run(), qPrintable(capture.errorString()));
    }

    QCOMPARE(TestUtils::readFile(m_destination), runLocally(after));
    QCOMPARE(TestUtils::readFile(m_destination + QStringLiteral(".bak")), runLocally(before));
}

QTEST_GUILESS_MAIN(DeltaCaptureTest)

#include "deltacapturetest.moc"
