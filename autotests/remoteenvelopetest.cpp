/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "remote_envelope.h"
#include "testutils.h"

#include <QProcess>
#include <QTemporaryDir>
#include <QTest>

class RemoteEnvelopeTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testSteps();
    void testStepsWithExitCheck();
    void testCodecProgram();
    void testCommandLine();
    void testEmbeddable();
    void testParseStatusLine_data();
    void testParseStatusLine();

    void testScriptComputesDelta();
    void testScriptReportsMissingCodec();
    void testScriptReportsFailedCommand();
    void testScriptIgnoresExitWithoutCheck();
    void testScriptChecksWrappedCodec();
    void testScriptReportsMissingWrappedCodec();
    void testScriptKeepsCommandBlamelessWhenDeltaDies();

private:
    QTemporaryDir m_dir;
    QString m_codec;
    QString m_brokenDeltaCodec;

    // First status line in the remote side's stderr, if any
    static bool findStatus(const QByteArray &standardError, RemoteStatus &status);

    // Run the envelope script locally with signature on stdin
    bool runScript(const RemoteEnvelope &envelope, const QByteArray &signature,
                   QProcess &process);
};

void RemoteEnvelopeTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_codec = m_dir.filePath(QStringLiteral("codec"));
    QVERIFY(TestUtils::writeScript(m_codec, TestUtils::identityCodecScript()));
    m_brokenDeltaCodec = m_dir.filePath(QStringLiteral("broken-delta"));
    QVERIFY(TestUtils::writeScript(m_brokenDeltaCodec, TestUtils::brokenDeltaCodecScript()));
}

bool RemoteEnvelopeTest::findStatus(const QByteArray &standardError, RemoteStatus &status)
{
    const QList<QByteArray> lines = standardError.split('\n');
    for (const QByteArray &line : lines) {
        if (RemoteEnvelope::parseStatusLine(line, status)) {
            return true;
        }
    }
    return false;
}

bool RemoteEnvelopeTest::runScript(const RemoteEnvelope &envelope, const QByteArray &signature,
                                   QProcess &process)
{
    process.setProgram(QStringLiteral("sh"));
    process.setArguments({QStringLiteral("-c"), envelope.script()});
    process.start();
    if (!process.waitForStarted()) {
        return false;
    }
    process.write(signature);
    process.closeWriteChannel();
    return process.waitForFinished(10000);
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

void RemoteEnvelopeTest::testSteps()
{
    const RemoteEnvelope envelope(QStringLiteral("cat /var/log/syslog"), QStringLiteral("rdiff"), false);
    const QList<EnvelopeStep> steps = envelope.steps();

    QCOMPARE(steps.size(), 4);
    QCOMPARE(steps.at(0).kind, EnvelopeStep::RequireProgram);
    QCOMPARE(steps.at(1).kind, EnvelopeStep::RedirectSignature);
    QCOMPARE(steps.at(2).kind, EnvelopeStep::RunCommand);
    QCOMPARE(steps.at(2).command, QStringLiteral("cat /var/log/syslog"));
    QCOMPARE(steps.at(3).kind, EnvelopeStep::ComputeDelta);
    QCOMPARE(steps.at(3).command, QStringLiteral("rdiff delta /dev/fd/3 - -"));
}

void RemoteEnvelopeTest::testStepsWithExitCheck()
{
    const RemoteEnvelope envelope(QStringLiteral("dmesg"), QStringLiteral("rdiff"), true);
    const QList<EnvelopeStep> steps = envelope.steps();

    QCOMPARE(steps.size(), 5);
    QCOMPARE(steps.at(2).kind, EnvelopeStep::RunCommand);
    QCOMPARE(steps.at(3).kind, EnvelopeStep::CheckExit);
    QCOMPARE(steps.at(4).kind, EnvelopeStep::ComputeDelta);
}

void RemoteEnvelopeTest::testCodecProgram()
{
    const RemoteEnvelope envelope(QStringLiteral("dmesg"), QStringLiteral(" /opt/bin/rdiff -s "), false);
    const QList<EnvelopeStep> steps = envelope.steps();

    QCOMPARE(steps.first().command, QStringLiteral("/opt/bin/rdiff -s"));
    QCOMPARE(steps.last().command, QStringLiteral("/opt/bin/rdiff -s delta /dev/fd/3 - -"));
}

void RemoteEnvelopeTest::testCommandLine()
{
    const RemoteEnvelope envelope(QStringLiteral("uptime"), QStringLiteral("rdiff"), true);
    const QString line = envelope.commandLine();

    QVERIFY(line.startsWith(QStringLiteral("sh -c '")));
    QVERIFY(line.endsWith(QLatin1Char('\'')));
    QCOMPARE(line.count(QLatin1Char('\'')), 2);
    QVERIFY(line.contains(QStringLiteral("uptime")));
    QVERIFY(line.contains(QLatin1String(ENVELOPE_STATUS_TAG)));
}

void RemoteEnvelopeTest::testEmbeddable()
{
    QVERIFY(RemoteEnvelope::isEmbeddable(QStringLiteral("cat \"/tmp/a b\" | grep -v x")));
    QVERIFY(!RemoteEnvelope::isEmbeddable(QStringLiteral("echo 'quoted'")));
}

void RemoteEnvelopeTest::testParseStatusLine_data()
{
    QTest::addColumn<QByteArray>("line");
    QTest::addColumn<bool>("isStatus");
    QTest::addColumn<int>("kind");
    QTest::addColumn<int>("exitCode");

    QTest::newRow("unavailable") << QByteArray("@deltacapture-status unavailable\n") << true
                                 << int(RemoteStatus::Unavailable) << ENVELOPE_EXIT_UNAVAILABLE;
    QTest::newRow("command failed") << QByteArray("@deltacapture-status command-failed 42\n") << true
                                    << int(RemoteStatus::CommandFailed) << 42;
    QTest::newRow("no exit code") << QByteArray("@deltacapture-status command-failed") << true
                                  << int(RemoteStatus::CommandFailed) << 0;
    QTest::newRow("unknown kind") << QByteArray("@deltacapture-status weather sunny\n") << true
                                  << int(RemoteStatus::None) << 0;
    QTest::newRow("user line") << QByteArray("grep: /etc/shadow: Permission denied\n") << false
                               << int(RemoteStatus::None) << 0;
    QTest::newRow("tag inside text") << QByteArray("saw @deltacapture-status unavailable\n") << false
                                     << int(RemoteStatus::None) << 0;
    QTest::newRow("longer tag") << QByteArray("@deltacapture-statusx unavailable\n") << false
                                << int(RemoteStatus::None) << 0;
}

void RemoteEnvelopeTest::testParseStatusLine()
{
    QFETCH(QByteArray, line);
    QFETCH(bool, isStatus);
    QFETCH(int, kind);
    QFETCH(int, exitCode);

    RemoteStatus status;
    QCOMPARE(RemoteEnvelope::parseStatusLine(line, status), isStatus);
    QCOMPARE(int(status.kind), kind);
    QCOMPARE(status.exitCode, exitCode);
}

// ---------------------------------------------------------------------------
// Behaviour of the generated script
// ---------------------------------------------------------------------------

void RemoteEnvelopeTest::testScriptComputesDelta()
{
    // The command must not see the signature on its stdin
    const RemoteEnvelope envelope(QStringLiteral("echo hello; cat"), m_codec, false);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), 0);
    QCOMPARE(process.readAllStandardOutput(), QByteArrayLiteral("hello\n"));
    QVERIFY(process.readAllStandardError().isEmpty());
}

void RemoteEnvelopeTest::testScriptReportsMissingCodec()
{
    const RemoteEnvelope envelope(QStringLiteral("echo hello"),
                                  m_dir.filePath(QStringLiteral("missing")), true);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), ENVELOPE_EXIT_UNAVAILABLE);
    QVERIFY(process.readAllStandardOutput().isEmpty());

    RemoteStatus status;
    QVERIFY(RemoteEnvelope::parseStatusLine(process.readAllStandardError(), status));
    QCOMPARE(status.kind, RemoteStatus::Unavailable);
}

void RemoteEnvelopeTest::testScriptReportsFailedCommand()
{
    const RemoteEnvelope envelope(QStringLiteral("echo partial; exit 3"), m_codec, true);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    // The shell terminates itself so the channel cannot look successful
    QCOMPARE(process.exitStatus(), QProcess::CrashExit);

    RemoteStatus status;
    QVERIFY(findStatus(process.readAllStandardError(), status));
    QCOMPARE(status.kind, RemoteStatus::CommandFailed);
    QCOMPARE(status.exitCode, 3);
}

void RemoteEnvelopeTest::testScriptIgnoresExitWithoutCheck()
{
    const RemoteEnvelope envelope(QStringLiteral("echo partial; exit 3"), m_codec, false);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), 0);
    QCOMPARE(process.readAllStandardOutput(), QByteArrayLiteral("partial\n"));
}

void RemoteEnvelopeTest::testScriptChecksWrappedCodec()
{
    const RemoteEnvelope envelope(QStringLiteral("echo wrapped"),
                                  QStringLiteral("nice -n5 ") + m_codec, true);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), 0);
    QCOMPARE(process.readAllStandardOutput(), QByteArrayLiteral("wrapped\n"));
}

void RemoteEnvelopeTest::testScriptReportsMissingWrappedCodec()
{
    // The wrapper exists; the codec behind it does not
    const RemoteEnvelope envelope(QStringLiteral("echo wrapped"),
                                  QStringLiteral("nice -n5 ") + m_dir.filePath(QStringLiteral("missing")),
                                  false);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), ENVELOPE_EXIT_UNAVAILABLE);
    QVERIFY(process.readAllStandardOutput().isEmpty());

    RemoteStatus status;
    QVERIFY(findStatus(process.readAllStandardError(), status));
    QCOMPARE(status.kind, RemoteStatus::Unavailable);
}

void RemoteEnvelopeTest::testScriptKeepsCommandBlamelessWhenDeltaDies()
{
    // yes only stops when its reader goes away
    const RemoteEnvelope envelope(QStringLiteral("yes"), m_brokenDeltaCodec, true);
    QProcess process;
    QVERIFY(runScript(envelope, QByteArrayLiteral("SIG"), process));

    // The channel fails with the delta's status, and no command failure is reported
    QCOMPARE(process.exitStatus(), QProcess::NormalExit);
    QCOMPARE(process.exitCode(), 4);

    RemoteStatus status;
    QVERIFY(!findStatus(process.readAllStandardError(), status));
}

QTEST_GUILESS_MAIN(RemoteEnvelopeTest)

#include "remoteenvelopetest.moc"
