/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "capture_config.h"

#include <QCommandLineParser>
#include <QDir>
#include <QTemporaryDir>
#include <QTest>

class CaptureConfigTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDefaults();
    void testParseAllOptions();
    void testParseHelp();
    void testParseVersion();
    void testParseMissingArguments();
    void testParseInvalidSize_data();
    void testParseInvalidSize();
    void testOptionsAfterCommandArePositional();

    void testLocalCodecCommand();

    void testValidConfig();
    void testQuoteRejectedInDeltaMode();
    void testQuoteAllowedInDumbMode();
    void testMissingPrefixProgram();
    void testEmptyCommand();
    void testDestinationIsDirectory();
    void testDestinationDirectoryMissing();
    void testMissingLocalCodec();
    void testFindProgram();

private:
    QTemporaryDir m_dir;

    CaptureConfig validConfig() const;
    static QStringList commandLine(const QStringList &arguments);
};

void CaptureConfigTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
}

QStringList CaptureConfigTest::commandLine(const QStringList &arguments)
{
    return QStringList{QStringLiteral("deltacapture")} + arguments;
}

CaptureConfig CaptureConfigTest::validConfig() const
{
    CaptureConfig config;
    config.remotePrefix = QStringLiteral("sh -c");
    config.remoteCommand = QStringLiteral("echo hello");
    config.destination = m_dir.filePath(QStringLiteral("out.txt"));
    // Any installed program will do for the local codec check
    config.localCodec = QStringLiteral("sh");
    return config;
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

void CaptureConfigTest::testDefaults()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;

    const QStringList args = commandLine({QStringLiteral("ssh host"), QStringLiteral("dmesg"),
                                          QStringLiteral("dmesg.txt")});
    QCOMPARE(parseCaptureArguments(parser, args, config, error), ParseResult::Ok);
    QVERIFY(!config.backup);
    QVERIFY(!config.checkExit);
    QVERIFY(!config.verbose);
    QVERIFY(!config.dumb);
    QCOMPARE(config.blockSize, 0);
    QCOMPARE(config.sumSize, 0);
    QVERIFY(config.codecArgs.isEmpty());
    QCOMPARE(config.localCodec, QStringLiteral("rdiff"));
    QCOMPARE(config.remoteCodec, QStringLiteral("rdiff"));
    QCOMPARE(config.remotePrefix, QStringLiteral("ssh host"));
    QCOMPARE(config.remoteCommand, QStringLiteral("dmesg"));
    QCOMPARE(config.destination, QStringLiteral("dmesg.txt"));
}

void CaptureConfigTest::testParseAllOptions()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;

    const QStringList args = commandLine({QStringLiteral("-b"),
                                          QStringLiteral("--check-exit"),
                                          QStringLiteral("-v"),
                                          QStringLiteral("-d"),
                                          QStringLiteral("--codec-args=-s"),
                                          QStringLiteral("--remote-codec=/opt/bin/rdiff"),
                                          QStringLiteral("--block-size=4096"),
                                          QStringLiteral("--sum-size=8"),
                                          QStringLiteral("ssh -p 2222 root@backup"),
                                          QStringLiteral("cat /etc/fstab"),
                                          QStringLiteral("/tmp/fstab")});
    QCOMPARE(parseCaptureArguments(parser, args, config, error), ParseResult::Ok);
    QVERIFY(error.isEmpty());
    QVERIFY(config.backup);
    QVERIFY(config.checkExit);
    QVERIFY(config.verbose);
    QVERIFY(config.dumb);
    QCOMPARE(config.codecArgs, QStringLiteral("-s"));
    QCOMPARE(config.remoteCodec, QStringLiteral("/opt/bin/rdiff"));
    QCOMPARE(config.blockSize, 4096);
    QCOMPARE(config.sumSize, 8);
    QCOMPARE(config.remotePrefixCommand(),
             QStringList({QStringLiteral("ssh"), QStringLiteral("-p"), QStringLiteral("2222"),
                          QStringLiteral("root@backup")}));
    QCOMPARE(config.remoteCommand, QStringLiteral("cat /etc/fstab"));
    QCOMPARE(config.destination, QStringLiteral("/tmp/fstab"));
}

void CaptureConfigTest::testParseHelp()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;
    QCOMPARE(parseCaptureArguments(parser, commandLine({QStringLiteral("--help")}), config, error),
             ParseResult::Help);
}

void CaptureConfigTest::testParseVersion()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;
    QCOMPARE(parseCaptureArguments(parser, commandLine({QStringLiteral("--version")}), config, error),
             ParseResult::Version);
}

void CaptureConfigTest::testParseMissingArguments()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;

    const QStringList args = commandLine({QStringLiteral("-b"), QStringLiteral("ssh host"),
                                          QStringLiteral("dmesg")});
    QCOMPARE(parseCaptureArguments(parser, args, config, error), ParseResult::Error);
    QVERIFY(!error.isEmpty());
}

void CaptureConfigTest::testParseInvalidSize_data()
{
    QTest::addColumn<QString>("option");

    QTest::newRow("not a number") << QStringLiteral("--block-size=big");
    QTest::newRow("negative") << QStringLiteral("--sum-size=-4");
    QTest::newRow("unknown option") << QStringLiteral("--compress");
}

void CaptureConfigTest::testParseInvalidSize()
{
    QFETCH(QString, option);

    QCommandLineParser parser;
    CaptureConfig config;
    QString error;

    const QStringList args = commandLine({option, QStringLiteral("ssh host"), QStringLiteral("dmesg"),
                                          QStringLiteral("dmesg.txt")});
    QCOMPARE(parseCaptureArguments(parser, args, config, error), ParseResult::Error);
    QVERIFY(!error.isEmpty());
}

void CaptureConfigTest::testOptionsAfterCommandArePositional()
{
    QCommandLineParser parser;
    CaptureConfig config;
    QString error;

    const QStringList args = commandLine({QStringLiteral("ssh host"), QStringLiteral("-v"),
                                          QStringLiteral("out.txt")});
    QCOMPARE(parseCaptureArguments(parser, args, config, error), ParseResult::Ok);
    QVERIFY(!config.verbose);
    QCOMPARE(config.remoteCommand, QStringLiteral("-v"));
}

// ---------------------------------------------------------------------------
// Derived values
// ---------------------------------------------------------------------------

void CaptureConfigTest::testLocalCodecCommand()
{
    CaptureConfig config;
    QCOMPARE(config.localCodecCommand(), QStringList{QStringLiteral("rdiff")});

    config.codecArgs = QStringLiteral("-s --force");
    config.blockSize = 1024;
    config.sumSize = 12;
    QCOMPARE(config.localCodecCommand(),
             QStringList({QStringLiteral("rdiff"), QStringLiteral("-s"), QStringLiteral("--force"),
                          QStringLiteral("-b"), QStringLiteral("1024"),
                          QStringLiteral("-S"), QStringLiteral("12")}));
}

// ---------------------------------------------------------------------------
// Preconditions
// ---------------------------------------------------------------------------

void CaptureConfigTest::testValidConfig()
{
    QString error;
    QVERIFY2(validateCaptureConfig(validConfig(), error), qPrintable(error));
}

void CaptureConfigTest::testQuoteRejectedInDeltaMode()
{
    CaptureConfig config = validConfig();
    config.remoteCommand = QStringLiteral("echo 'hello'");

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));
    QVERIFY(!error.isEmpty());

    config = validConfig();
    config.remoteCodec = QStringLiteral("'rdiff'");
    QVERIFY(!validateCaptureConfig(config, error));
}

void CaptureConfigTest::testQuoteAllowedInDumbMode()
{
    CaptureConfig config = validConfig();
    config.dumb = true;
    config.remoteCommand = QStringLiteral("echo 'hello'");

    QString error;
    QVERIFY2(validateCaptureConfig(config, error), qPrintable(error));
}

void CaptureConfigTest::testMissingPrefixProgram()
{
    CaptureConfig config = validConfig();
    config.remotePrefix = m_dir.filePath(QStringLiteral("no-such-ssh")) + QStringLiteral(" host");

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));

    config.remotePrefix.clear();
    QVERIFY(!validateCaptureConfig(config, error));
}

void CaptureConfigTest::testEmptyCommand()
{
    CaptureConfig config = validConfig();
    config.remoteCommand = QStringLiteral("   ");

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));
}

void CaptureConfigTest::testDestinationIsDirectory()
{
    CaptureConfig config = validConfig();
    config.destination = m_dir.path();

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));
}

void CaptureConfigTest::testDestinationDirectoryMissing()
{
    CaptureConfig config = validConfig();
    config.destination = m_dir.filePath(QStringLiteral("missing/out.txt"));

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));
}

void CaptureConfigTest::testMissingLocalCodec()
{
    CaptureConfig config = validConfig();
    config.localCodec = m_dir.filePath(QStringLiteral("no-such-rdiff"));

    QString error;
    QVERIFY(!validateCaptureConfig(config, error));

    // The dumb path never runs the codec
    config.dumb = true;
    QVERIFY2(validateCaptureConfig(config, error), qPrintable(error));
}

void CaptureConfigTest::testFindProgram()
{
    QVERIFY(!findProgram(QStringLiteral("sh")).isEmpty());
    QVERIFY(findProgram(QString()).isEmpty());
    QVERIFY(findProgram(m_dir.filePath(QStringLiteral("nothing"))).isEmpty());
    // A directory is not a program
    QVERIFY(findProgram(m_dir.path()).isEmpty());
}

QTEST_GUILESS_MAIN(CaptureConfigTest)

#include "captureconfigtest.moc"
