/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "capture_config.h"
#include "deltacapture_debug.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <KLocalizedString>

#include <fcntl.h>

QString captureErrorName(CaptureError error)
{
    switch (error) {
    case CaptureError::None:
        return QStringLiteral("none");
    case CaptureError::Configuration:
        return QStringLiteral("configuration error");
    case CaptureError::RemoteUnavailable:
        return QStringLiteral("remote codec unavailable");
    case CaptureError::RemoteCommandFailed:
        return QStringLiteral("remote command failed");
    case CaptureError::StreamBroken:
        return QStringLiteral("stream broken");
    case CaptureError::Filesystem:
        return QStringLiteral("filesystem error");
    }
    return QString();
}

// ---------------------------------------------------------------------------
// CaptureConfig
// ---------------------------------------------------------------------------

QStringList CaptureConfig::localCodecCommand() const
{
    QStringList command = QProcess::splitCommand(localCodec);
    command += QProcess::splitCommand(codecArgs);
    if (blockSize > 0) {
        command << QStringLiteral("-b") << QString::number(blockSize);
    }
    if (sumSize > 0) {
        command << QStringLiteral("-S") << QString::number(sumSize);
    }
    return command;
}

QStringList CaptureConfig::remotePrefixCommand() const
{
    return QProcess::splitCommand(remotePrefix);
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

static bool parseSize(const QCommandLineParser &parser, const QCommandLineOption &option,
                      int &value, QString &errorMessage)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const QString text = parser.value(option);
    const int parsed = text.toInt(&ok);
    if (!ok || parsed < 0) {
        errorMessage = i18n("Invalid value for --%1: %2", option.names().constLast(), text);
        return false;
    }
    value = parsed;
    return true;
}

ParseResult parseCaptureArguments(QCommandLineParser &parser,
                                  const QStringList &arguments,
                                  CaptureConfig &config,
                                  QString &errorMessage)
{
    parser.setApplicationDescription(
        i18n("Capture the output of a remote command into a local file, "
             "transferring only the differences to the previous content."));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

    const QCommandLineOption helpOption = parser.addHelpOption();
    // addVersionOption() would claim -v, which is --verbose here
    const QCommandLineOption versionOption(QStringLiteral("version"),
                                           i18n("Displays version information."));

    const QCommandLineOption backupOption(
        {QStringLiteral("b"), QStringLiteral("backup")},
        i18n("Keep the previous content of the destination in <destination>%1.",
             QLatin1String(CAPTURE_BACKUP_SUFFIX)));
    const QCommandLineOption checkExitOption(
        {QStringLiteral("c"), QStringLiteral("check-exit")},
        i18n("Fail when the remote command exits with a non-zero status."));
    const QCommandLineOption verboseOption(
        {QStringLiteral("v"), QStringLiteral("verbose")},
        i18n("Show transfer progress and a final status line."));
    const QCommandLineOption dumbOption(
        {QStringLiteral("d"), QStringLiteral("dumb")},
        i18n("Copy the whole output without using the delta codec."));
    const QCommandLineOption codecArgsOption(
        QStringLiteral("codec-args"),
        i18n("Extra arguments for the local %1 invocations.", QLatin1String(CAPTURE_DEFAULT_CODEC)),
        i18n("args"));
    const QCommandLineOption remoteCodecOption(
        QStringLiteral("remote-codec"),
        i18n("Command that runs %1 on the remote host.", QLatin1String(CAPTURE_DEFAULT_CODEC)),
        i18n("command"),
        QLatin1String(CAPTURE_DEFAULT_CODEC));
    const QCommandLineOption blockSizeOption(
        QStringLiteral("block-size"),
        i18n("Signature block size in bytes."),
        i18n("bytes"));
    const QCommandLineOption sumSizeOption(
        QStringLiteral("sum-size"),
        i18n("Signature strong checksum size in bytes."),
        i18n("bytes"));

    parser.addOptions({versionOption, backupOption, checkExitOption, verboseOption, dumbOption,
                       codecArgsOption, remoteCodecOption, blockSizeOption, sumSizeOption});

    parser.addPositionalArgument(QStringLiteral("prefix"),
                                 i18n("Command prefix that runs a command line on the remote host, "
                                      "for example \"ssh user@host\"."));
    parser.addPositionalArgument(QStringLiteral("command"),
                                 i18n("Command to run on the remote host."));
    parser.addPositionalArgument(QStringLiteral("destination"),
                                 i18n("Local file that receives the command output."));

    if (!parser.parse(arguments)) {
        errorMessage = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet(helpOption)) {
        return ParseResult::Help;
    }
    if (parser.isSet(versionOption)) {
        return ParseResult::Version;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 3) {
        errorMessage = i18n("Expected a remote prefix, a remote command and a destination, got %1 arguments.",
                            positional.size());
        return ParseResult::Error;
    }

    config.backup = parser.isSet(backupOption);
    config.checkExit = parser.isSet(checkExitOption);
    config.verbose = parser.isSet(verboseOption);
    config.dumb = parser.isSet(dumbOption);
    config.codecArgs = parser.value(codecArgsOption);
    config.remoteCodec = parser.value(remoteCodecOption);
    if (!parseSize(parser, blockSizeOption, config.blockSize, errorMessage)
        || !parseSize(parser, sumSizeOption, config.sumSize, errorMessage)) {
        return ParseResult::Error;
    }

    config.remotePrefix = positional.at(0);
    config.remoteCommand = positional.at(1);
    config.destination = positional.at(2);
    return ParseResult::Ok;
}

// ---------------------------------------------------------------------------
// Preconditions
// ---------------------------------------------------------------------------

QString findProgram(const QString &program)
{
    if (program.isEmpty()) {
        return QString();
    }
    if (program.contains(QLatin1Char('/'))) {
        const QFileInfo info(program);
        if (info.isFile() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
        return QString();
    }
    return QStandardPaths::findExecutable(program);
}

static bool standardStreamsOpen()
{
    for (int fd = 0; fd <= 2; ++fd) {
        if (::fcntl(fd, F_GETFD) == -1) {
            return false;
        }
    }
    return true;
}

bool validateCaptureConfig(const CaptureConfig &config, QString &errorMessage)
{
    if (!standardStreamsOpen()) {
        errorMessage = i18n("Standard input, output and error must be open.");
        return false;
    }

    const QStringList prefix = config.remotePrefixCommand();
    if (prefix.isEmpty()) {
        errorMessage = i18n("The remote command prefix is empty.");
        return false;
    }
    if (findProgram(prefix.first()).isEmpty()) {
        errorMessage = i18n("Cannot find the remote channel program \"%1\".", prefix.first());
        return false;
    }

    if (config.remoteCommand.trimmed().isEmpty()) {
        errorMessage = i18n("The remote command is empty.");
        return false;
    }

    if (config.destination.isEmpty()) {
        errorMessage = i18n("The destination path is empty.");
        return false;
    }
    const QFileInfo destination(config.destination);
    if (destination.isDir()) {
        errorMessage = i18n("The destination %1 is a directory.", config.destination);
        return false;
    }
    if (!destination.absoluteDir().exists()) {
        errorMessage = i18n("The directory of %1 does not exist.", config.destination);
        return false;
    }

    if (config.blockSize < 0 || config.sumSize < 0) {
        errorMessage = i18n("Signature block and checksum sizes must not be negative.");
        return false;
    }

    if (config.dumb) {
        return true;
    }

    const QStringList codec = config.localCodecCommand();
    if (codec.isEmpty() || findProgram(codec.first()).isEmpty()) {
        errorMessage = i18n("Cannot find the local delta codec \"%1\".", config.localCodec);
        return false;
    }

    if (QProcess::splitCommand(config.remoteCodec).isEmpty()) {
        errorMessage = i18n("The remote codec invocation is empty.");
        return false;
    }
    if (config.remoteCommand.contains(QLatin1Char(CAPTURE_EMBED_DELIMITER))) {
        errorMessage = i18n("The remote command must not contain the %1 character.",
                            QString(QLatin1Char(CAPTURE_EMBED_DELIMITER)));
        return false;
    }
    if (config.remoteCodec.contains(QLatin1Char(CAPTURE_EMBED_DELIMITER))) {
        errorMessage = i18n("The remote codec invocation must not contain the %1 character.",
                            QString(QLatin1Char(CAPTURE_EMBED_DELIMITER)));
        return false;
    }

    qCDebug(DELTACAPTURE_LOG) << "Configuration valid, local codec:" << codec
                              << "remote codec:" << config.remoteCodec;
    return true;
}
