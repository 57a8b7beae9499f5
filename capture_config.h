/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef CAPTURE_CONFIG_H
#define CAPTURE_CONFIG_H

#include <QMetaType>
#include <QString>
#include <QStringList>

class QCommandLineParser;

// Process exit codes
constexpr int CAPTURE_EXIT_SUCCESS = 0;
constexpr int CAPTURE_EXIT_FAILURE = 1;
constexpr int CAPTURE_EXIT_USAGE = 2;

constexpr char CAPTURE_TEMP_SUFFIX[] = ".tmp";
constexpr char CAPTURE_BACKUP_SUFFIX[] = ".bak";
constexpr char CAPTURE_DEFAULT_CODEC[] = "rdiff";
constexpr char CAPTURE_DEFAULT_PROGRESS[] = "pv";

// The remote envelope is embedded between single quotes
constexpr char CAPTURE_EMBED_DELIMITER = '\'';

enum class CaptureError {
    None,
    Configuration,
    RemoteUnavailable,
    RemoteCommandFailed,
    StreamBroken,
    Filesystem,
};

Q_DECLARE_METATYPE(CaptureError)

QString captureErrorName(CaptureError error);

struct CaptureConfig {
    bool backup = false;
    bool verbose = false;
    bool checkExit = false;
    bool dumb = false;
    int blockSize = 0;      // 0 = codec default
    int sumSize = 0;        // 0 = codec default
    QString codecArgs;      // forwarded verbatim to the local codec
    QString localCodec = QLatin1String(CAPTURE_DEFAULT_CODEC);
    QString progressProgram = QLatin1String(CAPTURE_DEFAULT_PROGRESS);   // used with verbose
    QString remoteCodec = QLatin1String(CAPTURE_DEFAULT_CODEC);
    QString remotePrefix;   // e.g. "ssh user@host"
    QString remoteCommand;
    QString destination;

    // Program and leading arguments of the local codec, including codecArgs
    // and the signature parameters.
    QStringList localCodecCommand() const;
    QStringList remotePrefixCommand() const;
};

enum class ParseResult {
    Ok,
    Error,
    Help,
    Version,
};

// Fill config from the command line. On Error, errorMessage says why.
ParseResult parseCaptureArguments(QCommandLineParser &parser,
                                  const QStringList &arguments,
                                  CaptureConfig &config,
                                  QString &errorMessage);

// Checks every precondition that must hold before any stage starts.
bool validateCaptureConfig(const CaptureConfig &config, QString &errorMessage);

// Resolve a program name through PATH, or check an explicit path.
QString findProgram(const QString &program);

#endif // CAPTURE_CONFIG_H
