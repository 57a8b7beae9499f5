/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef REMOTE_ENVELOPE_H
#define REMOTE_ENVELOPE_H

#include <QByteArray>
#include <QList>
#include <QString>

// Tag of status lines the remote side writes to its stderr
constexpr char ENVELOPE_STATUS_TAG[] = "@deltacapture-status";
constexpr char ENVELOPE_STATUS_UNAVAILABLE[] = "unavailable";
constexpr char ENVELOPE_STATUS_COMMAND_FAILED[] = "command-failed";

// Exit status of the remote shell when the codec is missing
constexpr int ENVELOPE_EXIT_UNAVAILABLE = 127;

// Exit status of a command killed by SIGPIPE: its reader, the delta, is gone
constexpr int ENVELOPE_EXIT_BROKEN_PIPE = 141;

// The signature stream is moved to this descriptor on the remote side
constexpr int ENVELOPE_SIGNATURE_FD = 3;

struct EnvelopeStep {
    enum Kind {
        RequireProgram,     // codec invocation must answer --version before any input is read
        RedirectSignature,  // stdin -> signature descriptor, empty stdin for the command
        RunCommand,         // the user's command, output is the new content
        CheckExit,          // abort the remote side on a non-zero exit
        ComputeDelta,       // codec delta of the command output against the signature
    };

    Kind kind;
    QString command;
};

struct RemoteStatus {
    enum Kind {
        None,
        Unavailable,
        CommandFailed,
    };

    Kind kind = None;
    int exitCode = 0;   // CommandFailed: exit status of the user's command
};

class RemoteEnvelope
{
public:
    RemoteEnvelope(const QString &remoteCommand, const QString &remoteCodec, bool checkExit);

    QList<EnvelopeStep> steps() const { return m_steps; }

    // POSIX sh script performing the steps in order
    QString script() const;

    // The script embedded as a single command line: sh -c '<script>'
    QString commandLine() const;

    // Whether text can be embedded between the envelope's quotes
    static bool isEmbeddable(const QString &text);

    // Parse one stderr line of the remote side. Returns false for lines that
    // are not status lines; those belong to the user.
    static bool parseStatusLine(const QByteArray &line, RemoteStatus &status);

private:
    QList<EnvelopeStep> m_steps;
};

#endif // REMOTE_ENVELOPE_H
