/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "remote_envelope.h"
#include "capture_config.h"

#include <QStringList>

RemoteEnvelope::RemoteEnvelope(const QString &remoteCommand, const QString &remoteCodec,
                               bool checkExit)
{
    // The whole invocation must answer --version, so a wrapper such as
    // "nice -n5 rdiff" cannot hide a missing rdiff.
    const QString codec = remoteCodec.trimmed();

    m_steps.append({EnvelopeStep::RequireProgram, codec});
    m_steps.append({EnvelopeStep::RedirectSignature, QString()});
    m_steps.append({EnvelopeStep::RunCommand, remoteCommand});
    if (checkExit) {
        m_steps.append({EnvelopeStep::CheckExit, QString()});
    }
    m_steps.append({EnvelopeStep::ComputeDelta,
                    QStringLiteral("%1 delta /dev/fd/%2 - -")
                        .arg(codec, QString::number(ENVELOPE_SIGNATURE_FD))});
}

// ---------------------------------------------------------------------------
// Serialization
//
// The steps become one POSIX sh script:
//
//   rdiff --version </dev/null >/dev/null 2>&1 || { echo "<tag> unavailable" >&2; exit 127; }
//   exec 3<&0 </dev/null
//   { ( <command>
//   ) 3<&- || { s=$?; [ $s -eq 141 ] && exit $s; echo "<tag> command-failed $s" >&2; kill -TERM $$; exit 1; }; } | rdiff delta /dev/fd/3 - -
//
// The user's command runs in a subshell so that an "exit" inside it cannot
// skip the exit check. Killing $$ takes down the remote shell so the channel
// reports failure even though the delta stage may still finish. A command
// killed by SIGPIPE lost its reader; the delta's own exit status then fails
// the channel and the command is not blamed.
// ---------------------------------------------------------------------------

QString RemoteEnvelope::script() const
{
    const QString tag = QLatin1String(ENVELOPE_STATUS_TAG);
    QStringList lines;
    QString producer;
    QString consumer;

    for (const EnvelopeStep &step : m_steps) {
        switch (step.kind) {
        case EnvelopeStep::RequireProgram:
            lines << QStringLiteral("%1 --version </dev/null >/dev/null 2>&1 || "
                                    "{ echo \"%2 %3\" >&2; exit %4; }")
                         .arg(step.command, tag, QLatin1String(ENVELOPE_STATUS_UNAVAILABLE),
                              QString::number(ENVELOPE_EXIT_UNAVAILABLE));
            break;
        case EnvelopeStep::RedirectSignature:
            lines << QStringLiteral("exec %1<&0 </dev/null").arg(ENVELOPE_SIGNATURE_FD);
            break;
        case EnvelopeStep::RunCommand:
            producer = QStringLiteral("( %1\n) %2<&-")
                           .arg(step.command, QString::number(ENVELOPE_SIGNATURE_FD));
            break;
        case EnvelopeStep::CheckExit:
            producer = QStringLiteral("{ %1 || { s=$?; [ $s -eq %2 ] && exit $s; "
                                      "echo \"%3 %4 $s\" >&2; kill -TERM $$; exit 1; }; }")
                           .arg(producer, QString::number(ENVELOPE_EXIT_BROKEN_PIPE), tag,
                                QLatin1String(ENVELOPE_STATUS_COMMAND_FAILED));
            break;
        case EnvelopeStep::ComputeDelta:
            consumer = step.command;
            break;
        }
    }

    lines << producer + QStringLiteral(" | ") + consumer;
    return lines.join(QLatin1Char('\n'));
}

QString RemoteEnvelope::commandLine() const
{
    const QChar quote = QLatin1Char(CAPTURE_EMBED_DELIMITER);
    return QStringLiteral("sh -c ") + quote + script() + quote;
}

bool RemoteEnvelope::isEmbeddable(const QString &text)
{
    return !text.contains(QLatin1Char(CAPTURE_EMBED_DELIMITER));
}

// ---------------------------------------------------------------------------
// Status side channel
// ---------------------------------------------------------------------------

bool RemoteEnvelope::parseStatusLine(const QByteArray &line, RemoteStatus &status)
{
    const QByteArray trimmed = line.trimmed();
    if (!trimmed.startsWith(ENVELOPE_STATUS_TAG)) {
        return false;
    }

    const QList<QByteArray> fields = trimmed.simplified().split(' ');
    if (fields.size() < 2 || fields.at(0) != ENVELOPE_STATUS_TAG) {
        return false;
    }

    if (fields.at(1) == ENVELOPE_STATUS_UNAVAILABLE) {
        status.kind = RemoteStatus::Unavailable;
        status.exitCode = ENVELOPE_EXIT_UNAVAILABLE;
    } else if (fields.at(1) == ENVELOPE_STATUS_COMMAND_FAILED) {
        status.kind = RemoteStatus::CommandFailed;
        status.exitCode = fields.size() > 2 ? fields.at(2).toInt() : 0;
    } else {
        status.kind = RemoteStatus::None;
    }
    return true;
}
