/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "failure_coordinator.h"
#include "capture_pipeline.h"
#include "deltacapture_debug.h"

#include <KLocalizedString>

#include <cstdio>

#include <signal.h>
#include <sys/types.h>

FailureCoordinator::FailureCoordinator(QObject *parent)
    : QObject(parent)
{
    m_graceTimer.setSingleShot(true);
    connect(&m_graceTimer, &QTimer::timeout, this, &FailureCoordinator::killStragglers);

    if (!m_stderr.open(stderr, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        qCWarning(DELTACAPTURE_LOG) << "Cannot forward remote diagnostics:" << m_stderr.errorString();
    }
}

FailureCoordinator::~FailureCoordinator() = default;

// ---------------------------------------------------------------------------
// Supervision
// ---------------------------------------------------------------------------

bool FailureCoordinator::supervise(CapturePipeline &pipeline)
{
    if (hasFailed()) {
        return false;
    }

    m_pipeline = &pipeline;
    const int count = pipeline.stageCount();
    m_finished = QVector<bool>(count, false);
    m_aborted = QVector<bool>(count, false);
    m_running = count;
    m_aborting = false;
    m_failures.clear();
    m_stderrBuffers.clear();
    m_remoteStatus = RemoteStatus();

    for (int i = 0; i < count; ++i) {
        QProcess *process = pipeline.stage(i).process;
        connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
                [this, i](int exitCode, QProcess::ExitStatus status) {
                    stageFinished(i, exitCode, status);
                });
        connect(process, &QProcess::errorOccurred, this, [this, i](QProcess::ProcessError error) {
            stageError(i, error);
        });
        if (pipeline.stage(i).kind == CapturePipeline::StageKind::Remote) {
            connect(process, &QProcess::readyReadStandardError, this, [this, i]() {
                readRemoteStderr(i, false);
            });
        }
    }

    pipeline.start();

    // A stage may have failed to start while later ones were still being
    // started; those must see the abort too.
    if (m_aborting) {
        abortStages();
    }
    if (m_running > 0) {
        m_loop.exec();
    }

    m_graceTimer.stop();
    for (int i = 0; i < count; ++i) {
        pipeline.stage(i).process->disconnect(this);
    }

    decideVerdict();
    m_pipeline = nullptr;
    return !hasFailed();
}

void FailureCoordinator::fail(CaptureError error, const QString &message)
{
    if (hasFailed()) {
        qCDebug(DELTACAPTURE_LOG) << "Run already failed, ignoring:" << message;
        return;
    }

    m_error = error;
    m_errorString = message;
    qCDebug(DELTACAPTURE_LOG) << "Run failed:" << captureErrorName(error) << message;
    Q_EMIT runFailed(error, message);
}

// ---------------------------------------------------------------------------
// Stage events
// ---------------------------------------------------------------------------

void FailureCoordinator::stageFinished(int index, int exitCode, QProcess::ExitStatus status)
{
    if (m_finished.at(index)) {
        return;
    }

    const CapturePipeline::Stage &stage = m_pipeline->stage(index);
    if (stage.kind == CapturePipeline::StageKind::Remote) {
        readRemoteStderr(index, true);
    }

    const bool aborted = m_aborted.at(index);
    if (status == QProcess::CrashExit) {
        recordFailure(index, CaptureError::StreamBroken,
                      aborted ? i18n("Stage %1 was aborted.", stage.name)
                              : i18n("Stage %1 terminated abnormally.", stage.name));
    } else if (exitCode != 0 && (stage.exitCodeFatal || aborted)) {
        recordFailure(index, aborted ? CaptureError::StreamBroken : stage.failureKind,
                      i18n("Stage %1 exited with status %2.", stage.name, exitCode));
    } else if (exitCode != 0 && stage.kind == CapturePipeline::StageKind::Remote) {
        // The channel's own failures (ssh uses 255) look the same as the command's
        qCWarning(DELTACAPTURE_LOG).noquote()
            << i18n("Remote side exited with status %1, keeping its output.", exitCode);
    } else if (exitCode != 0) {
        qCInfo(DELTACAPTURE_LOG).noquote()
            << QStringLiteral("Stage %1 exited with status %2, ignored").arg(stage.name).arg(exitCode);
    } else {
        qCDebug(DELTACAPTURE_LOG) << "Stage" << stage.name << "finished";
    }

    stageDone(index);
}

void FailureCoordinator::stageError(int index, QProcess::ProcessError error)
{
    const CapturePipeline::Stage &stage = m_pipeline->stage(index);
    if (error != QProcess::FailedToStart) {
        // Crashes and pipe errors are followed by finished()
        qCDebug(DELTACAPTURE_LOG) << "Stage" << stage.name << "error:" << stage.process->errorString();
        return;
    }
    if (m_finished.at(index)) {
        return;
    }

    // No finished() follows a failed start
    recordFailure(index, CaptureError::Configuration,
                  i18n("Cannot start stage %1: %2", stage.name, stage.process->errorString()));
    stageDone(index);
}

void FailureCoordinator::stageDone(int index)
{
    m_finished[index] = true;
    if (--m_running == 0) {
        m_graceTimer.stop();
        m_loop.quit();
    }
}

// ---------------------------------------------------------------------------
// Remote status side channel
// ---------------------------------------------------------------------------

void FailureCoordinator::readRemoteStderr(int index, bool flush)
{
    QByteArray &buffer = m_stderrBuffers[index];
    buffer += m_pipeline->stage(index).process->readAllStandardError();

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline + 1);
        buffer.remove(0, newline + 1);
        handleRemoteLine(index, line);
    }

    if (flush && !buffer.isEmpty()) {
        const QByteArray rest = buffer + '\n';
        buffer.clear();
        handleRemoteLine(index, rest);
    }
}

void FailureCoordinator::handleRemoteLine(int index, const QByteArray &line)
{
    RemoteStatus status;
    if (!RemoteEnvelope::parseStatusLine(line, status)) {
        if (m_stderr.isOpen() && m_stderr.write(line) != line.size()) {
            qCDebug(DELTACAPTURE_LOG) << "Short write forwarding remote stderr";
        }
        return;
    }

    qCDebug(DELTACAPTURE_LOG) << "Remote status:" << line.trimmed();
    if (status.kind == RemoteStatus::None || m_remoteStatus.kind != RemoteStatus::None) {
        return;
    }
    m_remoteStatus = status;

    // The remote side announced its failure; do not wait for it to die
    if (status.kind == RemoteStatus::Unavailable) {
        recordFailure(index, CaptureError::RemoteUnavailable,
                      i18n("The delta codec is not available on the remote host."));
    } else {
        recordFailure(index, CaptureError::RemoteCommandFailed,
                      i18n("The remote command exited with status %1.", status.exitCode));
    }
}

// ---------------------------------------------------------------------------
// Abort propagation
// ---------------------------------------------------------------------------

void FailureCoordinator::recordFailure(int index, CaptureError error, const QString &message)
{
    // Logged before anything else is torn down
    qCWarning(DELTACAPTURE_LOG).noquote() << message;
    m_failures.append({index, error, message, m_aborted.at(index)});
    abortStages();
}

void FailureCoordinator::abortStages()
{
    m_aborting = true;

    for (int i = 0; i < m_pipeline->stageCount(); ++i) {
        const CapturePipeline::Stage &stage = m_pipeline->stage(i);
        if (m_finished.at(i) || m_aborted.at(i) || stage.process->state() == QProcess::NotRunning) {
            continue;
        }
        m_aborted[i] = true;

        // A stage whose peer died sees the same signal as on a real broken pipe
        const qint64 pid = stage.process->processId();
        qCDebug(DELTACAPTURE_LOG) << "Aborting stage" << stage.name << "pid" << pid;
        if (pid <= 0 || ::kill(static_cast<pid_t>(pid), SIGPIPE) != 0) {
            stage.process->kill();
        }
    }

    if (m_running > 0 && !m_graceTimer.isActive()) {
        m_graceTimer.start(COORDINATOR_ABORT_GRACE_MS);
    }
}

void FailureCoordinator::killStragglers()
{
    for (int i = 0; i < m_pipeline->stageCount(); ++i) {
        const CapturePipeline::Stage &stage = m_pipeline->stage(i);
        if (m_finished.at(i) || stage.process->state() == QProcess::NotRunning) {
            continue;
        }
        qCWarning(DELTACAPTURE_LOG).noquote()
            << QStringLiteral("Stage %1 ignored the abort signal, killing it").arg(stage.name);
        m_aborted[i] = true;
        stage.process->kill();
    }
}

// ---------------------------------------------------------------------------
// Verdict
// ---------------------------------------------------------------------------

void FailureCoordinator::decideVerdict()
{
    if (m_failures.isEmpty() || hasFailed()) {
        return;
    }

    // The remote side's own report explains every other stage's death; else
    // the first stage that failed by itself is the cause.
    const StageFailure *cause = nullptr;
    for (const StageFailure &failure : qAsConst(m_failures)) {
        if (failure.error == CaptureError::RemoteUnavailable
            || failure.error == CaptureError::RemoteCommandFailed) {
            cause = &failure;
            break;
        }
    }
    if (!cause) {
        for (const StageFailure &failure : qAsConst(m_failures)) {
            if (!failure.aborted) {
                cause = &failure;
                break;
            }
        }
    }
    if (!cause) {
        cause = &m_failures.first();
    }

    m_failedStage = m_pipeline->stage(cause->stage).name;
    fail(cause->error, cause->message);
}
