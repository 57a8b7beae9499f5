/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef FAILURE_COORDINATOR_H
#define FAILURE_COORDINATOR_H

#include <QByteArray>
#include <QEventLoop>
#include <QFile>
#include <QHash>
#include <QObject>
#include <QProcess>
#include <QTimer>
#include <QVector>

#include "capture_config.h"
#include "remote_envelope.h"

class CapturePipeline;

// Stages that ignore the abort signal are killed after this long
constexpr int COORDINATOR_ABORT_GRACE_MS = 2000;

// Supervises the stages of one run. The first abnormal termination aborts
// every other stage; the coordinator alone decides the run's verdict and
// reports a failure exactly once.
class FailureCoordinator : public QObject
{
    Q_OBJECT

public:
    explicit FailureCoordinator(QObject *parent = nullptr);
    ~FailureCoordinator() override;

    // Start every stage and wait until all of them have finished.
    // Returns false when the run failed.
    bool supervise(CapturePipeline &pipeline);

    // Report a failure found outside the stages (preconditions, publishing).
    // Only the first failure of a run counts.
    void fail(CaptureError error, const QString &message);

    bool hasFailed() const { return m_error != CaptureError::None; }
    CaptureError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    // Name of the stage that caused the failure, empty if none
    QString failedStage() const { return m_failedStage; }

    RemoteStatus remoteStatus() const { return m_remoteStatus; }

Q_SIGNALS:
    void runFailed(CaptureError error, const QString &message);

private:
    struct StageFailure {
        int stage;
        CaptureError error;
        QString message;
        bool aborted;   // terminated by our own abort signal
    };

    CapturePipeline *m_pipeline = nullptr;
    QEventLoop m_loop;
    QTimer m_graceTimer;
    QFile m_stderr;

    QVector<bool> m_finished;
    QVector<bool> m_aborted;
    int m_running = 0;
    bool m_aborting = false;
    QVector<StageFailure> m_failures;
    QHash<int, QByteArray> m_stderrBuffers;
    RemoteStatus m_remoteStatus;

    CaptureError m_error = CaptureError::None;
    QString m_errorString;
    QString m_failedStage;

    void stageFinished(int index, int exitCode, QProcess::ExitStatus status);
    void stageError(int index, QProcess::ProcessError error);
    void stageDone(int index);
    void readRemoteStderr(int index, bool flush);
    void handleRemoteLine(int index, const QByteArray &line);
    void recordFailure(int index, CaptureError error, const QString &message);
    void abortStages();
    void killStragglers();
    void decideVerdict();
};

#endif // FAILURE_COORDINATOR_H
