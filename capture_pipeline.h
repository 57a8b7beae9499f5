/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef CAPTURE_PIPELINE_H
#define CAPTURE_PIPELINE_H

#include <QObject>
#include <QPair>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QVector>

#include "capture_config.h"

// Per-run graph of concurrent stages. Every node is a child process, every
// edge an OS pipe from one stage's stdout to the next stage's stdin. The
// graph is built once, started once and torn down with the object.
class CapturePipeline : public QObject
{
    Q_OBJECT

public:
    enum class StageKind {
        Local,
        Remote,
    };

    struct Stage {
        QString name;
        StageKind kind = StageKind::Local;
        QProcess *process = nullptr;
        bool exitCodeFatal = true;
        CaptureError failureKind = CaptureError::StreamBroken;   // meaning of a fatal exit
        QString inputFile;
        QString outputFile;
    };

    explicit CapturePipeline(QObject *parent = nullptr);
    ~CapturePipeline() override;

    // Returns the index of the new stage
    int addStage(const QString &name, StageKind kind,
                 const QString &program, const QStringList &arguments);

    // Pipe stdout of from into stdin of to
    bool connectStages(int from, int to);

    void setInputFile(int stage, const QString &path);
    void setOutputFile(int stage, const QString &path);

    // A non-fatal stage may exit with a non-zero status without failing the run
    void setExitCodeFatal(int stage, bool fatal);
    void setFailureKind(int stage, CaptureError error);

    // Start every stage in data-flow order. Failures to start are reported
    // asynchronously through QProcess::errorOccurred.
    void start();

    // Stop every running stage immediately and reap it
    void killAll();

    int stageCount() const { return m_stages.size(); }
    const Stage &stage(int index) const { return m_stages.at(index); }
    int indexOf(const QProcess *process) const;
    QVector<QPair<int, int>> channels() const { return m_channels; }

    // "hashing | signature | remote | patch"
    QString describe() const;

    QString lastError() const { return m_lastError; }

private:
    QVector<Stage> m_stages;
    QVector<QPair<int, int>> m_channels;
    QString m_lastError;
    bool m_started = false;

    bool hasInput(int stage) const;
    bool hasOutput(int stage) const;
};

#endif // CAPTURE_PIPELINE_H
