/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "capture_pipeline.h"
#include "deltacapture_debug.h"

CapturePipeline::CapturePipeline(QObject *parent)
    : QObject(parent)
{
}

CapturePipeline::~CapturePipeline()
{
    for (const Stage &stage : qAsConst(m_stages)) {
        stage.process->disconnect();
    }
    killAll();
}

// ---------------------------------------------------------------------------
// Graph construction
// ---------------------------------------------------------------------------

int CapturePipeline::addStage(const QString &name, StageKind kind,
                              const QString &program, const QStringList &arguments)
{
    Stage stage;
    stage.name = name;
    stage.kind = kind;
    stage.process = new QProcess(this);
    stage.process->setObjectName(name);
    stage.process->setProgram(program);
    stage.process->setArguments(arguments);

    // Remote stderr carries the status side channel and is read by the
    // coordinator; local stages talk to the user directly.
    if (kind == StageKind::Remote) {
        stage.process->setProcessChannelMode(QProcess::SeparateChannels);
    } else {
        stage.process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    }

    m_stages.append(stage);
    qCDebug(DELTACAPTURE_LOG) << "Stage" << m_stages.size() - 1 << name << program << arguments;
    return m_stages.size() - 1;
}

bool CapturePipeline::hasInput(int stage) const
{
    if (!m_stages.at(stage).inputFile.isEmpty()) {
        return true;
    }
    for (const auto &channel : m_channels) {
        if (channel.second == stage) {
            return true;
        }
    }
    return false;
}

bool CapturePipeline::hasOutput(int stage) const
{
    if (!m_stages.at(stage).outputFile.isEmpty()) {
        return true;
    }
    for (const auto &channel : m_channels) {
        if (channel.first == stage) {
            return true;
        }
    }
    return false;
}

bool CapturePipeline::connectStages(int from, int to)
{
    if (from < 0 || from >= m_stages.size() || to < 0 || to >= m_stages.size() || from == to) {
        m_lastError = QStringLiteral("Invalid channel %1 -> %2").arg(from).arg(to);
        return false;
    }
    if (hasOutput(from) || hasInput(to)) {
        m_lastError = QStringLiteral("Stage %1 or %2 is already connected")
                          .arg(m_stages.at(from).name, m_stages.at(to).name);
        return false;
    }

    m_stages[from].process->setStandardOutputProcess(m_stages.at(to).process);
    m_channels.append(qMakePair(from, to));
    return true;
}

void CapturePipeline::setInputFile(int stage, const QString &path)
{
    m_stages[stage].inputFile = path;
    m_stages[stage].process->setStandardInputFile(path);
}

void CapturePipeline::setOutputFile(int stage, const QString &path)
{
    m_stages[stage].outputFile = path;
    m_stages[stage].process->setStandardOutputFile(path, QIODevice::Truncate);
}

void CapturePipeline::setExitCodeFatal(int stage, bool fatal)
{
    m_stages[stage].exitCodeFatal = fatal;
}

void CapturePipeline::setFailureKind(int stage, CaptureError error)
{
    m_stages[stage].failureKind = error;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

void CapturePipeline::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    for (int i = 0; i < m_stages.size(); ++i) {
        // Unconnected ends must not inherit our terminal
        if (!hasInput(i)) {
            setInputFile(i, QProcess::nullDevice());
        }
        if (!hasOutput(i)) {
            setOutputFile(i, QProcess::nullDevice());
        }
    }

    qCDebug(DELTACAPTURE_LOG) << "Starting pipeline:" << describe();

    // Sources before sinks, as QProcess requires for piped processes
    for (const Stage &stage : qAsConst(m_stages)) {
        stage.process->start();
    }
}

void CapturePipeline::killAll()
{
    for (const Stage &stage : qAsConst(m_stages)) {
        if (stage.process->state() != QProcess::NotRunning) {
            stage.process->kill();
            stage.process->waitForFinished();
        }
    }
}

int CapturePipeline::indexOf(const QProcess *process) const
{
    for (int i = 0; i < m_stages.size(); ++i) {
        if (m_stages.at(i).process == process) {
            return i;
        }
    }
    return -1;
}

QString CapturePipeline::describe() const
{
    QStringList names;
    for (const Stage &stage : m_stages) {
        names << stage.name;
    }
    return names.join(QStringLiteral(" | "));
}
