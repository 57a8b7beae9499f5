/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "pipeline_builder.h"
#include "deltacapture_debug.h"
#include "remote_envelope.h"

PipelineBuilder::PipelineBuilder(const CaptureConfig &config, const ProgressMonitor &progress)
    : m_config(config)
    , m_progress(progress)
{
}

bool PipelineBuilder::build(CapturePipeline &pipeline, const QString &basePath, qint64 baseSize,
                            const QString &sinkPath)
{
    if (pipeline.stageCount() > 0) {
        m_lastError = QStringLiteral("Pipeline already has stages");
        return false;
    }
    if (m_config.dumb) {
        return buildDumb(pipeline, baseSize, sinkPath);
    }
    return buildDelta(pipeline, basePath, baseSize, sinkPath);
}

bool PipelineBuilder::link(CapturePipeline &pipeline, int from, int to)
{
    if (!pipeline.connectStages(from, to)) {
        m_lastError = pipeline.lastError();
        return false;
    }
    return true;
}

int PipelineBuilder::appendProgress(CapturePipeline &pipeline, int upstream, const QString &phase,
                                    qint64 expectedBytes)
{
    if (!m_progress.isActive()) {
        return upstream;
    }

    const int monitor = pipeline.addStage(phase, CapturePipeline::StageKind::Local,
                                          m_progress.program(),
                                          m_progress.arguments(phase, expectedBytes));
    if (upstream >= 0 && !link(pipeline, upstream, monitor)) {
        return -1;
    }
    return monitor;
}

// ---------------------------------------------------------------------------
// Delta path
//
//   base -> [hashing] -> signature -> remote envelope -> patch -> [receiving] -> temp file
// ---------------------------------------------------------------------------

bool PipelineBuilder::buildDelta(CapturePipeline &pipeline, const QString &basePath,
                                 qint64 baseSize, const QString &sinkPath)
{
    // Programs and quoting were checked by validateCaptureConfig()
    const QStringList codec = m_config.localCodecCommand();
    const QString codecProgram = codec.value(0);
    const QStringList prefix = m_config.remotePrefixCommand();
    const QString channelProgram = prefix.value(0);

    // Base file -> signature
    const int hashing = appendProgress(pipeline, -1, QLatin1String(STAGE_HASHING), baseSize);
    QStringList signatureArgs = codec.mid(1);
    signatureArgs << QStringLiteral("signature") << QStringLiteral("-") << QStringLiteral("-");
    const int signature = pipeline.addStage(QLatin1String(STAGE_SIGNATURE),
                                            CapturePipeline::StageKind::Local,
                                            codecProgram, signatureArgs);
    if (hashing >= 0) {
        pipeline.setInputFile(hashing, basePath);
        if (!link(pipeline, hashing, signature)) {
            return false;
        }
    } else {
        pipeline.setInputFile(signature, basePath);
    }

    // Signature -> remote side -> delta
    const RemoteEnvelope envelope(m_config.remoteCommand, m_config.remoteCodec, m_config.checkExit);
    QStringList remoteArgs = prefix.mid(1);
    remoteArgs << envelope.commandLine();
    const int remote = pipeline.addStage(QLatin1String(STAGE_REMOTE),
                                         CapturePipeline::StageKind::Remote,
                                         channelProgram, remoteArgs);
    if (!link(pipeline, signature, remote)) {
        return false;
    }

    // Delta + base -> new content
    QStringList patchArgs = codec.mid(1);
    patchArgs << QStringLiteral("patch") << basePath << QStringLiteral("-") << QStringLiteral("-");
    const int patch = pipeline.addStage(QLatin1String(STAGE_PATCH),
                                        CapturePipeline::StageKind::Local,
                                        codecProgram, patchArgs);
    if (!link(pipeline, remote, patch)) {
        return false;
    }

    const int last = appendProgress(pipeline, patch, QLatin1String(STAGE_RECEIVING), baseSize);
    if (last < 0) {
        return false;
    }
    pipeline.setOutputFile(last, sinkPath);

    qCDebug(DELTACAPTURE_LOG) << "Delta pipeline:" << pipeline.describe();
    return true;
}

// ---------------------------------------------------------------------------
// Dumb path
//
//   remote command -> [receiving] -> temp file
// ---------------------------------------------------------------------------

bool PipelineBuilder::buildDumb(CapturePipeline &pipeline, qint64 baseSize, const QString &sinkPath)
{
    const QStringList prefix = m_config.remotePrefixCommand();
    QStringList remoteArgs = prefix.mid(1);
    remoteArgs << m_config.remoteCommand;
    const int remote = pipeline.addStage(QLatin1String(STAGE_REMOTE),
                                         CapturePipeline::StageKind::Remote,
                                         prefix.value(0), remoteArgs);
    pipeline.setExitCodeFatal(remote, m_config.checkExit);
    pipeline.setFailureKind(remote, CaptureError::RemoteCommandFailed);

    const int last = appendProgress(pipeline, remote, QLatin1String(STAGE_RECEIVING), baseSize);
    if (last < 0) {
        return false;
    }
    pipeline.setOutputFile(last, sinkPath);

    qCDebug(DELTACAPTURE_LOG) << "Dumb pipeline:" << pipeline.describe();
    return true;
}
