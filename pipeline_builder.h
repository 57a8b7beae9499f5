/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef PIPELINE_BUILDER_H
#define PIPELINE_BUILDER_H

#include <QString>

#include "capture_config.h"
#include "capture_pipeline.h"
#include "progress_monitor.h"

// Stage names, as they appear in diagnostics
constexpr char STAGE_HASHING[] = "hashing";
constexpr char STAGE_SIGNATURE[] = "signature";
constexpr char STAGE_REMOTE[] = "remote";
constexpr char STAGE_PATCH[] = "patch";
constexpr char STAGE_RECEIVING[] = "receiving";

class PipelineBuilder
{
public:
    PipelineBuilder(const CaptureConfig &config, const ProgressMonitor &progress);

    // Add the delta or dumb stage graph to pipeline. basePath is the Base
    // File (the null device when there is none), sinkPath the temporary
    // output file. The configuration must have passed validateCaptureConfig().
    // Nothing is started.
    bool build(CapturePipeline &pipeline, const QString &basePath, qint64 baseSize,
               const QString &sinkPath);

    QString lastError() const { return m_lastError; }

private:
    const CaptureConfig &m_config;
    const ProgressMonitor &m_progress;
    QString m_lastError;

    bool buildDelta(CapturePipeline &pipeline, const QString &basePath, qint64 baseSize,
                    const QString &sinkPath);
    bool buildDumb(CapturePipeline &pipeline, qint64 baseSize, const QString &sinkPath);

    // Append an optional progress stage after upstream (-1: none). Returns
    // the stage that now ends the chain.
    int appendProgress(CapturePipeline &pipeline, int upstream, const QString &phase,
                       qint64 expectedBytes);
    bool link(CapturePipeline &pipeline, int from, int to);
};

#endif // PIPELINE_BUILDER_H
