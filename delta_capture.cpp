/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "delta_capture.h"
#include "atomic_writer.h"
#include "capture_pipeline.h"
#include "deltacapture_debug.h"
#include "failure_coordinator.h"
#include "pipeline_builder.h"
#include "progress_monitor.h"

#include <QFileInfo>
#include <QProcess>

#include <KLocalizedString>

DeltaCapture::DeltaCapture(const CaptureConfig &config)
    : m_config(config)
{
}

bool DeltaCapture::run()
{
    FailureCoordinator coordinator;
    AtomicWriter writer(m_config.destination, m_config.backup);
    bool prepared = false;

    QString message;
    if (!validateCaptureConfig(m_config, message)) {
        coordinator.fail(CaptureError::Configuration, message);
    } else if (!writer.prepare()) {
        coordinator.fail(CaptureError::Filesystem, writer.lastError());
    } else {
        prepared = true;
    }

    if (prepared) {
        // No destination yet, or an empty one: diff against nothing
        const QFileInfo base(m_config.destination);
        const bool hasBase = base.exists() && base.size() > 0;
        const QString basePath = hasBase ? base.absoluteFilePath() : QProcess::nullDevice();
        const qint64 baseSize = hasBase ? base.size() : 0;

        qCInfo(DELTACAPTURE_LOG).noquote()
            << i18n("Capturing \"%1\" into %2 (%3 bytes of previous content)",
                    m_config.remoteCommand, m_config.destination, baseSize);

        const ProgressMonitor progress(m_config.verbose, m_config.progressProgram);
        CapturePipeline pipeline;
        PipelineBuilder builder(m_config, progress);

        if (!builder.build(pipeline, basePath, baseSize, writer.tempPath())) {
            coordinator.fail(CaptureError::Configuration, builder.lastError());
        } else if (coordinator.supervise(pipeline) && !writer.commit()) {
            coordinator.fail(CaptureError::Filesystem, writer.lastError());
        }
    }

    if (!coordinator.hasFailed()) {
        qCInfo(DELTACAPTURE_LOG).noquote() << i18n("Capture of %1 complete.", m_config.destination);
        return true;
    }

    if (prepared) {
        writer.discard();
    }

    m_error = coordinator.error();
    m_errorString = coordinator.errorString();
    m_failedStage = coordinator.failedStage();

    // Stage failures were already reported as they happened
    if (m_failedStage.isEmpty()) {
        qCWarning(DELTACAPTURE_LOG).noquote() << m_errorString;
    }
    qCInfo(DELTACAPTURE_LOG).noquote()
        << i18n("Capture of %1 failed: %2.", m_config.destination, captureErrorName(m_error));
    return false;
}
