/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef DELTA_CAPTURE_H
#define DELTA_CAPTURE_H

#include <QString>

#include "capture_config.h"

// One capture run: validate, build and supervise the pipeline, publish or
// discard the result.
class DeltaCapture
{
public:
    explicit DeltaCapture(const CaptureConfig &config);

    // Returns true when the destination now holds the new content
    bool run();

    CaptureError error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    QString failedStage() const { return m_failedStage; }

private:
    const CaptureConfig m_config;
    CaptureError m_error = CaptureError::None;
    QString m_errorString;
    QString m_failedStage;
};

#endif // DELTA_CAPTURE_H
