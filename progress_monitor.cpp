/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "progress_monitor.h"
#include "capture_config.h"
#include "deltacapture_debug.h"

ProgressMonitor::ProgressMonitor(bool enabled, const QString &program)
{
    if (!enabled) {
        return;
    }

    m_resolvedProgram = findProgram(program);
    if (m_resolvedProgram.isEmpty()) {
        qCWarning(DELTACAPTURE_LOG).noquote()
            << QStringLiteral("%1 not found, progress will not be shown").arg(program);
    }
}

QStringList ProgressMonitor::arguments(const QString &phase, qint64 expectedBytes) const
{
    QStringList args;
    args << QStringLiteral("-c")
         << QStringLiteral("-i") << QString::number(PROGRESS_INTERVAL_SECONDS)
         << QStringLiteral("-N") << phase;
    if (expectedBytes > 0) {
        args << QStringLiteral("-s") << QString::number(expectedBytes);
    }
    return args;
}
