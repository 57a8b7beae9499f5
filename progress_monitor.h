/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef PROGRESS_MONITOR_H
#define PROGRESS_MONITOR_H

#include <QString>
#include <QStringList>

constexpr int PROGRESS_INTERVAL_SECONDS = 1;

// Decides whether byte streams get a progress stage and how it is invoked.
// The stage itself is the external pv utility: it copies stdin to stdout
// unchanged and reports on stderr.
class ProgressMonitor
{
public:
    ProgressMonitor(bool enabled, const QString &program);

    // False when progress is disabled or the utility is not installed; the
    // stream is then left without a monitor.
    bool isActive() const { return !m_resolvedProgram.isEmpty(); }

    QString program() const { return m_resolvedProgram; }

    // Arguments for a monitor named phase. expectedBytes <= 0 means the total
    // is unknown and only bytes are counted.
    QStringList arguments(const QString &phase, qint64 expectedBytes) const;

private:
    QString m_resolvedProgram;
};

#endif // PROGRESS_MONITOR_H
