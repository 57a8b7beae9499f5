/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "atomic_writer.h"
#include "capture_config.h"
#include "deltacapture_debug.h"

#include <QFile>
#include <QFileInfo>

#include <KLocalizedString>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <unistd.h>

AtomicWriter::AtomicWriter(const QString &destination, bool backup)
    : m_destination(destination)
    , m_tempPath(destination + QLatin1String(CAPTURE_TEMP_SUFFIX))
    , m_backupPath(destination + QLatin1String(CAPTURE_BACKUP_SUFFIX))
    , m_backup(backup)
{
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool AtomicWriter::removeIfExists(const QString &path)
{
    // exists() follows symlinks; a dangling link must go as well
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        return true;
    }
    QFile file(path);
    if (!file.remove()) {
        m_lastError = i18n("Cannot remove %1: %2", path, file.errorString());
        return false;
    }
    qCDebug(DELTACAPTURE_LOG) << "Removed" << path;
    return true;
}

bool AtomicWriter::syncTemp()
{
    QFile temp(m_tempPath);
    if (!temp.open(QIODevice::ReadOnly)) {
        m_lastError = i18n("Cannot open %1: %2", m_tempPath, temp.errorString());
        return false;
    }
    if (::fsync(temp.handle()) != 0) {
        m_lastError = i18n("Cannot flush %1 to disk: %2", m_tempPath,
                           QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    return true;
}

bool AtomicWriter::renameFile(const QString &from, const QString &to)
{
    // QFile::rename refuses to replace an existing file; rename(2) replaces
    // it atomically.
    if (std::rename(QFile::encodeName(from).constData(), QFile::encodeName(to).constData()) != 0) {
        m_lastError = i18n("Cannot rename %1 to %2: %3", from, to,
                           QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    qCDebug(DELTACAPTURE_LOG) << "Renamed" << from << "to" << to;
    return true;
}

// ---------------------------------------------------------------------------
// Run lifecycle
// ---------------------------------------------------------------------------

bool AtomicWriter::prepare()
{
    if (m_backup && !removeIfExists(m_backupPath)) {
        return false;
    }
    return removeIfExists(m_tempPath);
}

bool AtomicWriter::commit()
{
    if (!QFileInfo::exists(m_tempPath)) {
        m_lastError = i18n("The temporary file %1 is missing.", m_tempPath);
        return false;
    }
    if (!syncTemp()) {
        return false;
    }

    const QFileInfo destination(m_destination);
    if (destination.exists()) {
        if (!QFile::setPermissions(m_tempPath, destination.permissions())) {
            qCWarning(DELTACAPTURE_LOG) << "Cannot copy permissions of" << m_destination;
        }
    }

    bool backedUp = false;
    if (m_backup && destination.exists() && destination.size() > 0) {
        if (!renameFile(m_destination, m_backupPath)) {
            return false;
        }
        backedUp = true;
    }

    if (!renameFile(m_tempPath, m_destination)) {
        // Put the old content back under its name
        if (backedUp) {
            const QString error = m_lastError;
            if (!renameFile(m_backupPath, m_destination)) {
                qCWarning(DELTACAPTURE_LOG).noquote() << m_lastError;
            }
            m_lastError = error;
        }
        return false;
    }
    return true;
}

void AtomicWriter::discard()
{
    if (!removeIfExists(m_tempPath)) {
        qCWarning(DELTACAPTURE_LOG).noquote() << m_lastError;
    }
}
