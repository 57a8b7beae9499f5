/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef ATOMIC_WRITER_H
#define ATOMIC_WRITER_H

#include <QString>

// Publishes the pipeline output under the destination path only once it is
// complete. The output is written to a fixed temporary path next to the
// destination and moved into place with rename(2), so the destination always
// holds either the old or the new content.
class AtomicWriter
{
public:
    AtomicWriter(const QString &destination, bool backup);

    QString destination() const { return m_destination; }
    QString tempPath() const { return m_tempPath; }
    QString backupPath() const { return m_backupPath; }

    // Remove leftovers before the run: the old backup (when backups are
    // enabled, to bound disk usage) and a stale temporary file.
    bool prepare();

    // Publish the temporary file. With backups enabled a non-empty
    // destination is renamed to the backup path first.
    bool commit();

    // Drop the temporary file after a failed run
    void discard();

    QString lastError() const { return m_lastError; }

private:
    QString m_destination;
    QString m_tempPath;
    QString m_backupPath;
    bool m_backup;
    QString m_lastError;

    bool removeIfExists(const QString &path);
    bool syncTemp();
    bool renameFile(const QString &from, const QString &to);
};

#endif // ATOMIC_WRITER_H
