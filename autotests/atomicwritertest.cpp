/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "atomic_writer.h"
#include "testutils.h"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTest>

class AtomicWriterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testPaths();
    void testPrepareRemovesLeftovers();
    void testPrepareKeepsBackupWithoutBackups();
    void testCommitNewFile();
    void testCommitWithBackup();
    void testCommitEmptyDestinationMakesNoBackup();
    void testCommitWithoutBackup();
    void testCommitKeepsPermissions();
    void testCommitWithoutOutput();
    void testDiscard();

private:
    QTemporaryDir *m_dir = nullptr;
    QString m_destination;
};

void AtomicWriterTest::init()
{
    m_dir = new QTemporaryDir;
    QVERIFY(m_dir->isValid());
    m_destination = m_dir->filePath(QStringLiteral("capture.txt"));
}

void AtomicWriterTest::cleanup()
{
    delete m_dir;
    m_dir = nullptr;
}

void AtomicWriterTest::testPaths()
{
    const AtomicWriter writer(m_destination, true);
    QCOMPARE(writer.destination(), m_destination);
    QCOMPARE(writer.tempPath(), QString(m_destination + QStringLiteral(".tmp")));
    QCOMPARE(writer.backupPath(), QString(m_destination + QStringLiteral(".bak")));
}

void AtomicWriterTest::testPrepareRemovesLeftovers()
{
    AtomicWriter writer(m_destination, true);
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "stale"));
    QVERIFY(TestUtils::writeFile(writer.backupPath(), "older"));
    QVERIFY(TestUtils::writeFile(m_destination, "current"));

    QVERIFY2(writer.prepare(), qPrintable(writer.lastError()));
    QVERIFY(!QFileInfo::exists(writer.tempPath()));
    QVERIFY(!QFileInfo::exists(writer.backupPath()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("current"));
}

void AtomicWriterTest::testPrepareKeepsBackupWithoutBackups()
{
    AtomicWriter writer(m_destination, false);
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "stale"));
    QVERIFY(TestUtils::writeFile(writer.backupPath(), "older"));

    QVERIFY2(writer.prepare(), qPrintable(writer.lastError()));
    QVERIFY(!QFileInfo::exists(writer.tempPath()));
    QCOMPARE(TestUtils::readFile(writer.backupPath()), QByteArrayLiteral("older"));
}

void AtomicWriterTest::testCommitNewFile()
{
    AtomicWriter writer(m_destination, true);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "fresh"));

    QVERIFY2(writer.commit(), qPrintable(writer.lastError()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("fresh"));
    QVERIFY(!QFileInfo::exists(writer.tempPath()));
    QVERIFY(!QFileInfo::exists(writer.backupPath()));
}

void AtomicWriterTest::testCommitWithBackup()
{
    QVERIFY(TestUtils::writeFile(m_destination, "old"));
    AtomicWriter writer(m_destination, true);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "new"));

    QVERIFY2(writer.commit(), qPrintable(writer.lastError()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("new"));
    QCOMPARE(TestUtils::readFile(writer.backupPath()), QByteArrayLiteral("old"));
    QVERIFY(!QFileInfo::exists(writer.tempPath()));
}

void AtomicWriterTest::testCommitEmptyDestinationMakesNoBackup()
{
    QVERIFY(TestUtils::writeFile(m_destination, QByteArray()));
    AtomicWriter writer(m_destination, true);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "new"));

    QVERIFY2(writer.commit(), qPrintable(writer.lastError()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("new"));
    QVERIFY(!QFileInfo::exists(writer.backupPath()));
}

void AtomicWriterTest::testCommitWithoutBackup()
{
    QVERIFY(TestUtils::writeFile(m_destination, "old"));
    AtomicWriter writer(m_destination, false);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "new"));

    QVERIFY2(writer.commit(), qPrintable(writer.lastError()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("new"));
    QVERIFY(!QFileInfo::exists(writer.backupPath()));
}

void AtomicWriterTest::testCommitKeepsPermissions()
{
    const QFile::Permissions mode = QFile::ReadOwner | QFile::WriteOwner | QFile::ReadGroup;
    QVERIFY(TestUtils::writeFile(m_destination, "old"));
    QVERIFY(QFile::setPermissions(m_destination, mode));

    AtomicWriter writer(m_destination, false);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "new"));
    QVERIFY(QFile::setPermissions(writer.tempPath(), QFile::ReadOwner | QFile::WriteOwner
                                  | QFile::ReadGroup | QFile::ReadOther));

    QVERIFY2(writer.commit(), qPrintable(writer.lastError()));
    const QFile::Permissions published = QFileInfo(m_destination).permissions();
    QVERIFY(published.testFlag(QFile::ReadGroup));
    QVERIFY(!published.testFlag(QFile::ReadOther));
    QVERIFY(!published.testFlag(QFile::WriteGroup));
}

void AtomicWriterTest::testCommitWithoutOutput()
{
    QVERIFY(TestUtils::writeFile(m_destination, "old"));
    AtomicWriter writer(m_destination, true);
    QVERIFY(writer.prepare());

    QVERIFY(!writer.commit());
    QVERIFY(!writer.lastError().isEmpty());
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("old"));
    QVERIFY(!QFileInfo::exists(writer.backupPath()));
}

void AtomicWriterTest::testDiscard()
{
    QVERIFY(TestUtils::writeFile(m_destination, "old"));
    AtomicWriter writer(m_destination, true);
    QVERIFY(writer.prepare());
    QVERIFY(TestUtils::writeFile(writer.tempPath(), "partial"));

    writer.discard();
    QVERIFY(!QFileInfo::exists(writer.tempPath()));
    QCOMPARE(TestUtils::readFile(m_destination), QByteArrayLiteral("old"));
}

QTEST_GUILESS_MAIN(AtomicWriterTest)

#include "atomicwritertest.moc"
