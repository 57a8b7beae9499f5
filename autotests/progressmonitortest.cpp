/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "progress_monitor.h"

#include <QTemporaryDir>
#include <QTest>

class ProgressMonitorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDisabled();
    void testMissingProgram();
    void testInstalledProgram();
    void testArguments();
    void testArgumentsWithSize();
};

void ProgressMonitorTest::testDisabled()
{
    const ProgressMonitor monitor(false, QStringLiteral("sh"));
    QVERIFY(!monitor.isActive());
    QVERIFY(monitor.program().isEmpty());
}

void ProgressMonitorTest::testMissingProgram()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString missing = dir.filePath(QStringLiteral("pv"));

    QTest::ignoreMessage(QtWarningMsg,
                         qPrintable(QStringLiteral("%1 not found, progress will not be shown").arg(missing)));
    const ProgressMonitor monitor(true, missing);
    QVERIFY(!monitor.isActive());
}

void ProgressMonitorTest::testInstalledProgram()
{
    const ProgressMonitor monitor(true, QStringLiteral("sh"));
    QVERIFY(monitor.isActive());
    QVERIFY(monitor.program().endsWith(QStringLiteral("/sh")));
}

void ProgressMonitorTest::testArguments()
{
    const ProgressMonitor monitor(true, QStringLiteral("sh"));
    QCOMPARE(monitor.arguments(QStringLiteral("receiving"), 0),
             QStringList({QStringLiteral("-c"), QStringLiteral("-i"), QStringLiteral("1"),
                          QStringLiteral("-N"), QStringLiteral("receiving")}));
}

void ProgressMonitorTest::testArgumentsWithSize()
{
    const ProgressMonitor monitor(true, QStringLiteral("sh"));
    QCOMPARE(monitor.arguments(QStringLiteral("hashing"), 123456),
             QStringList({QStringLiteral("-c"), QStringLiteral("-i"), QStringLiteral("1"),
                          QStringLiteral("-N"), QStringLiteral("hashing"),
                          QStringLiteral("-s"), QStringLiteral("123456")}));
}

QTEST_GUILESS_MAIN(ProgressMonitorTest)

#include "progressmonitortest.moc"
