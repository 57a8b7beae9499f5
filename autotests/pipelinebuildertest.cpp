/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "pipeline_builder.h"
#include "testutils.h"

#include <QProcess>
#include <QTemporaryDir>
#include <QTest>

class PipelineBuilderTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDeltaWithProgress();
    void testDeltaWithoutProgress();
    void testDeltaWithoutBase();
    void testDumbWithProgress();
    void testDumbWithoutProgress();
    void testRefusesPopulatedPipeline();

private:
    QTemporaryDir m_dir;
    QString m_codec;
    QString m_progress;
    QString m_base;
    QString m_sink;

    CaptureConfig config() const;
};

void PipelineBuilderTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_codec = m_dir.filePath(QStringLiteral("codec"));
    m_progress = m_dir.filePath(QStringLiteral("progress"));
    QVERIFY(TestUtils::writeScript(m_codec, TestUtils::identityCodecScript()));
    QVERIFY(TestUtils::writeScript(m_progress, TestUtils::progressScript()));
    m_base = m_dir.filePath(QStringLiteral("capture.txt"));
    m_sink = m_dir.filePath(QStringLiteral("capture.txt.tmp"));
}

CaptureConfig PipelineBuilderTest::config() const
{
    CaptureConfig config;
    config.remotePrefix = QStringLiteral("sh -c");
    config.remoteCommand = QStringLiteral("uptime");
    config.destination = m_base;
    config.localCodec = m_codec;
    config.remoteCodec = m_codec;
    return config;
}

void PipelineBuilderTest::testDeltaWithProgress()
{
    const CaptureConfig capture = config();
    const ProgressMonitor progress(true, m_progress);
    QVERIFY(progress.isActive());

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY2(builder.build(pipeline, m_base, 1024, m_sink), qPrintable(builder.lastError()));

    QCOMPARE(pipeline.describe(), QStringLiteral("hashing | signature | remote | patch | receiving"));
    QCOMPARE(pipeline.channels().size(), 4);

    // The monitor reads the base, the codec reads the monitor
    QCOMPARE(pipeline.stage(0).inputFile, m_base);
    QVERIFY(pipeline.stage(1).inputFile.isEmpty());
    QCOMPARE(pipeline.stage(4).outputFile, m_sink);
    QVERIFY(pipeline.stage(3).outputFile.isEmpty());

    QCOMPARE(pipeline.stage(2).kind, CapturePipeline::StageKind::Remote);
    QCOMPARE(pipeline.stage(0).process->program(), m_progress);
    QVERIFY(pipeline.stage(4).process->arguments().contains(QStringLiteral("receiving")));
}

void PipelineBuilderTest::testDeltaWithoutProgress()
{
    const CaptureConfig capture = config();
    const ProgressMonitor progress(false, m_progress);

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY2(builder.build(pipeline, m_base, 1024, m_sink), qPrintable(builder.lastError()));

    QCOMPARE(pipeline.describe(), QStringLiteral("signature | remote | patch"));
    QCOMPARE(pipeline.channels().size(), 2);
    QCOMPARE(pipeline.stage(0).inputFile, m_base);
    QCOMPARE(pipeline.stage(2).outputFile, m_sink);

    // The patch step reads the base again by name
    QVERIFY(pipeline.stage(2).process->arguments().contains(m_base));
}

void PipelineBuilderTest::testDeltaWithoutBase()
{
    const CaptureConfig capture = config();
    const ProgressMonitor progress(false, m_progress);

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY(builder.build(pipeline, QProcess::nullDevice(), 0, m_sink));

    QCOMPARE(pipeline.stage(0).inputFile, QProcess::nullDevice());
    QVERIFY(pipeline.stage(2).process->arguments().contains(QProcess::nullDevice()));
}

void PipelineBuilderTest::testDumbWithProgress()
{
    CaptureConfig capture = config();
    capture.dumb = true;
    const ProgressMonitor progress(true, m_progress);

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY2(builder.build(pipeline, m_base, 0, m_sink), qPrintable(builder.lastError()));

    QCOMPARE(pipeline.describe(), QStringLiteral("remote | receiving"));
    QCOMPARE(pipeline.stage(1).outputFile, m_sink);
    // Without --check-exit the command's status is not a failure
    QVERIFY(!pipeline.stage(0).exitCodeFatal);
}

void PipelineBuilderTest::testDumbWithoutProgress()
{
    CaptureConfig capture = config();
    capture.dumb = true;
    capture.checkExit = true;
    const ProgressMonitor progress(false, m_progress);

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY2(builder.build(pipeline, m_base, 0, m_sink), qPrintable(builder.lastError()));

    QCOMPARE(pipeline.describe(), QStringLiteral("remote"));
    QCOMPARE(pipeline.stage(0).outputFile, m_sink);
    QVERIFY(pipeline.stage(0).exitCodeFatal);
    QCOMPARE(pipeline.stage(0).failureKind, CaptureError::RemoteCommandFailed);
    QCOMPARE(pipeline.stage(0).process->arguments().constLast(), QStringLiteral("uptime"));
}

void PipelineBuilderTest::testRefusesPopulatedPipeline()
{
    const CaptureConfig capture = config();
    const ProgressMonitor progress(false, m_progress);

    CapturePipeline pipeline;
    PipelineBuilder builder(capture, progress);
    QVERIFY(builder.build(pipeline, m_base, 0, m_sink));
    QVERIFY(!builder.build(pipeline, m_base, 0, m_sink));
    QVERIFY(!builder.lastError().isEmpty());
    QCOMPARE(pipeline.stageCount(), 3);
}

QTEST_GUILESS_MAIN(PipelineBuilderTest)

#include "pipelinebuildertest.moc"
