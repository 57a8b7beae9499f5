/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "capture_config.h"
#include "delta_capture.h"
#include "deltacapture_debug.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>

#include <KLocalizedString>

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("deltacapture"));
    app.setApplicationVersion(QStringLiteral(DELTACAPTURE_VERSION_STRING));
    KLocalizedString::setApplicationDomain("deltacapture");
    qSetMessagePattern(QStringLiteral("%{appname}: %{message}"));

    QCommandLineParser parser;
    CaptureConfig config;
    QString errorMessage;

    switch (parseCaptureArguments(parser, app.arguments(), config, errorMessage)) {
    case ParseResult::Ok:
        break;
    case ParseResult::Error:
        qCCritical(DELTACAPTURE_LOG).noquote() << errorMessage;
        return CAPTURE_EXIT_FAILURE;
    case ParseResult::Help:
        parser.showHelp(CAPTURE_EXIT_USAGE);
        break;
    case ParseResult::Version:
        parser.showVersion();
        break;
    }

    if (config.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("deltacapture.info=true"));
    }

    qCDebug(DELTACAPTURE_LOG) << "*** Starting deltacapture";

    DeltaCapture capture(config);
    const bool ok = capture.run();

    qCDebug(DELTACAPTURE_LOG) << "*** deltacapture done";
    return ok ? CAPTURE_EXIT_SUCCESS : CAPTURE_EXIT_FAILURE;
}
