/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef DELTACAPTURE_TESTUTILS_H
#define DELTACAPTURE_TESTUTILS_H

#include <QByteArray>
#include <QFile>
#include <QString>

namespace TestUtils
{

inline bool writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

inline QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

inline bool writeScript(const QString &path, const QByteArray &content)
{
    if (!writeFile(path, content)) {
        return false;
    }
    return QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
}

// Stand-in for rdiff. The signature is the word SIG, the delta is the new
// content itself and patching copies the delta through. The delta step
// checks that the signature arrived on the descriptor it was given.
inline QByteArray identityCodecScript()
{
    return QByteArrayLiteral(
        "#!/bin/sh\n"
        "while [ $# -gt 0 ]; do\n"
        "    case \"$1\" in\n"
        "    --version)\n"
        "        exit 0\n"
        "        ;;\n"
        "    signature)\n"
        "        cat >/dev/null\n"
        "        printf SIG\n"
        "        exit 0\n"
        "        ;;\n"
        "    delta)\n"
        "        [ \"$(cat \"$2\")\" = SIG ] || exit 3\n"
        "        exec cat\n"
        "        ;;\n"
        "    patch)\n"
        "        exec cat\n"
        "        ;;\n"
        "    esac\n"
        "    shift\n"
        "done\n"
        "exit 2\n");
}

// Like the identity codec, but patching fails at once
inline QByteArray brokenPatchCodecScript()
{
    return QByteArrayLiteral(
        "#!/bin/sh\n"
        "while [ $# -gt 0 ]; do\n"
        "    case \"$1\" in\n"
        "    --version)\n"
        "        exit 0\n"
        "        ;;\n"
        "    signature)\n"
        "        cat >/dev/null\n"
        "        printf SIG\n"
        "        exit 0\n"
        "        ;;\n"
        "    patch)\n"
        "        echo 'patch: corrupt delta' >&2\n"
        "        exit 5\n"
        "        ;;\n"
        "    esac\n"
        "    shift\n"
        "done\n"
        "exit 2\n");
}

// A codec whose delta step gives up at once without reading its input
inline QByteArray brokenDeltaCodecScript()
{
    return QByteArrayLiteral(
        "#!/bin/sh\n"
        "while [ $# -gt 0 ]; do\n"
        "    case \"$1\" in\n"
        "    --version)\n"
        "        exit 0\n"
        "        ;;\n"
        "    delta)\n"
        "        echo 'delta: out of memory' >&2\n"
        "        exit 4\n"
        "        ;;\n"
        "    esac\n"
        "    shift\n"
        "done\n"
        "exit 2\n");
}

// Stand-in for pv: copies stdin to stdout whatever its arguments
inline QByteArray progressScript()
{
    return QByteArrayLiteral(
        "#!/bin/sh\n"
        "exec cat\n");
}

} // namespace TestUtils

#endif // DELTACAPTURE_TESTUTILS_H
