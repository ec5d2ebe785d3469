// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Utils.h"

#include <QLatin1String>

QStringList Utils::splitLines(const QString& text)
{
    QStringList lines;
    QtSizeType lineStart = 0;
    const QtSizeType length = text.length();

    for(QtSizeType i = 0; i < length; ++i)
    {
        const QChar c = text[i];
        if(!isEndOfLine(c))
            continue;

        lines.append(text.mid(lineStart, i - lineStart));
        // "\r\n" is a single line end.
        if(c == '\r' && i + 1 < length && text[i + 1] == '\n')
            ++i;

        lineStart = i + 1;
    }

    lines.append(text.mid(lineStart));
    return lines;
}

QString Utils::elide(const QString& s, QtSizeType maxLength)
{
    if(s.length() <= maxLength)
        return s;

    QtSizeType cut = maxLength;
    // Never keep half of a surrogate pair.
    if(cut > 0 && s.at(cut - 1).isHighSurrogate())
        --cut;

    return s.left(cut) + QLatin1String("...");
}
