// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef UTILS_H
#define UTILS_H

#include "TypeUtils.h"

#include <QChar>
#include <QString>
#include <QStringList>

class Utils
{
  public:
    /*
        Splits text at "\r\n", "\r" or "\n". The text following the last separator is always
        returned as a line, so an empty string yields one empty line and "a\n" yields {"a", ""}.
    */
    static QStringList splitLines(const QString& text);

    // All line comparisons ignore leading and trailing white space.
    inline static QString trimmedLine(const QString& line) { return line.trimmed(); }
    inline static bool isEndOfLine(QChar c) { return c == '\n' || c == '\r'; }

    /*
        Cuts s to at most maxLength UTF-16 units and appends "..." if anything was cut.
        A surrogate pair crossing the limit is dropped as a whole.
    */
    static QString elide(const QString& s, QtSizeType maxLength);
};

#endif
