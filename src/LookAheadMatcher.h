// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef LOOKAHEADMATCHER_H
#define LOOKAHEADMATCHER_H

#include "TypeUtils.h"

#include <QString>
#include <QStringList>

constexpr qint32 defaultLookAheadWindow = 5;

struct LookAheadMatch
{
    bool found = false;
    qint32 offset = -1; // Relative to the start index passed to findMatchingLine.
};

class LookAheadMatcher
{
  public:
    /*
        Looks for a line whose trimmed text equals target among
        lines[startIndex, startIndex + min(maxLookAhead, available)).
        target is expected to be trimmed already.
    */
    [[nodiscard]] static LookAheadMatch findMatchingLine(const QString& target, const QStringList& lines, QtSizeType startIndex, qint32 maxLookAhead = defaultLookAheadWindow);
};

#endif
