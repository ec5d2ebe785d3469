// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "LookAheadMatcher.h"

#include "Utils.h"

#include <algorithm>

LookAheadMatch LookAheadMatcher::findMatchingLine(const QString& target, const QStringList& lines, QtSizeType startIndex, qint32 maxLookAhead)
{
    LookAheadMatch result;
    if(startIndex < 0 || maxLookAhead <= 0)
        return result;

    const QtSizeType available = std::max<QtSizeType>(lines.size() - startIndex, 0);
    const QtSizeType searchRange = std::min<QtSizeType>(maxLookAhead, available);

    for(QtSizeType i = 0; i < searchRange; ++i)
    {
        if(Utils::trimmedLine(lines[startIndex + i]) == target)
        {
            result.found = true;
            result.offset = SafeInt<qint32>(i);
            return result;
        }
    }

    return result;
}
