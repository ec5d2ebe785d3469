// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DIFFNAVIGATOR_H
#define DIFFNAVIGATOR_H

#include "diff.h"
#include "LineRef.h"

#include <vector>

#include <QString>

/*
    Next/previous difference navigation over one DiffResult.
    Stepping wraps around at both ends. Holds a copy of the difference positions so the
    result is never rescanned while navigating.
*/
class DiffNavigator
{
  public:
    DiffNavigator() = default;
    explicit DiffNavigator(const DiffResult& result);

    void next();
    void previous();
    void reset() { mCurrent = 0; }

    [[nodiscard]] inline bool hasDifferences() const { return !mDifferenceIndices.empty(); }
    [[nodiscard]] inline qint32 differenceCount() const { return SafeInt<qint32>(mDifferenceIndices.size()); }
    // Ordinal of the current difference, 0 based.
    [[nodiscard]] inline qint32 current() const { return mCurrent; }

    // Position of the current difference in the DiffLine sequence, invalid without differences.
    [[nodiscard]] LineRef currentLineIndex() const;
    // "2 / 5" style label, empty without differences.
    [[nodiscard]] QString positionText() const;

    // Ghost document line a selection of this line should jump to. OnlyInOriginal lines have none.
    [[nodiscard]] static LineRef jumpTarget(const DiffLine& line) { return line.getGhostLine(); }

  private:
    std::vector<qint32> mDifferenceIndices;
    qint32 mCurrent = 0;
};

#endif
