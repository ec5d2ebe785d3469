// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "DiffNavigator.h"

DiffNavigator::DiffNavigator(const DiffResult& result)
    : mDifferenceIndices(result.differenceIndices())
{
}

void DiffNavigator::next()
{
    if(!hasDifferences())
        return;

    mCurrent = (mCurrent + 1) % differenceCount();
}

void DiffNavigator::previous()
{
    if(!hasDifferences())
        return;

    mCurrent = (mCurrent - 1 + differenceCount()) % differenceCount();
}

LineRef DiffNavigator::currentLineIndex() const
{
    if(!hasDifferences())
        return LineRef();

    return mDifferenceIndices[mCurrent];
}

QString DiffNavigator::positionText() const
{
    if(!hasDifferences())
        return QString();

    return QStringLiteral("%1 / %2").arg(mCurrent + 1).arg(differenceCount());
}
