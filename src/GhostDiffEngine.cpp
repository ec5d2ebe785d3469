// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "GhostDiffEngine.h"

#include "Logging.h"
#include "options.h"
#include "Utils.h"

#include <utility>

DiffResult GhostDiffEngine::compare(const QString& original, const QString& ghost)
{
    return compare(Utils::splitLines(original), Utils::splitLines(ghost), defaultLookAheadWindow, defaultMinCollapseRun, defaultPreviewLength);
}

DiffResult GhostDiffEngine::compare(const QString& original, const QString& ghost, const Options& options)
{
    return compare(Utils::splitLines(original), Utils::splitLines(ghost), options.m_lookAheadWindow, options.m_minCollapseRun, options.m_previewLength);
}

DiffResult GhostDiffEngine::compare(const QStringList& originalLines, const QStringList& ghostLines, qint32 lookAheadWindow, qint32 minCollapseRun, qint32 previewLength)
{
    DiffLineList diffLines;
    diffLines.calcAlignment(originalLines, ghostLines, lookAheadWindow);
    diffLines.filterFalsePositives();

    if(ghostdiffCore().isDebugEnabled())
        diffLines.dump();

    // Sections are only ever computed from the filtered sequence.
    CollapsedSectionList sections;
    sections.calcSections(diffLines, minCollapseRun, previewLength);

    DiffResult result(std::move(diffLines), std::move(sections));
    qCInfo(ghostdiffMain) << "compare: " << result.size() << "lines," << result.differenceCount() << "differences," << result.sections().size() << "collapsed sections";
    return result;
}
