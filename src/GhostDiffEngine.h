// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef GHOSTDIFFENGINE_H
#define GHOSTDIFFENGINE_H

#include "diff.h"

#include <QString>

class Options;

/*
    Compares an original document with a ghost (proposed) version of it.

    The pipeline is alignment, false positive filtering and section collapsing. It is pure:
    no I/O, no shared state, and every input including empty text produces a result.
*/
class GhostDiffEngine
{
  public:
    [[nodiscard]] static DiffResult compare(const QString& original, const QString& ghost);
    [[nodiscard]] static DiffResult compare(const QString& original, const QString& ghost, const Options& options);
    [[nodiscard]] static DiffResult compare(const QStringList& originalLines, const QStringList& ghostLines, qint32 lookAheadWindow, qint32 minCollapseRun, qint32 previewLength);
};

#endif
