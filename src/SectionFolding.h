// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SECTIONFOLDING_H
#define SECTIONFOLDING_H

#include "diff.h"

#include <set>
#include <vector>

enum class e_RowType
{
    SectionHeader,
    Line
};

struct VisibleRow
{
    e_RowType type = e_RowType::Line;
    qint32 position = 0;              // index into DiffResult::lines()
    const CollapsedSection* pSection = nullptr; // set for headers and for lines inside a section

    bool operator==(const VisibleRow& other) const
    {
        return type == other.type && position == other.position && pSection == other.pSection;
    }
};

/*
    Expanded/collapsed state of the sections of a DiffResult.
    Sections are identified by their start position, which is stable for a given result.
    The result itself is never modified.
*/
class SectionFolding
{
  public:
    void expandAll(const DiffResult& result);
    void collapseAll() { mExpanded.clear(); }

    void toggle(const CollapsedSection& section);
    void setExpanded(const CollapsedSection& section, bool expanded);
    [[nodiscard]] bool isExpanded(const CollapsedSection& section) const { return mExpanded.count(section.startLine()) != 0; }

    /*
        Flattens result for display. Each section contributes a header row at its start
        followed by its lines only when expanded. Lines outside sections are always visible.
    */
    [[nodiscard]] std::vector<VisibleRow> visibleRows(const DiffResult& result) const;

  private:
    std::set<qint32> mExpanded;
};

#endif
