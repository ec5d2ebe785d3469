// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "SectionFolding.h"

void SectionFolding::expandAll(const DiffResult& result)
{
    mExpanded.clear();
    for(const CollapsedSection& section: result.sections())
        mExpanded.insert(section.startLine());
}

void SectionFolding::toggle(const CollapsedSection& section)
{
    setExpanded(section, !isExpanded(section));
}

void SectionFolding::setExpanded(const CollapsedSection& section, bool expanded)
{
    if(expanded)
        mExpanded.insert(section.startLine());
    else
        mExpanded.erase(section.startLine());
}

std::vector<VisibleRow> SectionFolding::visibleRows(const DiffResult& result) const
{
    std::vector<VisibleRow> rows;
    rows.reserve(result.size());

    // Sections are ascending and disjoint, so one cursor walks them alongside the lines.
    const CollapsedSectionList& sections = result.sections();
    CollapsedSectionList::const_iterator section = sections.cbegin();

    for(qint32 pos = 0; pos < result.size(); ++pos)
    {
        while(section != sections.cend() && section->endLine() < pos)
            ++section;

        if(section == sections.cend() || !section->contains(pos))
        {
            rows.push_back({e_RowType::Line, pos, nullptr});
            continue;
        }

        const CollapsedSection* pSection = &*section;
        if(pos == pSection->startLine())
            rows.push_back({e_RowType::SectionHeader, pos, pSection});

        if(isExpanded(*pSection))
            rows.push_back({e_RowType::Line, pos, pSection});
    }

    return rows;
}
