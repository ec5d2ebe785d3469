// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "diff.h"

#include "KeyExtractor.h"
#include "Logging.h"
#include "LookAheadMatcher.h"
#include "Utils.h"

#include <algorithm>
#include <iterator>
#include <optional>

#include <QString>

namespace {
QString typeName(e_DiffType type)
{
    switch(type)
    {
        case e_DiffType::Match:
            return QStringLiteral("match");
        case e_DiffType::OnlyInOriginal:
            return QStringLiteral("onlyInOriginal");
        case e_DiffType::OnlyInGhost:
            return QStringLiteral("onlyInGhost");
        case e_DiffType::Modified:
            return QStringLiteral("modified");
    }
    return QString();
}
} // namespace

e_AlignmentStep DiffLineList::chooseAlignmentStep(const LookAheadMatch& originalInGhost, const LookAheadMatch& ghostInOriginal)
{
    /*
        The current original line shows up ahead in the ghost document, so the ghost lines in
        between were inserted. On equal distance the insertion is preferred.
    */
    if(originalInGhost.found && (!ghostInOriginal.found || originalInGhost.offset <= ghostInOriginal.offset))
        return e_AlignmentStep::Insertion;

    if(ghostInOriginal.found)
        return e_AlignmentStep::Deletion;

    return e_AlignmentStep::Modification;
}

void DiffLineList::calcAlignment(const QStringList& original, const QStringList& ghost, qint32 lookAheadWindow)
{
    const QtSizeType originalSize = original.size();
    const QtSizeType ghostSize = ghost.size();
    LineRef originalIndex = 0;
    LineRef ghostIndex = 0;

    qCInfo(ghostdiffMain) << "Enter: calcAlignment, original lines =" << originalSize << ", ghost lines =" << ghostSize;
    reserve(std::max(originalSize, ghostSize));

    while(originalIndex < originalSize || ghostIndex < ghostSize)
    {
        if(ghostIndex >= ghostSize)
        {
            push_back(DiffLine::onlyInOriginal(originalIndex, original[originalIndex]));
            ++originalIndex;
            continue;
        }

        if(originalIndex >= originalSize)
        {
            push_back(DiffLine::onlyInGhost(ghostIndex, ghost[ghostIndex]));
            ++ghostIndex;
            continue;
        }

        const QString& originalLine = original[originalIndex];
        const QString& ghostLine = ghost[ghostIndex];
        const QString trimmedOriginal = Utils::trimmedLine(originalLine);
        const QString trimmedGhost = Utils::trimmedLine(ghostLine);

        if(trimmedOriginal == trimmedGhost)
        {
            push_back(DiffLine::match(originalIndex, ghostIndex, originalLine, ghostLine));
            ++originalIndex;
            ++ghostIndex;
            continue;
        }

        const std::optional<QString> originalKey = KeyExtractor::extractKey(trimmedOriginal);
        const std::optional<QString> ghostKey = KeyExtractor::extractKey(trimmedGhost);

        if(originalKey.has_value() && ghostKey.has_value() && originalKey == ghostKey)
        {
            qCDebug(ghostdiffCore) << "same key" << *originalKey << ": originalIndex =" << originalIndex << ", ghostIndex =" << ghostIndex;
            push_back(DiffLine::modified(originalIndex, ghostIndex, originalLine, ghostLine));
            ++originalIndex;
            ++ghostIndex;
            continue;
        }

        const LookAheadMatch originalInGhost = LookAheadMatcher::findMatchingLine(trimmedOriginal, ghost, ghostIndex, lookAheadWindow);
        const LookAheadMatch ghostInOriginal = LookAheadMatcher::findMatchingLine(trimmedGhost, original, originalIndex, lookAheadWindow);

        switch(chooseAlignmentStep(originalInGhost, ghostInOriginal))
        {
            case e_AlignmentStep::Insertion:
                qCDebug(ghostdiffCore) << "insertion: ghostIndex =" << ghostIndex << ", offset =" << originalInGhost.offset;
                push_back(DiffLine::onlyInGhost(ghostIndex, ghostLine));
                ++ghostIndex;
                break;
            case e_AlignmentStep::Deletion:
                qCDebug(ghostdiffCore) << "deletion: originalIndex =" << originalIndex << ", offset =" << ghostInOriginal.offset;
                push_back(DiffLine::onlyInOriginal(originalIndex, originalLine));
                ++originalIndex;
                break;
            case e_AlignmentStep::Modification:
                qCDebug(ghostdiffCore) << "no lookahead match: originalIndex =" << originalIndex << ", ghostIndex =" << ghostIndex;
                push_back(DiffLine::modified(originalIndex, ghostIndex, originalLine, ghostLine));
                ++originalIndex;
                ++ghostIndex;
                break;
        }
    }

    qCInfo(ghostdiffMain) << "Leave: calcAlignment, produced" << size() << "lines";
}

void DiffLineList::filterFalsePositives()
{
    std::vector<size_t> onlyInOriginal;
    std::vector<size_t> onlyInGhost;

    for(size_t i = 0; i < size(); ++i)
    {
        const e_DiffType type = (*this)[i].getType();
        if(type == e_DiffType::OnlyInOriginal)
            onlyInOriginal.push_back(i);
        else if(type == e_DiffType::OnlyInGhost)
            onlyInGhost.push_back(i);
    }

    if(onlyInOriginal.empty() || onlyInGhost.empty())
        return;

    std::vector<bool> skip(size(), false);
    qint32 pairs = 0;

    for(const size_t origPos: onlyInOriginal)
    {
        if(skip[origPos])
            continue;

        const QString origContent = Utils::trimmedLine((*this)[origPos].getOriginalContent().value_or(QString()));
        if(origContent.isEmpty())
            continue;

        for(const size_t ghostPos: onlyInGhost)
        {
            if(skip[ghostPos])
                continue;

            const QString ghostContent = Utils::trimmedLine((*this)[ghostPos].getGhostContent().value_or(QString()));
            if(origContent == ghostContent)
            {
                qCDebug(ghostdiffCore) << "moved line at positions" << origPos << "and" << ghostPos << ":" << origContent;
                skip[origPos] = true;
                skip[ghostPos] = true;
                ++pairs;
                break;
            }
        }
    }

    if(pairs == 0)
        return;

    DiffLineList filtered;
    filtered.reserve(size() - 2 * pairs);
    for(size_t i = 0; i < size(); ++i)
    {
        if(!skip[i])
            filtered.push_back((*this)[i]);
    }

    qCInfo(ghostdiffMain) << "filterFalsePositives: dropped" << pairs << "moved line pairs";
    swap(filtered);
}

LineCount DiffLineList::differenceCount() const
{
    return SafeInt<LineCount>(std::count_if(begin(), end(), [](const DiffLine& line) { return line.isDifference(); }));
}

void DiffLineList::dump() const
{
    qCDebug(ghostdiffCore) << "DiffLineList::dump, size =" << size();
    qint32 pos = 0;
    for(const DiffLine& line: *this)
    {
        qCDebug(ghostdiffCore) << pos << typeName(line.getType())
                               << "original =" << line.getOriginalLine() << line.getOriginalContent().value_or(QString())
                               << "ghost =" << line.getGhostLine() << line.getGhostContent().value_or(QString());
        ++pos;
    }
}

QString CollapsedSection::displayText() const
{
    return QStringLiteral("Lines %1-%2 match (%3 lines)").arg(mStartLine + 1).arg(mEndLine + 1).arg(lineCount());
}

QString CollapsedSectionList::createPreview(const DiffLineList& diffLines, qint32 start, qint32 end, qint32 previewLength)
{
    QStringList previewLines;
    const qint32 last = std::min(start + previewLineCount - 1, end);

    for(qint32 pos = start; pos <= last; ++pos)
    {
        const std::optional<QString>& content = diffLines.at(pos).getOriginalContent();
        if(content.has_value())
            previewLines.append(Utils::trimmedLine(*content));
    }

    return Utils::elide(previewLines.join(' '), previewLength);
}

void CollapsedSectionList::calcSections(const DiffLineList& diffLines, qint32 minRunLength, qint32 previewLength)
{
    const qint32 lineCount = SafeInt<qint32>(diffLines.size());
    std::optional<qint32> runStart;

    // pos == lineCount closes a run that reaches the end of the sequence.
    for(qint32 pos = 0; pos <= lineCount; ++pos)
    {
        if(pos < lineCount && diffLines[pos].isMatch())
        {
            if(!runStart.has_value())
                runStart = pos;
            continue;
        }

        if(runStart.has_value())
        {
            const qint32 end = pos - 1;
            if(pos - *runStart >= minRunLength)
                emplace_back(*runStart, end, createPreview(diffLines, *runStart, end, previewLength));

            runStart.reset();
        }
    }
}

std::vector<qint32> DiffResult::differenceIndices() const
{
    std::vector<qint32> indices;
    for(qint32 pos = 0; pos < size(); ++pos)
    {
        if(mDiffLines[pos].isDifference())
            indices.push_back(pos);
    }
    return indices;
}

const CollapsedSection* DiffResult::sectionContaining(qint32 pos) const
{
    // Sections are sorted by start, the only candidate is the last one starting at or before pos.
    const CollapsedSectionList::const_iterator next = std::upper_bound(mSections.cbegin(), mSections.cend(), pos,
                                                                       [](qint32 p, const CollapsedSection& section) { return p < section.startLine(); });
    if(next == mSections.cbegin())
        return nullptr;

    const CollapsedSection& section = *std::prev(next);
    return section.contains(pos) ? &section : nullptr;
}
