// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DIFF_H
#define DIFF_H

#include "LineRef.h"
#include "LookAheadMatcher.h"
#include "TypeUtils.h"

#include <optional>
#include <utility>
#include <vector>

#include <QString>
#include <QStringList>

constexpr qint32 defaultMinCollapseRun = 3;
constexpr qint32 defaultPreviewLength = 60;
// Number of leading lines of a collapsed run shown in its preview.
constexpr qint32 previewLineCount = 2;

enum class e_DiffType
{
    Match,          // same trimmed text in both documents
    OnlyInOriginal, // removed in ghost
    OnlyInGhost,    // added in ghost
    Modified        // same slot or same key, different content
};

/*
    One entry of the aligned output.
    Match and Modified carry both sides, OnlyInOriginal only the original side and
    OnlyInGhost only the ghost side. The missing side has an invalid LineRef and no text.
*/
class DiffLine
{
  public:
    [[nodiscard]] static DiffLine match(LineRef originalLine, LineRef ghostLine, const QString& originalContent, const QString& ghostContent)
    {
        return DiffLine(e_DiffType::Match, originalLine, ghostLine, originalContent, ghostContent);
    }

    [[nodiscard]] static DiffLine modified(LineRef originalLine, LineRef ghostLine, const QString& originalContent, const QString& ghostContent)
    {
        return DiffLine(e_DiffType::Modified, originalLine, ghostLine, originalContent, ghostContent);
    }

    [[nodiscard]] static DiffLine onlyInOriginal(LineRef originalLine, const QString& originalContent)
    {
        return DiffLine(e_DiffType::OnlyInOriginal, originalLine, LineRef(), originalContent, std::nullopt);
    }

    [[nodiscard]] static DiffLine onlyInGhost(LineRef ghostLine, const QString& ghostContent)
    {
        return DiffLine(e_DiffType::OnlyInGhost, LineRef(), ghostLine, std::nullopt, ghostContent);
    }

    [[nodiscard]] inline e_DiffType getType() const { return mType; }

    [[nodiscard]] inline LineRef getOriginalLine() const { return mOriginalLine; }
    [[nodiscard]] inline LineRef getGhostLine() const { return mGhostLine; }

    [[nodiscard]] inline const std::optional<QString>& getOriginalContent() const { return mOriginalContent; }
    [[nodiscard]] inline const std::optional<QString>& getGhostContent() const { return mGhostContent; }

    [[nodiscard]] inline bool isMatch() const { return mType == e_DiffType::Match; }
    [[nodiscard]] inline bool isDifference() const { return !isMatch(); }

    bool operator==(const DiffLine& other) const
    {
        return mType == other.mType && mOriginalLine == other.mOriginalLine && mGhostLine == other.mGhostLine &&
               mOriginalContent == other.mOriginalContent && mGhostContent == other.mGhostContent;
    }

    bool operator!=(const DiffLine& other) const
    {
        return !(*this == other);
    }

  private:
    DiffLine(e_DiffType type, LineRef originalLine, LineRef ghostLine, std::optional<QString> originalContent, std::optional<QString> ghostContent)
        : mType(type), mOriginalLine(originalLine), mGhostLine(ghostLine),
          mOriginalContent(std::move(originalContent)), mGhostContent(std::move(ghostContent))
    {
    }

    e_DiffType mType = e_DiffType::Match;
    LineRef mOriginalLine;
    LineRef mGhostLine;
    std::optional<QString> mOriginalContent;
    std::optional<QString> mGhostContent;
};

// How an ambiguous pair of lines is consumed by the alignment.
enum class e_AlignmentStep
{
    Insertion,   // emit the ghost line as OnlyInGhost
    Deletion,    // emit the original line as OnlyInOriginal
    Modification // emit both as Modified
};

class DiffLineList: public std::vector<DiffLine>
{
  public:
    using std::vector<DiffLine>::vector;

    /*
        Walks both documents with one cursor each and appends exactly one DiffLine per step
        until both are exhausted.
    */
    void calcAlignment(const QStringList& original, const QStringList& ghost, qint32 lookAheadWindow = defaultLookAheadWindow);

    /*
        Drops OnlyInOriginal/OnlyInGhost pairs whose trimmed text is equal and not empty,
        regardless of how far apart they are. Each original entry pairs with the first unused
        ghost entry in output order.
    */
    void filterFalsePositives();

    [[nodiscard]] static e_AlignmentStep chooseAlignmentStep(const LookAheadMatch& originalInGhost, const LookAheadMatch& ghostInOriginal);

    [[nodiscard]] LineCount differenceCount() const;

    void dump() const;
};

class CollapsedSection
{
  public:
    CollapsedSection() = default;
    CollapsedSection(qint32 startLine, qint32 endLine, const QString& preview)
        : mStartLine(startLine), mEndLine(endLine), mPreview(preview)
    {
    }

    // Positions index the DiffLine sequence, not the source documents. The range is inclusive.
    [[nodiscard]] inline qint32 startLine() const { return mStartLine; }
    [[nodiscard]] inline qint32 endLine() const { return mEndLine; }
    [[nodiscard]] inline qint32 lineCount() const { return mEndLine - mStartLine + 1; }
    [[nodiscard]] inline const QString& preview() const { return mPreview; }

    [[nodiscard]] inline bool contains(qint32 pos) const { return pos >= mStartLine && pos <= mEndLine; }

    [[nodiscard]] QString displayText() const;

    bool operator==(const CollapsedSection& other) const
    {
        return mStartLine == other.mStartLine && mEndLine == other.mEndLine && mPreview == other.mPreview;
    }

  private:
    qint32 mStartLine = 0;
    qint32 mEndLine = 0;
    QString mPreview;
};

class CollapsedSectionList: public std::vector<CollapsedSection>
{
  public:
    using std::vector<CollapsedSection>::vector;

    void calcSections(const DiffLineList& diffLines, qint32 minRunLength = defaultMinCollapseRun, qint32 previewLength = defaultPreviewLength);

    [[nodiscard]] static QString createPreview(const DiffLineList& diffLines, qint32 start, qint32 end, qint32 previewLength = defaultPreviewLength);
};

/*
    Result of one comparison. Built once from the filtered line list and its sections and
    never modified afterwards. Expansion state of sections belongs to the caller.
*/
class DiffResult
{
  public:
    DiffResult() = default;
    DiffResult(DiffLineList diffLines, CollapsedSectionList sections)
        : mDiffLines(std::move(diffLines)), mSections(std::move(sections))
    {
    }

    [[nodiscard]] inline const DiffLineList& lines() const { return mDiffLines; }
    [[nodiscard]] inline const CollapsedSectionList& sections() const { return mSections; }

    [[nodiscard]] inline const DiffLine& lineAt(qint32 pos) const { return mDiffLines.at(pos); }
    [[nodiscard]] inline LineCount size() const { return SafeInt<LineCount>(mDiffLines.size()); }
    [[nodiscard]] inline bool isEmpty() const { return mDiffLines.empty(); }

    [[nodiscard]] LineCount differenceCount() const { return mDiffLines.differenceCount(); }
    [[nodiscard]] std::vector<qint32> differenceIndices() const;

    // nullptr if pos is not inside a collapsed section.
    [[nodiscard]] const CollapsedSection* sectionContaining(qint32 pos) const;

  private:
    DiffLineList mDiffLines;
    CollapsedSectionList mSections;
};

#endif
