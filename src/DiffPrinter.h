// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DIFFPRINTER_H
#define DIFFPRINTER_H

#include "diff.h"
#include "LineRef.h"

#include <QString>

class QTextStream;
class SectionFolding;

/*
    Plain text rendering of a DiffResult.

    Each row starts with a marker: two spaces for matching lines, "- " for the original side and
    "+ " for the ghost side. Modified lines print both sides, original first. Line numbers are
    one based.
*/
class DiffPrinter
{
  public:
    explicit DiffPrinter(QTextStream& out, bool bShowLineNumbers = true)
        : mOut(out), mbShowLineNumbers(bShowLineNumbers)
    {
    }

    void printResult(const DiffResult& result, const SectionFolding& folding);
    // Summary line plus one entry per difference with its line numbers in both documents.
    void printSummary(const DiffResult& result);

    [[nodiscard]] static QString summaryText(qint32 differenceCount);

  private:
    void printLine(const DiffLine& line);
    void printRow(const QString& marker, LineRef lineNumber, const QString& content);
    void printSectionHeader(const CollapsedSection& section, bool bExpanded);
    [[nodiscard]] QString lineNumberText(LineRef line) const;

    QTextStream& mOut;
    bool mbShowLineNumbers = true;
};

#endif
