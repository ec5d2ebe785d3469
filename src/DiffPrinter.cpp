// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "DiffPrinter.h"

#include "SectionFolding.h"

#include <QLatin1String>
#include <QTextStream>

namespace {
constexpr qint32 lineNumberWidth = 5;

QString typeLabel(e_DiffType type)
{
    switch(type)
    {
        case e_DiffType::Match:
            return QStringLiteral("match");
        case e_DiffType::OnlyInOriginal:
            return QStringLiteral("only in original");
        case e_DiffType::OnlyInGhost:
            return QStringLiteral("only in ghost");
        case e_DiffType::Modified:
            return QStringLiteral("modified");
    }
    return QString();
}
} // namespace

QString DiffPrinter::summaryText(qint32 differenceCount)
{
    if(differenceCount == 0)
        return QStringLiteral("No differences found");
    if(differenceCount == 1)
        return QStringLiteral("1 difference found");

    return QStringLiteral("%1 differences found").arg(differenceCount);
}

QString DiffPrinter::lineNumberText(LineRef line) const
{
    if(!line.isValid())
        return QString(lineNumberWidth, ' ');

    return QStringLiteral("%1").arg(line + 1, lineNumberWidth);
}

void DiffPrinter::printRow(const QString& marker, LineRef lineNumber, const QString& content)
{
    mOut << marker;
    if(mbShowLineNumbers)
        mOut << lineNumberText(lineNumber) << " | ";
    mOut << content << '\n';
}

void DiffPrinter::printLine(const DiffLine& line)
{
    switch(line.getType())
    {
        case e_DiffType::Match:
            printRow(QStringLiteral("  "), line.getOriginalLine(), line.getOriginalContent().value_or(QString()));
            break;
        case e_DiffType::Modified:
            printRow(QStringLiteral("- "), line.getOriginalLine(), line.getOriginalContent().value_or(QString()));
            printRow(QStringLiteral("+ "), line.getGhostLine(), line.getGhostContent().value_or(QString()));
            break;
        case e_DiffType::OnlyInOriginal:
            printRow(QStringLiteral("- "), line.getOriginalLine(), line.getOriginalContent().value_or(QString()));
            break;
        case e_DiffType::OnlyInGhost:
            printRow(QStringLiteral("+ "), line.getGhostLine(), line.getGhostContent().value_or(QString()));
            break;
    }
}

void DiffPrinter::printSectionHeader(const CollapsedSection& section, bool bExpanded)
{
    mOut << (bExpanded ? QLatin1String("[-] ") : QLatin1String("[+] ")) << section.displayText() << '\n';
    if(!section.preview().isEmpty())
        mOut << "    " << section.preview() << '\n';
}

void DiffPrinter::printResult(const DiffResult& result, const SectionFolding& folding)
{
    mOut << summaryText(result.differenceCount()) << '\n';

    for(const VisibleRow& row: folding.visibleRows(result))
    {
        if(row.type == e_RowType::SectionHeader)
            printSectionHeader(*row.pSection, folding.isExpanded(*row.pSection));
        else
            printLine(result.lineAt(row.position));
    }
    mOut.flush();
}

void DiffPrinter::printSummary(const DiffResult& result)
{
    const std::vector<qint32> differences = result.differenceIndices();
    const qint32 count = SafeInt<qint32>(differences.size());

    mOut << summaryText(count) << '\n';

    qint32 ordinal = 1;
    for(const qint32 pos: differences)
    {
        const DiffLine& line = result.lineAt(pos);
        mOut << QStringLiteral("%1 / %2: ").arg(ordinal).arg(count) << typeLabel(line.getType());
        if(line.getOriginalLine().isValid())
            mOut << ", original line " << line.getOriginalLine() + 1;
        if(line.getGhostLine().isValid())
            mOut << ", ghost line " << line.getGhostLine() + 1;
        mOut << '\n';
        ++ordinal;
    }
    mOut.flush();
}
