/**
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../GhostDiffEngine.h"
#include "../SectionFolding.h"

#include <vector>

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTest>

class SectionFoldingTest: public QObject
{
    Q_OBJECT;
  private:
    // Match x3, Modified, Match x3: sections at [0, 2] and [4, 6].
    const DiffResult result = GhostDiffEngine::compare("a\nb\nc\nX\nd\ne\nf", "a\nb\nc\nY\nd\ne\nf");

    static std::vector<qint32> positions(const std::vector<VisibleRow>& rows, e_RowType type)
    {
        std::vector<qint32> found;
        for(const VisibleRow& row: rows)
        {
            if(row.type == type)
                found.push_back(row.position);
        }
        return found;
    }

  private Q_SLOTS:
    void initTestCase()
    {
        QCOMPARE(int(result.sections().size()), 2);
    }

    void testCollapsed()
    {
        SectionFolding folding;
        const std::vector<VisibleRow> rows = folding.visibleRows(result);

        QCOMPARE(int(rows.size()), 3);
        QCOMPARE(rows[0].type, e_RowType::SectionHeader);
        QCOMPARE(rows[0].position, 0);
        QVERIFY(rows[0].pSection == &result.sections()[0]);
        QCOMPARE(rows[1].type, e_RowType::Line);
        QCOMPARE(rows[1].position, 3);
        QVERIFY(rows[1].pSection == nullptr);
        QCOMPARE(rows[2].type, e_RowType::SectionHeader);
        QCOMPARE(rows[2].position, 4);
    }

    void testExpandAll()
    {
        SectionFolding folding;
        folding.expandAll(result);
        const std::vector<VisibleRow> rows = folding.visibleRows(result);

        QCOMPARE(int(rows.size()), 9);
        QCOMPARE(positions(rows, e_RowType::SectionHeader), (std::vector<qint32>{0, 4}));
        QCOMPARE(positions(rows, e_RowType::Line), (std::vector<qint32>{0, 1, 2, 3, 4, 5, 6}));
        // The header precedes the first line of its section.
        QCOMPARE(rows[0].type, e_RowType::SectionHeader);
        QCOMPARE(rows[1].type, e_RowType::Line);
        QVERIFY(rows[1].pSection == &result.sections()[0]);

        folding.collapseAll();
        QCOMPARE(int(folding.visibleRows(result).size()), 3);
    }

    void testToggle()
    {
        SectionFolding folding;
        folding.expandAll(result);

        const CollapsedSection& first = result.sections()[0];
        folding.toggle(first);
        QVERIFY(!folding.isExpanded(first));
        QVERIFY(folding.isExpanded(result.sections()[1]));

        const std::vector<VisibleRow> rows = folding.visibleRows(result);
        QCOMPARE(int(rows.size()), 6);
        QCOMPARE(positions(rows, e_RowType::Line), (std::vector<qint32>{3, 4, 5, 6}));

        folding.toggle(first);
        QVERIFY(folding.isExpanded(first));
        QCOMPARE(int(folding.visibleRows(result).size()), 9);
    }

    void testSetExpanded()
    {
        SectionFolding folding;
        const CollapsedSection& second = result.sections()[1];

        folding.setExpanded(second, true);
        folding.setExpanded(second, true);
        QVERIFY(folding.isExpanded(second));
        QCOMPARE(int(folding.visibleRows(result).size()), 6);

        folding.setExpanded(second, false);
        QVERIFY(!folding.isExpanded(second));
    }

    void testRowsFollowManySections()
    {
        QStringList original;
        QStringList ghost;
        for(qint32 block = 0; block < 4; ++block)
        {
            for(qint32 i = 0; i < 3; ++i)
            {
                const QString line = QStringLiteral("m%1_%2").arg(block).arg(i);
                original.append(line);
                ghost.append(line);
            }
            original.append(QStringLiteral("x%1").arg(block));
            ghost.append(QStringLiteral("y%1").arg(block));
        }
        original << "t1" << "t2";
        ghost << "t1" << "t2";

        const DiffResult many = GhostDiffEngine::compare(original, ghost, defaultLookAheadWindow, defaultMinCollapseRun, defaultPreviewLength);
        QCOMPARE(many.size(), 18);
        QCOMPARE(int(many.sections().size()), 4);

        SectionFolding folding;
        QCOMPARE(int(folding.visibleRows(many).size()), 10);

        folding.expandAll(many);
        const std::vector<VisibleRow> rows = folding.visibleRows(many);
        QCOMPARE(int(rows.size()), 22);
        QCOMPARE(positions(rows, e_RowType::SectionHeader), (std::vector<qint32>{0, 4, 8, 12}));
        for(const VisibleRow& row: rows)
        {
            QVERIFY(row.pSection == many.sectionContaining(row.position));
        }

        folding.setExpanded(many.sections()[0], false);
        folding.setExpanded(many.sections()[2], false);
        QCOMPARE(positions(folding.visibleRows(many), e_RowType::Line), (std::vector<qint32>{3, 4, 5, 6, 7, 11, 12, 13, 14, 15, 16, 17}));
    }

    void testNoSections()
    {
        const DiffResult small = GhostDiffEngine::compare("a\nb", "a\nc");
        SectionFolding folding;

        const std::vector<VisibleRow> rows = folding.visibleRows(small);
        QCOMPARE(int(rows.size()), 2);
        QCOMPARE(positions(rows, e_RowType::Line), (std::vector<qint32>{0, 1}));
    }
};

QTEST_GUILESS_MAIN(SectionFoldingTest);

#include "SectionFoldingTest.moc"
