/**
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../KeyExtractor.h"

#include <optional>

#include <QObject>
#include <QString>
#include <QTest>

class KeyExtractorTest: public QObject
{
    Q_OBJECT;
  private Q_SLOTS:
    void testJsonKey()
    {
        std::optional<QString> key = KeyExtractor::extractKey("\"name\": \"Alice\"");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("name"));

        key = KeyExtractor::extractKey("    \"name\" : 1,");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("name"));

        key = KeyExtractor::extractKey("\"display name\": true");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("display name"));
    }

    /*
        Quotes and colons are stripped from the whole match, so a colon inside the
        quoted key disappears too.
    */
    void testJsonKeyWithColon()
    {
        const std::optional<QString> key = KeyExtractor::extractKey("\"a:b\": 1");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("ab"));
    }

    void testYamlKey()
    {
        std::optional<QString> key = KeyExtractor::extractKey("name: value");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("name"));

        key = KeyExtractor::extractKey("  retries   : 3");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("retries"));

        key = KeyExtractor::extractKey("parent:");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("parent"));
    }

    void testJsonBeforeYaml()
    {
        // The YAML pattern alone would stop at the colon inside the value's URL as well,
        // but the quoted key wins first.
        std::optional<QString> key = KeyExtractor::extractKey("\"url\": \"http://example.org\"");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("url"));

        // Not a quoted key followed by a colon, so the bare pattern takes the whole prefix.
        key = KeyExtractor::extractKey("\"q\" x: 1");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("\"q\" x"));
    }

    // A list item with a mapping is treated like any other prefix before a colon.
    void testYamlListItemWithKey()
    {
        const std::optional<QString> key = KeyExtractor::extractKey("- name: x");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("- name"));
    }

    // Colons inside a plain value produce a key. Known approximation.
    void testSpuriousKey()
    {
        const std::optional<QString> key = KeyExtractor::extractKey("see http://example.org");
        QVERIFY(key.has_value());
        QCOMPARE(*key, QString("see http"));
    }

    void testNoKey()
    {
        QVERIFY(!KeyExtractor::extractKey("").has_value());
        QVERIFY(!KeyExtractor::extractKey("   ").has_value());
        QVERIFY(!KeyExtractor::extractKey("{").has_value());
        QVERIFY(!KeyExtractor::extractKey("},").has_value());
        QVERIFY(!KeyExtractor::extractKey("[1, 2, 3]").has_value());
        QVERIFY(!KeyExtractor::extractKey("- item").has_value());
        QVERIFY(!KeyExtractor::extractKey("plain text").has_value());
        QVERIFY(!KeyExtractor::extractKey(": value").has_value());
    }
};

QTEST_GUILESS_MAIN(KeyExtractorTest);

#include "KeyExtractorTest.moc"
