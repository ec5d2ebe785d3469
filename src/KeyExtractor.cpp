// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "KeyExtractor.h"

#include "Utils.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>

std::optional<QString> KeyExtractor::extractKey(const QString& line)
{
    const QString trimmed = Utils::trimmedLine(line);

    std::optional<QString> key = extractJsonKey(trimmed);
    if(key.has_value())
        return key;

    return extractYamlKey(trimmed);
}

std::optional<QString> KeyExtractor::extractJsonKey(const QString& line)
{
    static const QRegularExpression jsonKey(QStringLiteral("^\\s*\"([^\"]+)\"\\s*:"), QRegularExpression::UseUnicodePropertiesOption);

    const QRegularExpressionMatch match = jsonKey.match(line);
    if(!match.hasMatch())
        return {};

    // The whole match is used so "a:b": yields ab, quotes and colons are both dropped.
    QString key = match.captured(0);
    key.remove('"');
    key.remove(':');
    return key.trimmed();
}

std::optional<QString> KeyExtractor::extractYamlKey(const QString& line)
{
    static const QRegularExpression yamlKey(QStringLiteral("^\\s*([^:]+):"), QRegularExpression::UseUnicodePropertiesOption);

    const QRegularExpressionMatch match = yamlKey.match(line);
    if(!match.hasMatch())
        return {};

    QString key = match.captured(0);
    key.remove(':');
    return key.trimmed();
}
