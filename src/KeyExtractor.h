// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef KEYEXTRACTOR_H
#define KEYEXTRACTOR_H

#include <optional>

#include <QString>

/*
    Guesses the structural key of a key/value line.

    This is a classification hint and not a parser. A quoted JSON key ("name": ...) is tried first,
    then a bare YAML key (name: ...). Lines that match neither pattern have no key, so the caller
    falls back to content and lookahead comparison. Colons inside values can yield a key that is
    not really one.
*/
class KeyExtractor
{
  public:
    [[nodiscard]] static std::optional<QString> extractKey(const QString& line);

  private:
    [[nodiscard]] static std::optional<QString> extractJsonKey(const QString& line);
    [[nodiscard]] static std::optional<QString> extractYamlKey(const QString& line);
};

#endif
