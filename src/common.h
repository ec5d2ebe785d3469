// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef COMMON_H
#define COMMON_H

#include <map>
#include <optional>

#include <QString>

/*
    Plain key=value store used to convert option values to and from text.
    ConfigValueMap overrides the virtual accessors to go through KConfig instead.
*/
class ValueMap
{
  private:
    std::map<QString, QString> m_map;

  public:
    ValueMap();
    virtual ~ValueMap();

    QString getAsString();

    virtual void writeEntry(const QString&, qint32);
    virtual void writeEntry(const QString&, bool);
    void writeEntry(const QString&, const QString&);

    bool        readEntry(const QString& s, bool bDefault);
    qint32      readEntry(const QString& s, qint32 iDefault);

    // Text to value conversions shared by the option readers. Empty if the text does not parse.
    [[nodiscard]] static std::optional<bool> toBool(const QString& value);
    [[nodiscard]] static std::optional<qint32> toNumber(const QString& value);

  private:
    virtual bool        readBoolEntry(const QString&, bool bDefault);
    virtual qint32      readNumEntry(const QString&, qint32 iDefault);
};

#endif
