// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef CONFIGVALUEMAP_H
#define CONFIGVALUEMAP_H

#include "common.h"

#include <KConfigGroup>
#include <QString>

/*
    Option storage in the "GhostDiff Options" group of ghostdiffrc.
    Values are read and written through KConfig's own type conversions.
*/
class ConfigValueMap : public ValueMap
{
  private:
    KConfigGroup m_config;

  public:
    explicit ConfigValueMap(const KConfigGroup& config) : m_config(config) {}

    void writeEntry(const QString& s, qint32 v) override
    {
        m_config.writeEntry(s, v);
    }
    void writeEntry(const QString& s, bool v) override
    {
        m_config.writeEntry(s, v);
    }
private:
    bool readBoolEntry(const QString& s, bool defaultVal) override
    {
        return m_config.readEntry(s, defaultVal);
    }
    qint32 readNumEntry(const QString& s, qint32 defaultVal) override
    {
        return m_config.readEntry(s, defaultVal);
    }
};

#endif // !CONFIGVALUEMAP_H
