// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "common.h"
#include "TypeUtils.h"

#include <map>
#include <optional>

#include <QLatin1String>

ValueMap::ValueMap() = default;

ValueMap::~ValueMap() = default;

QString ValueMap::getAsString()
{
    QString result;

    for(const auto &entry: m_map)
    {
        result += entry.first + '=' + entry.second + '\n';
    }
    return result;
}

void ValueMap::writeEntry(const QString& k, qint32 v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, bool v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, const QString& v)
{
    m_map[k] = v;
}

std::optional<bool> ValueMap::toBool(const QString& value)
{
    const QString s = value.trimmed();
    // Accept the spelling users type on the command line as well as the stored 0/1.
    if(s == QLatin1String("1") || s.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0)
        return true;
    if(s == QLatin1String("0") || s.compare(QLatin1String("false"), Qt::CaseInsensitive) == 0)
        return false;

    return {};
}

std::optional<qint32> ValueMap::toNumber(const QString& value)
{
    bool ok = false;
    const qint32 ival = value.trimmed().toInt(&ok);
    if(!ok)
        return {};

    return ival;
}

bool ValueMap::readBoolEntry(const QString& k, bool bDefault)
{
    std::map<QString, QString>::const_iterator i = m_map.find(k);
    if(i == m_map.end())
        return bDefault;

    return toBool(i->second).value_or(bDefault);
}

qint32 ValueMap::readNumEntry(const QString& k, qint32 iDefault)
{
    std::map<QString, QString>::const_iterator i = m_map.find(k);
    if(i == m_map.end())
        return iDefault;

    return toNumber(i->second).value_or(iDefault);
}

bool ValueMap::readEntry(const QString& s, bool bDefault)
{
    return readBoolEntry(s, bDefault);
}
qint32 ValueMap::readEntry(const QString& s, qint32 iDefault)
{
    return readNumEntry(s, iDefault);
}
