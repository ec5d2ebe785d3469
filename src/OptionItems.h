// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONITEMS_H
#define OPTIONITEMS_H

#include "common.h"
#include "options.h"

#include <boost/signals2.hpp>
#include <list>

#include <QString>

class OptionItemBase
{
  public:
    explicit OptionItemBase(const QString& saveName);
    virtual ~OptionItemBase() = default;

    virtual void setToDefault() = 0;

    virtual void write(ValueMap*) const = 0;
    virtual void read(ValueMap*) = 0;

    void preserve()
    {
        if(!m_bPreserved)
        {
            m_bPreserved = true;
            preserveImp();
        }
    }

    void unpreserve()
    {
        if(m_bPreserved)
        {
            m_bPreserved = false;
            unpreserveImp();
        }
    }

    // Applies a command line override. The value read from the config stays preserved.
    void accept(const QString& val);
    // True if val can be converted to this item's type.
    [[nodiscard]] virtual bool isValidValue(const QString& val) const = 0;

    [[nodiscard]] QString getSaveName() const { return m_saveName; }

  protected:
    virtual void preserveImp() = 0;
    virtual void unpreserveImp() = 0;
    bool m_bPreserved = false;
    QString m_saveName;
    std::list<boost::signals2::scoped_connection> connections;
    Q_DISABLE_COPY(OptionItemBase)
};

template <class T>
class Option : public OptionItemBase
{
  public:
    explicit Option(const T& defaultVal, const QString& saveName, T* pVar)
        : OptionItemBase(saveName)
    {
        m_pVar = pVar;
        m_defaultVal = defaultVal;
    }

    void setToDefault() override { *m_pVar = m_defaultVal; }
    [[nodiscard]] const T& getDefault() const { return m_defaultVal; };
    [[nodiscard]] const T getCurrent() const { return *m_pVar; };

    void write(ValueMap* config) const override { config->writeEntry(m_saveName, *m_pVar); }
    void read(ValueMap* config) override { *m_pVar = config->readEntry(m_saveName, m_defaultVal); }

    [[nodiscard]] bool isValidValue(const QString& val) const override;

  protected:
    void preserveImp() override { m_preservedVal = *m_pVar; }
    void unpreserveImp() override { *m_pVar = m_preservedVal; }
    T* m_pVar = nullptr;
    T m_preservedVal;
    T m_defaultVal;

  private:
    Q_DISABLE_COPY(Option)
};

template <>
inline bool Option<qint32>::isValidValue(const QString& val) const
{
    return ValueMap::toNumber(val).has_value();
}

template <>
inline bool Option<bool>::isValidValue(const QString& val) const
{
    return ValueMap::toBool(val).has_value();
}

/*
    Integer option limited to [min, max]. Values read from a config file or
    the command line are clamped into range.
*/
class OptionIntRange : public Option<qint32>
{
  public:
    explicit OptionIntRange(qint32 defaultVal, const QString& saveName, qint32* pVar, qint32 min, qint32 max)
        : Option<qint32>(defaultVal, saveName, pVar), m_min(min), m_max(max)
    {
    }

    void read(ValueMap* config) override
    {
        Option<qint32>::read(config);
        *m_pVar = qBound(m_min, *m_pVar, m_max);
    }

  private:
    qint32 m_min;
    qint32 m_max;
    Q_DISABLE_COPY(OptionIntRange)
};

typedef Option<bool> OptionBool;

#endif // !OPTIONITEMS_H
