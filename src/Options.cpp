// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "options.h"

#include "ConfigValueMap.h"
#include "Logging.h"
#include "OptionItems.h"
#include "TypeUtils.h"

#include <boost/bind/bind.hpp>
#include <boost/signals2.hpp>
#include <memory>

#include <KSharedConfig>

boost::signals2::signal<void ()> Options::resetToDefaults;
boost::signals2::signal<void (ValueMap*)> Options::read;
boost::signals2::signal<void (ValueMap*)> Options::write;

boost::signals2::signal<void ()> Options::unpreserve;

OptionItemBase::OptionItemBase(const QString& saveName)
{
    m_saveName = saveName;
    m_bPreserved = false;

    connections.push_back(Options::resetToDefaults.connect(boost::bind(&OptionItemBase::setToDefault, this)));

    connections.push_back(Options::read.connect(boost::bind(&OptionItemBase::read, this, boost::placeholders::_1)));
    connections.push_back(Options::write.connect(boost::bind(&OptionItemBase::write, this, boost::placeholders::_1)));

    connections.push_back(Options::unpreserve.connect(boost::bind(&OptionItemBase::unpreserve, this)));
}

void OptionItemBase::accept(const QString& val)
{
    preserve();

    ValueMap config;
    config.writeEntry(m_saveName, val); // Write the value as a string and
    read(&config);                      // use the internal conversion from string to the needed value.
}

void Options::init()
{
    addOptionItem(std::make_shared<OptionIntRange>(defaultLookAheadWindow, "LookAheadWindow", &m_lookAheadWindow, 1, maxLookAheadWindow));
    addOptionItem(std::make_shared<OptionIntRange>(defaultMinCollapseRun, "MinCollapseRun", &m_minCollapseRun, 1, limits<qint32>::max()));
    addOptionItem(std::make_shared<OptionIntRange>(defaultPreviewLength, "PreviewLength", &m_previewLength, 1, limits<qint32>::max()));

    addOptionItem(std::make_shared<OptionBool>(true, "ShowLineNumbers", &m_bShowLineNumbers));
    addOptionItem(std::make_shared<OptionBool>(true, "ExpandSectionsByDefault", &m_bExpandSectionsByDefault));
}

void Options::saveOptions(const KSharedConfigPtr config)
{
    // No i18n()-Translations here!

    ConfigValueMap cvm(config->group(GHOSTDIFF_CONFIG_GROUP));

    // Command line overrides are not persisted.
    unpreserve();
    write(&cvm);
}

void Options::readOptions(const KSharedConfigPtr config)
{
    // No i18n()-Translations here!

    ConfigValueMap cvm(config->group(GHOSTDIFF_CONFIG_GROUP));

    read(&cvm);
    qCInfo(ghostdiffOptions) << "readOptions: LookAheadWindow =" << m_lookAheadWindow << ", MinCollapseRun =" << m_minCollapseRun << ", PreviewLength =" << m_previewLength;
}

const QString Options::parseOptions(const QStringList& optionList)
{
    QString result;

    for(const QString& optionString: optionList)
    {
        const QtSizeType pos = optionString.indexOf('=');
        if(pos > 0) // seems not to have a tag
        {
            const QString key = optionString.left(pos);
            const QString val = optionString.mid(pos + 1);

            const std::shared_ptr<OptionItemBase> pItem = findOptionItem(key);

            if(pItem == nullptr)
            {
                qCWarning(ghostdiffOptions) << "Unknown config item" << key;
                result += "No config item named \"" + key + "\"\n";
            }
            else if(!pItem->isValidValue(val))
            {
                qCWarning(ghostdiffOptions) << "Invalid value" << val << "for" << key;
                result += "Invalid value \"" + val + "\" for config item \"" + key + "\"\n";
            }
            else
            {
                pItem->accept(val);
            }
        }
        else
        {
            result += "No '=' found in \"" + optionString + "\"\n";
        }
    }
    return result;
}

QString Options::calcOptionHelp()
{
    ValueMap config;

    write(&config);

    return config.getAsString();
}

void Options::addOptionItem(std::shared_ptr<OptionItemBase> inItem)
{
    mOptionItemList.push_back(inItem);
}

std::shared_ptr<OptionItemBase> Options::findOptionItem(const QString& saveName) const
{
    for(const std::shared_ptr<OptionItemBase>& pItem: mOptionItemList)
    {
        if(pItem->getSaveName() == saveName)
            return pItem;
    }
    return nullptr;
}
