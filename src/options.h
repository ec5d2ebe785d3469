// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONS_H
#define OPTIONS_H

#include "diff.h"
#include "LookAheadMatcher.h"

#include <boost/signals2.hpp>
#include <list>
#include <memory>

#include <QString>
#include <QStringList>

#include <KSharedConfig>

class ValueMap;

class OptionItemBase;

constexpr char GHOSTDIFF_CONFIG_GROUP[] = "GhostDiff Options";

class Options
{
  public:
    static boost::signals2::signal<void()> resetToDefaults;
    static boost::signals2::signal<void(ValueMap*)> read;
    static boost::signals2::signal<void(ValueMap*)> write;

    static boost::signals2::signal<void()> unpreserve;

    Options() = default;

    void init();

    void readOptions(const KSharedConfigPtr config);
    void saveOptions(const KSharedConfigPtr config);

    /*
        Applies "Key=Value" overrides. Unknown keys and values that do not convert to the
        option's type are reported and leave the option unchanged. Returns the accumulated
        error text, empty on success.
    */
    const QString parseOptions(const QStringList& optionList);
    [[nodiscard]] QString calcOptionHelp();

    [[nodiscard]] bool showLineNumbers() const { return m_bShowLineNumbers; }
    [[nodiscard]] bool expandSectionsByDefault() const { return m_bExpandSectionsByDefault; }

  private:
    void addOptionItem(std::shared_ptr<OptionItemBase> inItem);
    [[nodiscard]] std::shared_ptr<OptionItemBase> findOptionItem(const QString& saveName) const;

    std::list<std::shared_ptr<OptionItemBase>> mOptionItemList;

    Q_DISABLE_COPY(Options)

  public:
    qint32 m_lookAheadWindow = defaultLookAheadWindow;
    qint32 m_minCollapseRun = defaultMinCollapseRun;
    qint32 m_previewLength = defaultPreviewLength;

    bool m_bShowLineNumbers = true;
    bool m_bExpandSectionsByDefault = true;
};

#endif
