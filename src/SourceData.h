// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SOURCEDATA_H
#define SOURCEDATA_H

#include <QString>
#include <QStringList>

/*
    One side of a comparison, read from a file.
    Problems while reading are collected in getErrors() instead of being thrown.
*/
class SourceData
{
  public:
    void setFilename(const QString& filename);
    void setAliasName(const QString& name) { mAliasName = name; }
    // Name to show to the user, the alias if one was set.
    [[nodiscard]] QString getAliasName() const { return mAliasName.isEmpty() ? mFileName : mAliasName; }

    [[nodiscard]] bool isValid() const { return mErrors.isEmpty(); }
    [[nodiscard]] bool isIncompleteConversion() const { return mIncompleteConversion; } // true if invalid UTF-8 was replaced

    // Reads and decodes the file set by setFilename. A leading UTF-8 BOM is dropped.
    void readAndPreprocess();

    [[nodiscard]] const QString& getText() const { return mText; }
    [[nodiscard]] const QStringList& getErrors() const { return mErrors; }

    void reset();

  private:
    QString mFileName;
    QString mAliasName;
    QString mText;
    QStringList mErrors;

    bool mIncompleteConversion = false;
};

#endif
