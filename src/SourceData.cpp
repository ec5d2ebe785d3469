// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "SourceData.h"

#include "Logging.h"

#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QTextCodec>

void SourceData::reset()
{
    mFileName.clear();
    mAliasName.clear();
    mText.clear();
    mErrors.clear();
    mIncompleteConversion = false;
}

void SourceData::setFilename(const QString& filename)
{
    reset();
    mFileName = filename;
}

void SourceData::readAndPreprocess()
{
    mErrors.clear();
    mText.clear();
    mIncompleteConversion = false;

    const QFileInfo info(mFileName);
    if(!info.exists())
    {
        mErrors.append(QStringLiteral("File not found: %1").arg(mFileName));
        return;
    }

    if(!info.isFile())
    {
        mErrors.append(QStringLiteral("%1 is not a normal file.").arg(mFileName));
        return;
    }

    QFile file(mFileName);
    if(!file.open(QIODevice::ReadOnly))
    {
        mErrors.append(QStringLiteral("Failed to read file: %1 (%2)").arg(mFileName, file.errorString()));
        return;
    }

    const QByteArray data = file.readAll();
    if(file.error() != QFileDevice::NoError)
    {
        mErrors.append(QStringLiteral("Failed to read file: %1 (%2)").arg(mFileName, file.errorString()));
        return;
    }

    const bool bHasBOM = data.startsWith("\xEF\xBB\xBF");
    const qint32 skipBytes = bHasBOM ? 3 : 0;

    QTextCodec* pCodec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state(QTextCodec::IgnoreHeader);
    mText = pCodec->toUnicode(data.constData() + skipBytes, data.size() - skipBytes, &state);
    mIncompleteConversion = state.invalidChars > 0;

    if(mIncompleteConversion)
        qCWarning(ghostdiffMain) << "Invalid UTF-8 in" << mFileName << ", replaced" << state.invalidChars << "characters";

    qCInfo(ghostdiffMain) << "Read" << data.size() << "bytes from" << mFileName << (bHasBOM ? "with BOM" : "");
}
