// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#ifndef LINEREF_H
#define LINEREF_H

#include "TypeUtils.h"

#include <type_traits>

#include <QtGlobal>

/*
    Zero based line index into one of the compared documents.
    A default constructed LineRef is invalid and stands for "this side has no line".
    Values outside [-1, INT32_MAX] throw instead of wrapping.
*/
class LineRef
{
  public:
    typedef qint32 LineType;

    static constexpr LineType invalid = -1;
    constexpr LineRef() = default;
    //cppcheck-suppress noExplicitConstructor
    LineRef(const qint64 i)
    {
        mLineNumber = i;
    }

    operator LineType() const noexcept { return mLineNumber; }

    LineRef& operator=(const LineType lineIn)
    {
        mLineNumber = lineIn;
        return *this;
    }

    LineRef& operator++()
    {
        ++mLineNumber;
        return *this;
    };

    void invalidate() { mLineNumber = invalid; }
    [[nodiscard]] bool isValid() const { return mLineNumber != invalid; }

  private:
    SafeSignedRange<LineType, invalid> mLineNumber = invalid;
};

static_assert(std::is_copy_constructible<LineRef>::value, "LineRef must be copy constructible.");
static_assert(std::is_copy_assignable<LineRef>::value, "LineRef must copy assignable.");
static_assert(std::is_convertible<LineRef, qint64>::value, "Can not convert LineRef to qint64.");
static_assert(std::is_convertible<qint64, LineRef>::value, "Can not convert qint64 to LineRef.");

using LineType = LineRef::LineType;

#endif
