// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#ifndef TYPEUTILS_H
#define TYPEUTILS_H

#include <QtGlobal>

#include <limits>
#include <stdlib.h>
#include <type_traits>

#include <boost/safe_numerics/automatic.hpp>
#include <boost/safe_numerics/safe_integer.hpp>
#include <boost/safe_numerics/safe_integer_range.hpp>

using QtSizeType = qsizetype;
using LineCount = qint32;

template <typename T>
using limits = std::numeric_limits<T>;

using GhostDiff_exception_policy = boost::safe_numerics::exception_policy<
    boost::safe_numerics::throw_exception, // arithmetic error
    boost::safe_numerics::trap_exception,  // implementation defined behavior
    boost::safe_numerics::trap_exception,  // undefined behavior
    boost::safe_numerics::trap_exception   // uninitialized value
>;

template <typename T, T MIN = limits<T>::min(), T MAX = limits<T>::max()>
using SafeSignedRange =
    boost::safe_numerics::safe_signed_range<MIN, MAX>;

template <typename T>
using SafeInt = boost::safe_numerics::safe<T, boost::safe_numerics::automatic, GhostDiff_exception_policy>;

// Upper bound for the lookahead window accepted from configuration.
constexpr static qint32 maxLookAheadWindow = 1000;

static_assert(sizeof(QtSizeType) >= sizeof(LineCount), "Size mis-match this configuration is not supported.");

#endif
