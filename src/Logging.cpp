/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Logging.h"

#ifdef NDEBUG
#define logLevel        QtWarningMsg

#else
#define logLevel         QtInfoMsg
#endif

Q_LOGGING_CATEGORY(ghostdiffMain, "org.ghostdiff", logLevel)
//ghostdiffCore logs one entry per alignment step. Enable with QT_LOGGING_RULES="org.ghostdiff.core.debug=true".
Q_LOGGING_CATEGORY(ghostdiffCore, "org.ghostdiff.core", QtWarningMsg)
Q_LOGGING_CATEGORY(ghostdiffOptions, "org.ghostdiff.options", logLevel)

#undef logLevel
