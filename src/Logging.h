/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef LOGGING_H
#define LOGGING_H
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ghostdiffMain);

Q_DECLARE_LOGGING_CATEGORY(ghostdiffCore); //very noisey traces every alignment step.
Q_DECLARE_LOGGING_CATEGORY(ghostdiffOptions);

#endif // !LOGGING_H
