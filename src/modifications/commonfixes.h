/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "textmodification.h"

/** @class CommonFixes
    @brief Fixes common whitespace, punctuation, dash and quote issues.
    The order of the rules matters: most of them expect the text to already be
    normalized by the ones before.
 */
class CommonFixes : public TextModification
{
public:
    CommonFixes();

    static const QString Identifier;

private:
    static QList<TextRule> buildRules();
};
