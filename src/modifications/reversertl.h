/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "textmodification.h"

/** @class ReverseRtl
    @brief Some playback devices don't handle right-to-left markers for punctuation.
    This physically swaps the leading and trailing punctuation of each line.
 */
class ReverseRtl : public TextModification
{
public:
    ReverseRtl();

    static const QString Identifier;
};
