/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"

/** @class RemoveTags
    @brief Removes all style tags (font, bold, italic, color...) keeping the line breaks
 */
class RemoveTags : public FileModification
{
public:
    RemoveTags();

    void apply(SubtitleEntries &entries, ModificationContext &context) const override;

    static const QString Identifier;
};
