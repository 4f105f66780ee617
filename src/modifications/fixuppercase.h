/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"

/** @class FixUppercase
    @brief Makes all-uppercase subtitles readable: every sentence-like run of text
    is capitalized on its own. Runs are delimited by . ! ? ♪ and -, so phrases between
    music notes get their own capital letter.
    Only applied to subtitles detected as uppercase, after all other modifications.
 */
class FixUppercase : public FileModification
{
public:
    FixUppercase();

    void apply(SubtitleEntries &entries, ModificationContext &context) const override;

    /** @brief Capitalize each delimiter-bounded run of @param text */
    static QString capitalize(const QString &text);

    static const QString Identifier;
};
