/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"

/** @class FixIncremental
    @brief Fixes typewriter-style subtitles where every entry repeats the previous
    one plus a few words. Each entry keeps only what it adds to its predecessor.
 */
class FixIncremental : public FileModification
{
public:
    /** @brief What is carried from one entry to the next */
    struct State
    {
        bool hasPrevious{false};
        /** Text of the previous entry after filtering */
        QString previousText;
        /** Text of the previous entry before filtering */
        QString previousOriginal;
    };

    FixIncremental();

    void apply(SubtitleEntries &entries, ModificationContext &context) const override;

    /** @brief Filter one entry against @param state and advance the state.
        A line is dropped when the previous text ends with it, and reduced to its
        remainder when it starts with the whole previous text. Comparisons ignore case.
    */
    static SubtitleEntry step(State &state, const SubtitleEntry &entry);

    static const QString Identifier;
};
