/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"

/** @class FixShort
    @brief Merges very short, flashing entries backward into the entry before them,
    as long as the result stays within the configured duration, line length and
    line count limits. The entry list is rebuilt and may shrink.
 */
class FixShort : public FileModification
{
public:
    struct Limits
    {
        /** Entries at least this long (in ms) are never merged */
        int maxDuration{500};
        int maxLineLength{200};
        int maxLines{3};

        /** @brief Limits configured in SubfixerSettings */
        static Limits fromSettings();
    };

    /** @brief The entry list being rebuilt */
    struct State
    {
        SubtitleEntries output;
        /** The last output entry must not receive merges */
        bool previousLocked{false};
    };

    /** @brief Build with the limits from the settings */
    FixShort();
    explicit FixShort(const Limits &limits);

    void apply(SubtitleEntries &entries, ModificationContext &context) const override;

    const Limits &limits() const;

    /** @brief Pack @param lines: a line ending with punctuation joins the previous packed
        line when both differ and the joined line fits in @param maxLineLength. Empty lines are dropped.
    */
    static QStringList packLines(const QStringList &lines, int maxLineLength);

    /** @brief Add @param entry to @param state, merging it into the last output entry when allowed */
    static void step(State &state, const SubtitleEntry &entry, const Limits &limits);

    static const QString Identifier;

private:
    Limits m_limits;
};
