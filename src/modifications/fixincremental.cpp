/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "fixincremental.h"
#include "modificationcontext.h"
#include "subfixer_debug.h"

#include <KLocalizedString>

const QString FixIncremental::Identifier = QStringLiteral("fix_incremental");

static ModificationInfo fixIncrementalInfo()
{
    ModificationInfo info;
    info.identifier = FixIncremental::Identifier;
    info.description = i18n("Fixes incremental-repeating subtitles");
    info.longDescription = i18n("Some subtitles build every line word by word, repeating the previous entry each time. "
                                "This keeps only the new part of each entry.");
    info.exclusive = true;
    return info;
}

FixIncremental::FixIncremental()
    : FileModification(fixIncrementalInfo())
{
}

void FixIncremental::apply(SubtitleEntries &entries, ModificationContext &context) const
{
    State state;
    for (SubtitleEntry &entry : entries) {
        if (!entry.isValid()) {
            context.report(identifier(), entry.text(), i18n("Invalid entry %1 left unmodified", entry.index()));
            continue;
        }
        entry = step(state, entry);
    }
}

// static
SubtitleEntry FixIncremental::step(State &state, const SubtitleEntry &entry)
{
    SubtitleEntry result = entry;
    const QString original = entry.text();
    if (state.hasPrevious) {
        QStringList kept;
        const QStringList lines = entry.lines();
        for (const QString &line : lines) {
            if (!state.previousText.isEmpty() && state.previousText.endsWith(line, Qt::CaseInsensitive)) {
                qCDebug(SUBFIXER_LOG) << "Skipping incremental/dup:" << line;
                continue;
            }
            if (!state.previousOriginal.isEmpty() && line.startsWith(state.previousOriginal, Qt::CaseInsensitive)) {
                const QString remainder = line.mid(state.previousOriginal.length());
                qCDebug(SUBFIXER_LOG) << "Stripping incremental prefix:" << line << "->" << remainder;
                if (!remainder.isEmpty()) {
                    kept << remainder;
                }
                continue;
            }
            kept << line;
        }
        result.setLines(kept);
    }
    state.hasPrevious = true;
    state.previousText = result.text();
    state.previousOriginal = original;
    return result;
}
