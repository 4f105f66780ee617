/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "fixshort.h"
#include "modificationcontext.h"
#include "subfixer_debug.h"
#include "subfixersettings.h"

#include <KLocalizedString>
#include <QRegularExpression>
#include <utility>

const QString FixShort::Identifier = QStringLiteral("fix_short");

static ModificationInfo fixShortInfo()
{
    ModificationInfo info;
    info.identifier = FixShort::Identifier;
    info.description = i18n("Merges short flashing subtitles");
    info.longDescription = i18n("Entries displayed for a very short time are merged into the entry before them when the result still fits on screen.");
    info.exclusive = true;
    return info;
}

// static
FixShort::Limits FixShort::Limits::fromSettings()
{
    Limits limits;
    limits.maxDuration = SubfixerSettings::shortMaxDuration();
    limits.maxLineLength = SubfixerSettings::shortMaxLineLength();
    limits.maxLines = SubfixerSettings::shortMaxLines();
    return limits;
}

FixShort::FixShort()
    : FixShort(Limits::fromSettings())
{
}

FixShort::FixShort(const Limits &limits)
    : FileModification(fixShortInfo())
    , m_limits(limits)
{
}

const FixShort::Limits &FixShort::limits() const
{
    return m_limits;
}

void FixShort::apply(SubtitleEntries &entries, ModificationContext &context) const
{
    State state;
    for (const SubtitleEntry &entry : std::as_const(entries)) {
        if (!entry.isValid()) {
            context.report(identifier(), entry.text(), i18n("Invalid entry %1 left unmodified", entry.index()));
            state.output << entry;
            state.previousLocked = true;
            continue;
        }
        step(state, entry, m_limits);
    }
    qCDebug(SUBFIXER_LOG) << "Short entries merged:" << entries.count() << "->" << state.output.count();
    entries = state.output;
}

// static
QStringList FixShort::packLines(const QStringList &lines, int maxLineLength)
{
    static const QRegularExpression endsWithPunctuationRe(QStringLiteral("^.+\\W$"), QRegularExpression::UseUnicodePropertiesOption);
    QStringList packed;
    for (const QString &line : lines) {
        if (line.isEmpty()) {
            continue;
        }
        if (!packed.isEmpty()) {
            const QString &last = packed.constLast();
            const QString joined = last.back().isSpace() ? QString(last + line) : QString(last + QLatin1Char(' ') + line);
            if (last != line && joined.length() <= maxLineLength && endsWithPunctuationRe.match(line).hasMatch()) {
                qCDebug(SUBFIXER_LOG) << "Merging" << last << "with" << line;
                packed.last() = joined;
                continue;
            }
        }
        packed << line;
    }
    return packed;
}

// static
void FixShort::step(State &state, const SubtitleEntry &entry, const Limits &limits)
{
    if (state.output.isEmpty()) {
        // The first entry is only an anchor
        state.output << entry;
        state.previousLocked = false;
        return;
    }
    const QStringList packed = packLines(entry.lines(), limits.maxLineLength);
    SubtitleEntry &previous = state.output.last();
    const GenTime maxDuration = GenTime::fromMs(limits.maxDuration);
    const bool isShort = previous.duration() < maxDuration && entry.duration() < maxDuration;
    const bool hasSpace = packed.count() < limits.maxLines && previous.lineCount() + packed.count() <= limits.maxLines;
    if (!state.previousLocked && isShort && hasSpace) {
        qCDebug(SUBFIXER_LOG) << "Merging entry" << entry.index() << "into" << previous.index();
        QStringList lines = previous.lines();
        lines << packed;
        previous.setLines(lines);
        if (entry.endTime() > previous.endTime()) {
            previous.setEndTime(entry.endTime());
        }
        return;
    }
    SubtitleEntry standalone = entry;
    standalone.setLines(packed);
    state.output << standalone;
    state.previousLocked = false;
}
