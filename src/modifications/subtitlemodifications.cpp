/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "subtitlemodifications.h"
#include "abstractmodification.h"
#include "modificationcontext.h"
#include "modificationsrepository.h"
#include "subfixer_debug.h"
#include "subfixersettings.h"

SubtitleModifications::SubtitleModifications(const ModificationsRepository &repository)
    : m_repository(repository)
    , m_dropEmptyEntries(SubfixerSettings::dropEmptyEntries())
{
}

int SubtitleModifications::apply(SubtitleEntries &entries, const QStringList &identifiers, ModificationContext &context) const
{
    const std::vector<const AbstractModification *> plan = m_repository.plan(identifiers, context);
    for (const AbstractModification *modification : plan) {
        qCDebug(SUBFIXER_LOG) << "Applying" << modification->identifier() << "to" << entries.count() << "entries";
        modification->apply(entries, context);
    }
    if (m_dropEmptyEntries) {
        const qsizetype removed = entries.removeIf([](const SubtitleEntry &entry) { return entry.text().trimmed().isEmpty(); });
        if (removed > 0) {
            qCDebug(SUBFIXER_LOG) << "Removed" << removed << "empty entries";
        }
    }
    return int(plan.size());
}

void SubtitleModifications::setDropEmptyEntries(bool drop)
{
    m_dropEmptyEntries = drop;
}

bool SubtitleModifications::dropEmptyEntries() const
{
    return m_dropEmptyEntries;
}
