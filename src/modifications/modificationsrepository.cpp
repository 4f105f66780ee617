/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "modificationsrepository.h"
#include "commonfixes.h"
#include "fixincremental.h"
#include "fixshort.h"
#include "fixuppercase.h"
#include "modificationcontext.h"
#include "removetags.h"
#include "reversertl.h"
#include "subfixer_debug.h"

#include <KLocalizedString>
#include <QSet>
#include <algorithm>
#include <utility>

// static
std::unique_ptr<ModificationsRepository> ModificationsRepository::createDefault()
{
    auto repository = std::make_unique<ModificationsRepository>();
    repository->registerModification(std::make_unique<CommonFixes>());
    repository->registerModification(std::make_unique<RemoveTags>());
    repository->registerModification(std::make_unique<ReverseRtl>());
    repository->registerModification(std::make_unique<FixUppercase>());
    repository->registerModification(std::make_unique<FixIncremental>());
    repository->registerModification(std::make_unique<FixShort>());
    return repository;
}

bool ModificationsRepository::registerModification(std::unique_ptr<AbstractModification> modification)
{
    if (!modification) {
        return false;
    }
    const QString id = modification->identifier();
    if (id.isEmpty() || exists(id)) {
        qCWarning(SUBFIXER_LOG) << "Cannot register modification" << id << ", identifier is empty or already used";
        return false;
    }
    m_index[id] = m_modifications.size();
    m_modifications.push_back(std::move(modification));
    return true;
}

bool ModificationsRepository::exists(const QString &identifier) const
{
    return m_index.count(identifier) > 0;
}

const AbstractModification *ModificationsRepository::getModification(const QString &identifier) const
{
    auto it = m_index.find(identifier);
    if (it == m_index.end()) {
        return nullptr;
    }
    return m_modifications.at(it->second).get();
}

QStringList ModificationsRepository::identifiers() const
{
    QStringList ids;
    for (const auto &modification : m_modifications) {
        ids << modification->identifier();
    }
    return ids;
}

QList<QPair<QString, QString>> ModificationsRepository::getNames() const
{
    QList<QPair<QString, QString>> names;
    for (const auto &modification : m_modifications) {
        names << QPair<QString, QString>(modification->identifier(), modification->info().description);
    }
    return names;
}

std::vector<const AbstractModification *> ModificationsRepository::plan(const QStringList &identifiers, ModificationContext &context) const
{
    std::vector<const AbstractModification *> result;
    QSet<QString> usedExclusive;
    for (const QString &id : identifiers) {
        const AbstractModification *modification = getModification(id);
        if (modification == nullptr) {
            context.report(id, QString(), i18n("Unknown modification %1", id));
            continue;
        }
        const ModificationInfo &info = modification->info();
        if (info.exclusive) {
            if (usedExclusive.contains(id)) {
                continue;
            }
            usedExclusive.insert(id);
        }
        if (!modification->isApplicable(context)) {
            qCDebug(SUBFIXER_LOG) << "Skipping modification" << id << "not applicable to this subtitle";
            continue;
        }
        result.push_back(modification);
    }
    std::stable_sort(result.begin(), result.end(), [](const AbstractModification *a, const AbstractModification *b) {
        if (a->info().applyLast != b->info().applyLast) {
            return !a->info().applyLast;
        }
        return a->info().order < b->info().order;
    });
    return result;
}
