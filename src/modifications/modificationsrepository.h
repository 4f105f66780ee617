/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <memory>
#include <unordered_map>
#include <vector>

class ModificationContext;

/** @class ModificationsRepository
    @brief Stores the available modifications by identifier and turns a list of
    requested identifiers into an ordered plan for a given subtitle.
    The repository is built once and not modified while a plan is applied.
 */
class ModificationsRepository
{
public:
    ModificationsRepository() = default;
    ModificationsRepository(const ModificationsRepository &) = delete;
    ModificationsRepository &operator=(const ModificationsRepository &) = delete;

    /** @brief Returns a repository holding all built-in modifications */
    static std::unique_ptr<ModificationsRepository> createDefault();

    /** @brief Add a modification. Returns false if its identifier is already registered */
    bool registerModification(std::unique_ptr<AbstractModification> modification);

    /** @brief Returns true if a given modification exists */
    bool exists(const QString &identifier) const;

    /** @brief Returns the modification with this identifier, or nullptr */
    const AbstractModification *getModification(const QString &identifier) const;

    /** @brief Returns the registered identifiers, in registration order */
    QStringList identifiers() const;

    /** @brief Returns a vector of pair (modification id, description) */
    QList<QPair<QString, QString>> getNames() const;

    /** @brief Resolve @param identifiers into the modifications to apply, in application order.
        Unknown identifiers are reported in @param context and skipped, exclusive modifications are used
        once, modifications not eligible for the context language or uppercase state are left out.
        The plan is sorted by order, apply-last modifications at the end.
    */
    std::vector<const AbstractModification *> plan(const QStringList &identifiers, ModificationContext &context) const;

private:
    std::vector<std::unique_ptr<AbstractModification>> m_modifications;
    std::unordered_map<QString, size_t> m_index;
};
