/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "definitions.h"

#include <QStringList>

class ModificationContext;
class ModificationsRepository;

/** @class SubtitleModifications
    @brief Applies a selection of modifications to the entries of one subtitle
 */
class SubtitleModifications
{
public:
    explicit SubtitleModifications(const ModificationsRepository &repository);

    /** @brief Apply the modifications named in @param identifiers to @param entries.
        @return the number of modifications that were applied
    */
    int apply(SubtitleEntries &entries, const QStringList &identifiers, ModificationContext &context) const;

    /** @brief When set, entries left without text are removed after all modifications ran */
    void setDropEmptyEntries(bool drop);
    bool dropEmptyEntries() const;

private:
    const ModificationsRepository &m_repository;
    bool m_dropEmptyEntries;
};
