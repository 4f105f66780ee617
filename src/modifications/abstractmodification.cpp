/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "abstractmodification.h"
#include "modificationcontext.h"

#include <utility>

AbstractModification::AbstractModification(ModificationInfo info)
    : m_info(std::move(info))
{
}

const ModificationInfo &AbstractModification::info() const
{
    return m_info;
}

QString AbstractModification::identifier() const
{
    return m_info.identifier;
}

bool AbstractModification::isApplicable(const ModificationContext &context) const
{
    if (m_info.onlyUppercase && !context.isUppercase()) {
        return false;
    }
    return context.isEligible(m_info.languages);
}
