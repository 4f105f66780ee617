/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "definitions.h"
#include "textrule.h"

#include <QList>

class ModificationContext;

/** @class EntryPostProcessor
    @brief Cleans an entry once its lines went through a text modification:
    empty style tag pairs are removed, then lines left blank or holding only
    dashes are dropped. The entry itself is always kept.
 */
class EntryPostProcessor
{
public:
    EntryPostProcessor();

    void process(SubtitleEntry &entry, ModificationContext &context) const;

    /** @brief Returns true if @param line has nothing left worth displaying */
    static bool isEmptyLine(const QString &line);

private:
    QList<TextRule> m_rules;
};
