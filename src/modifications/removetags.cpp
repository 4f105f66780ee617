/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "removetags.h"
#include "modificationcontext.h"

#include <KLocalizedString>

const QString RemoveTags::Identifier = QStringLiteral("remove_tags");

static ModificationInfo removeTagsInfo()
{
    ModificationInfo info;
    info.identifier = RemoveTags::Identifier;
    info.description = i18n("Remove all style tags");
    info.longDescription = i18n("Removes all possible style tags from the subtitle, such as font, bold, color etc.");
    info.exclusive = true;
    return info;
}

RemoveTags::RemoveTags()
    : FileModification(removeTagsInfo())
{
}

void RemoveTags::apply(SubtitleEntries &entries, ModificationContext &context) const
{
    for (SubtitleEntry &entry : entries) {
        if (!entry.isValid()) {
            context.report(identifier(), entry.text(), i18n("Invalid entry %1 left unmodified", entry.index()));
            continue;
        }
        // plain text drops the markup, setting it back restores the \N markers
        entry.setPlainText(entry.plainText());
    }
}
