/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "fixuppercase.h"
#include "modificationcontext.h"
#include "utils/qstringutils.h"

#include <KLocalizedString>
#include <QRegularExpression>

const QString FixUppercase::Identifier = QStringLiteral("fix_uppercase");

static ModificationInfo fixUppercaseInfo()
{
    ModificationInfo info;
    info.identifier = FixUppercase::Identifier;
    info.description = i18n("Fixes all-uppercase subtitles");
    info.longDescription = i18n("Some subtitles are in all-uppercase letters. This at least makes them readable.");
    info.exclusive = true;
    info.order = 41;
    info.onlyUppercase = true;
    info.applyLast = true;
    return info;
}

FixUppercase::FixUppercase()
    : FileModification(fixUppercaseInfo())
{
}

// static
QString FixUppercase::capitalize(const QString &text)
{
    static const QRegularExpression delimiterRe(QStringLiteral("\\s*[.!?♪\\-]\\s*"), QRegularExpression::UseUnicodePropertiesOption);
    QString result;
    const QStringList pieces = QStringUtils::splitKeepingSeparators(text, delimiterRe);
    for (const QString &piece : pieces) {
        result += QStringUtils::capitalize(piece);
    }
    return result;
}

void FixUppercase::apply(SubtitleEntries &entries, ModificationContext &context) const
{
    for (SubtitleEntry &entry : entries) {
        if (!entry.isValid()) {
            context.report(identifier(), entry.text(), i18n("Invalid entry %1 left unmodified", entry.index()));
            continue;
        }
        entry.setPlainText(capitalize(entry.plainText()));
    }
}
