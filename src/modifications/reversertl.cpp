/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "reversertl.h"

#include <KLocalizedString>

const QString ReverseRtl::Identifier = QStringLiteral("reverse_rtl");

static ModificationInfo reverseRtlInfo()
{
    ModificationInfo info;
    info.identifier = ReverseRtl::Identifier;
    info.description = i18n("Reverse punctuation in RTL languages");
    info.longDescription = i18n("Some playback devices don't properly handle right-to-left markers for punctuation. "
                                "Physically swap punctuation. Applicable to languages: hebrew, arabic, farsi, persian");
    info.exclusive = true;
    info.order = 50;
    info.languages = {QLocale::Hebrew, QLocale::Arabic, QLocale::Persian};
    return info;
}

ReverseRtl::ReverseRtl()
    : TextModification(reverseRtlInfo(),
                       {TextRule(QStringLiteral("CM_RTL_reverse"), QStringLiteral(R"re(^([\s.!?:,'-]*)(.*?)([\s.!?:,'-]*)$)re"),
                                 RuleReplacement::literal(QStringLiteral("\\3\\2\\1")))})
{
    // whitespace is part of the envelope that moves
    m_trimLines = false;
}
