/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "domainvalidator.h"
#include "subfixersettings.h"

#include <QUrl>

TldDomainValidator::TldDomainValidator()
    : TldDomainValidator(SubfixerSettings::topLevelDomains())
{
}

TldDomainValidator::TldDomainValidator(const QStringList &topLevelDomains)
{
    for (const QString &tld : topLevelDomains) {
        const QString cleaned = tld.trimmed().toLower();
        if (!cleaned.isEmpty()) {
            m_topLevelDomains.insert(cleaned.startsWith(QLatin1Char('.')) ? cleaned.mid(1) : cleaned);
        }
    }
}

bool TldDomainValidator::isDomain(const QString &candidate) const
{
    if (candidate.isEmpty() || m_topLevelDomains.isEmpty()) {
        return false;
    }
    // fromUserInput adds the missing scheme
    const QUrl url = QUrl::fromUserInput(candidate.trimmed());
    if (!url.isValid()) {
        return false;
    }
    const QString host = url.host(QUrl::FullyDecoded).toLower();
    const int lastDot = host.lastIndexOf(QLatin1Char('.'));
    if (lastDot <= 0 || lastDot == host.length() - 1) {
        return false;
    }
    return m_topLevelDomains.contains(host.mid(lastDot + 1));
}
