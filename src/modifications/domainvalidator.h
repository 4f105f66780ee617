/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

/** @class AbstractDomainValidator
    @brief Tells whether a token is a host name ending in a valid top level domain.
    Implementations never throw, a candidate that cannot be parsed is not a domain.
 */
class AbstractDomainValidator
{
public:
    virtual ~AbstractDomainValidator() = default;
    virtual bool isDomain(const QString &candidate) const = 0;
};

/** @class TldDomainValidator
    @brief Domain validator that extracts the host with QUrl and checks its last label
    against a list of known top level domains (by default read from the settings).
 */
class TldDomainValidator : public AbstractDomainValidator
{
public:
    /** @brief Build a validator using the top level domains from SubfixerSettings */
    TldDomainValidator();
    explicit TldDomainValidator(const QStringList &topLevelDomains);

    bool isDomain(const QString &candidate) const override;

private:
    QSet<QString> m_topLevelDomains;
};
