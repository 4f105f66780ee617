/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "modificationcontext.h"
#include "domainvalidator.h"
#include "subfixer_debug.h"
#include "utils/qstringutils.h"

#include <QRegularExpression>
#include <utility>

ModificationContext::ModificationContext(const QString &languageTag)
    : m_domainValidator(std::make_shared<TldDomainValidator>())
{
    setLanguageTag(languageTag);
}

void ModificationContext::setLanguageTag(const QString &tag)
{
    static const QRegularExpression separatorRe(QStringLiteral("[-_]"));
    m_language = QLocale::AnyLanguage;
    const QString code = tag.trimmed().section(separatorRe, 0, 0).toLower();
    if (code.isEmpty()) {
        return;
    }
    QLocale::Language language = QLocale::codeToLanguage(code);
    if (language == QLocale::C) {
        language = QLocale::AnyLanguage;
    }
    if (language == QLocale::AnyLanguage) {
        qCDebug(SUBFIXER_LOG) << "Unresolved language tag" << tag;
    }
    m_language = language;
}

void ModificationContext::setLanguage(QLocale::Language language)
{
    m_language = language;
}

QLocale::Language ModificationContext::language() const
{
    return m_language;
}

bool ModificationContext::isLanguageResolved() const
{
    return m_language != QLocale::AnyLanguage;
}

bool ModificationContext::isEligible(const QList<QLocale::Language> &languages) const
{
    if (languages.isEmpty()) {
        return true;
    }
    return isLanguageResolved() && languages.contains(m_language);
}

void ModificationContext::setUppercase(bool uppercase)
{
    m_uppercase = uppercase;
}

bool ModificationContext::isUppercase() const
{
    return m_uppercase;
}

void ModificationContext::setDomainValidator(std::shared_ptr<AbstractDomainValidator> validator)
{
    m_domainValidator = std::move(validator);
}

const AbstractDomainValidator *ModificationContext::domainValidator() const
{
    return m_domainValidator.get();
}

bool ModificationContext::isDomain(const QString &candidate) const
{
    return m_domainValidator && m_domainValidator->isDomain(candidate);
}

void ModificationContext::report(const QString &identifier, const QString &input, const QString &message)
{
    ModificationDiagnostic diagnostic{identifier, QStringUtils::snippet(input), message};
    qCWarning(SUBFIXER_LOG) << identifier << message << diagnostic.snippet;
    m_diagnostics << diagnostic;
}

const QList<ModificationDiagnostic> &ModificationContext::diagnostics() const
{
    return m_diagnostics;
}

void ModificationContext::clearDiagnostics()
{
    m_diagnostics.clear();
}
