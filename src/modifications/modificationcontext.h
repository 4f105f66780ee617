/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include <QList>
#include <QLocale>
#include <QString>
#include <memory>

class AbstractDomainValidator;

/** @brief A problem met while applying a modification. Never fatal. */
struct ModificationDiagnostic
{
    QString identifier; // rule or modification identifier
    QString snippet;    // start of the offending input
    QString message;
};

/** @class ModificationContext
    @brief Everything a modification needs to know about the subtitle it works on:
    its language, whether it is all uppercase, the domain validator. Diagnostics are
    collected here as well.
 */
class ModificationContext
{
public:
    /** @brief Build a context for a language tag (ISO 639 code, optionally followed by a region) */
    explicit ModificationContext(const QString &languageTag = QString());

    /** @brief Resolve a language tag, an unknown tag leaves the language unresolved */
    void setLanguageTag(const QString &tag);
    void setLanguage(QLocale::Language language);
    QLocale::Language language() const;
    bool isLanguageResolved() const;

    /** @brief Returns true if this context's language is one of @param languages.
        An empty list means all languages. An unresolved language is only eligible for an empty list.
    */
    bool isEligible(const QList<QLocale::Language> &languages) const;

    /** @brief Set by the caller when the subtitle was detected as all uppercase */
    void setUppercase(bool uppercase);
    bool isUppercase() const;

    void setDomainValidator(std::shared_ptr<AbstractDomainValidator> validator);
    /** @brief Returns the domain validator, may be nullptr */
    const AbstractDomainValidator *domainValidator() const;
    /** @brief Returns true if the domain validator accepts @param candidate */
    bool isDomain(const QString &candidate) const;

    /** @brief Record and log a diagnostic */
    void report(const QString &identifier, const QString &input, const QString &message);
    const QList<ModificationDiagnostic> &diagnostics() const;
    void clearDiagnostics();

private:
    QLocale::Language m_language{QLocale::AnyLanguage};
    bool m_uppercase{false};
    std::shared_ptr<AbstractDomainValidator> m_domainValidator;
    QList<ModificationDiagnostic> m_diagnostics;
};
