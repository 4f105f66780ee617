/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include <QList>
#include <QLocale>
#include <QRegularExpression>
#include <QString>

class ModificationContext;

/** @brief The computed replacements a rule can use instead of a literal text.
    Each one is evaluated by TextRule on a single match.
 */
enum class MatchTransform {
    MusicSymbol,       // "♪ " when the opening group matched, " ♪" otherwise
    NormalizeQuotes,   // one double quote, keeps a trailing space
    UppercaseIInWord,  // every trailing I of group 2 becomes l
    SpacesInNumbers,   // drops the space of group 1 if there is exactly one
    UppercaseAfterDot, // group 1 + uppercased group 2
    DoubleInterpunct,  // trimmed group 1, keeps a trailing space
    PunctuationSpace,  // inserts a space after the punctuation unless group 1 is a domain
};

/** @class RuleReplacement
    @brief What replaces a match: either a literal template (which may reference
    groups with \\1 .. \\9) or a MatchTransform.
 */
class RuleReplacement
{
public:
    enum class Type { Literal, Transform };

    static RuleReplacement literal(const QString &text);
    static RuleReplacement transform(MatchTransform transform);

    Type type() const { return m_type; }
    const QString &literalText() const { return m_literal; }
    MatchTransform matchTransform() const { return m_transform; }

    /** @brief Number of capture groups the replacement reads */
    int requiredGroups() const;

private:
    RuleReplacement() = default;
    Type m_type{Type::Literal};
    QString m_literal;
    MatchTransform m_transform{MatchTransform::MusicSymbol};
};

/** @class TextRule
    @brief A single pattern-match-and-replace operation over one line of text
 */
class TextRule
{
public:
    /** @param identifier stable name used in diagnostics
        @param pattern a PCRE pattern, Unicode properties are always enabled
        @param languages languages the rule is restricted to, empty for all
    */
    TextRule(const QString &identifier, const QString &pattern, const RuleReplacement &replacement, const QList<QLocale::Language> &languages = {},
             QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption);

    const QString &identifier() const { return m_identifier; }
    const QRegularExpression &pattern() const { return m_pattern; }
    const RuleReplacement &replacement() const { return m_replacement; }
    const QList<QLocale::Language> &languages() const { return m_languages; }

    /** @brief Returns true if the rule applies to the language of @param context */
    bool isSupported(const ModificationContext &context) const;

    /** @brief Replace every match of the pattern in @param input.
        @param output receives the new text on success
        @param errorMessage receives the reason of a failure
        @return false if the rule could not be applied, @param output is then left untouched
    */
    bool apply(const QString &input, const ModificationContext &context, QString &output, QString *errorMessage = nullptr) const;

private:
    QString evaluate(const QRegularExpressionMatch &match, const ModificationContext &context) const;

    QString m_identifier;
    QRegularExpression m_pattern;
    RuleReplacement m_replacement;
    QList<QLocale::Language> m_languages;
};
