/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "textrule.h"
#include "modificationcontext.h"

#include <KLocalizedString>

RuleReplacement RuleReplacement::literal(const QString &text)
{
    RuleReplacement replacement;
    replacement.m_type = Type::Literal;
    replacement.m_literal = text;
    return replacement;
}

RuleReplacement RuleReplacement::transform(MatchTransform transform)
{
    RuleReplacement replacement;
    replacement.m_type = Type::Transform;
    replacement.m_transform = transform;
    return replacement;
}

int RuleReplacement::requiredGroups() const
{
    if (m_type == Type::Literal) {
        int highest = 0;
        for (int i = 0; i + 1 < m_literal.size(); ++i) {
            if (m_literal.at(i) == QLatin1Char('\\') && m_literal.at(i + 1).isDigit()) {
                highest = qMax(highest, m_literal.at(i + 1).digitValue());
                ++i;
            }
        }
        return highest;
    }
    switch (m_transform) {
    case MatchTransform::MusicSymbol:
    case MatchTransform::UppercaseIInWord:
    case MatchTransform::UppercaseAfterDot:
    case MatchTransform::NormalizeQuotes:
    case MatchTransform::DoubleInterpunct:
        return 2;
    case MatchTransform::SpacesInNumbers:
        return 1;
    case MatchTransform::PunctuationSpace:
        return 4;
    }
    return 0;
}

TextRule::TextRule(const QString &identifier, const QString &pattern, const RuleReplacement &replacement, const QList<QLocale::Language> &languages,
                   QRegularExpression::PatternOptions options)
    : m_identifier(identifier)
    , m_pattern(pattern, options | QRegularExpression::UseUnicodePropertiesOption)
    , m_replacement(replacement)
    , m_languages(languages)
{
}

bool TextRule::isSupported(const ModificationContext &context) const
{
    return context.isEligible(m_languages);
}

bool TextRule::apply(const QString &input, const ModificationContext &context, QString &output, QString *errorMessage) const
{
    if (!m_pattern.isValid()) {
        if (errorMessage) {
            *errorMessage = i18n("Invalid pattern at offset %1: %2", m_pattern.patternErrorOffset(), m_pattern.errorString());
        }
        return false;
    }
    if (m_pattern.captureCount() < m_replacement.requiredGroups()) {
        if (errorMessage) {
            *errorMessage = i18n("Replacement needs %1 capture groups, pattern has %2", m_replacement.requiredGroups(), m_pattern.captureCount());
        }
        return false;
    }
    if (m_replacement.type() == RuleReplacement::Type::Literal) {
        QString result = input;
        result.replace(m_pattern, m_replacement.literalText());
        output = result;
        return true;
    }

    QString result;
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = m_pattern.globalMatch(input);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        result += input.mid(last, match.capturedStart() - last);
        result += evaluate(match, context);
        last = match.capturedEnd();
    }
    result += input.mid(last);
    output = result;
    return true;
}

QString TextRule::evaluate(const QRegularExpressionMatch &match, const ModificationContext &context) const
{
    switch (m_replacement.matchTransform()) {
    case MatchTransform::MusicSymbol:
        return match.captured(1).isEmpty() ? QStringLiteral(" ♪") : QStringLiteral("♪ ");
    case MatchTransform::NormalizeQuotes:
        return match.captured(2).endsWith(QLatin1Char(' ')) ? QStringLiteral("\" ") : QStringLiteral("\"");
    case MatchTransform::UppercaseIInWord:
        return match.captured(1) + QString(match.capturedLength(2), QLatin1Char('l'));
    case MatchTransform::SpacesInNumbers: {
        QString number = match.captured(1);
        if (number.count(QLatin1Char(' ')) == 1) {
            number.remove(QLatin1Char(' '));
        }
        return number;
    }
    case MatchTransform::UppercaseAfterDot:
        return match.captured(1) + match.captured(2).toUpper();
    case MatchTransform::DoubleInterpunct:
        return match.captured(1).trimmed() + (match.captured(2).endsWith(QLatin1Char(' ')) ? QStringLiteral(" ") : QString());
    case MatchTransform::PunctuationSpace:
        if (context.isDomain(match.captured(1))) {
            return match.captured(1);
        }
        return match.captured(2) + match.captured(3) + QLatin1Char(' ') + match.captured(4);
    }
    return match.captured();
}
