/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "entrypostprocessor.h"
#include "modificationcontext.h"

EntryPostProcessor::EntryPostProcessor()
{
    // {\i1}{\i0}, {\b1} - {\b0}
    m_rules << TextRule(QStringLiteral("PP_empty_tag"), QStringLiteral("(\\{\\\\\\w1\\})[\\s.,\\-_!?]*(\\{\\\\\\w0\\})"), RuleReplacement::literal(QString()));
}

void EntryPostProcessor::process(SubtitleEntry &entry, ModificationContext &context) const
{
    const QStringList lines = entry.lines();
    QStringList kept;
    for (const QString &line : lines) {
        QString current = line;
        for (const TextRule &rule : m_rules) {
            QString result;
            QString error;
            if (!rule.apply(current, context, result, &error)) {
                context.report(rule.identifier(), current, error);
                continue;
            }
            current = result;
        }
        if (!isEmptyLine(current)) {
            kept << current;
        }
    }
    if (kept != lines) {
        entry.setLines(kept);
    }
}

// static
bool EntryPostProcessor::isEmptyLine(const QString &line)
{
    static const QRegularExpression emptyRe(QStringLiteral("^[-\\s]*$"), QRegularExpression::UseUnicodePropertiesOption);
    return emptyRe.match(line).hasMatch();
}
