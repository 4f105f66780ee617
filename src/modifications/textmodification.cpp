/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "textmodification.h"
#include "modificationcontext.h"
#include "subfixer_debug.h"

#include <KLocalizedString>
#include <QRegularExpression>
#include <utility>

TextModification::TextModification(ModificationInfo info, QList<TextRule> rules, std::unique_ptr<EntryPostProcessor> postProcessor)
    : AbstractModification(std::move(info))
    , m_rules(std::move(rules))
    , m_postProcessor(std::move(postProcessor))
{
}

void TextModification::apply(SubtitleEntries &entries, ModificationContext &context) const
{
    for (SubtitleEntry &entry : entries) {
        if (!entry.isValid()) {
            context.report(identifier(), entry.text(), i18n("Invalid entry %1 left unmodified", entry.index()));
            continue;
        }
        if (entry.text().trimmed().isEmpty()) {
            continue;
        }
        const QString text = m_trimLines ? entry.text().trimmed() : entry.text();
        // Evaluated once per entry
        const QList<const TextRule *> rules = supportedRules(context);
        QStringList lines;
        for (const QString &line : SubtitleEntry::splitLines(text)) {
            const QString processed = processLine(line, rules, context);
            if (!processed.isEmpty()) {
                lines << processed;
            }
        }
        entry.setLines(lines);
        if (m_postProcessor) {
            m_postProcessor->process(entry, context);
        }
    }
}

QString TextModification::processLine(const QString &line, const QList<const TextRule *> &rules, ModificationContext &context) const
{
    static const QRegularExpression startTagRe(QStringLiteral("^(?:\\{[^}]*\\})+"));
    static const QRegularExpression endTagRe(QStringLiteral("(?:\\{[^}]*\\})+$"));
    if (line.trimmed().isEmpty()) {
        return QString();
    }
    QString content = m_trimLines ? line.trimmed() : line;
    QString startTag;
    QString endTag;
    const QRegularExpressionMatch startMatch = startTagRe.match(content);
    if (startMatch.hasMatch() && startMatch.capturedLength() < content.length()) {
        startTag = startMatch.captured();
        content = content.mid(startMatch.capturedLength());
    }
    const QRegularExpressionMatch endMatch = endTagRe.match(content);
    if (endMatch.hasMatch() && endMatch.capturedStart() > 0) {
        endTag = endMatch.captured();
        content.truncate(endMatch.capturedStart());
    }

    for (const TextRule *rule : rules) {
        QString result;
        QString error;
        if (!rule->apply(content, context, result, &error)) {
            context.report(rule->identifier(), content, error);
            continue;
        }
        if (result != content) {
            qCDebug(SUBFIXER_LOG) << rule->identifier() << ":" << content << "->" << result;
        }
        content = result;
        if (content.isEmpty()) {
            return QString();
        }
    }
    return startTag + content + endTag;
}

QString TextModification::processLine(const QString &line, ModificationContext &context) const
{
    return processLine(line, supportedRules(context), context);
}

const QList<TextRule> &TextModification::rules() const
{
    return m_rules;
}

const TextRule *TextModification::rule(const QString &ruleId) const
{
    for (const TextRule &rule : m_rules) {
        if (rule.identifier() == ruleId) {
            return &rule;
        }
    }
    return nullptr;
}

QList<const TextRule *> TextModification::supportedRules(const ModificationContext &context) const
{
    QList<const TextRule *> rules;
    for (const TextRule &rule : m_rules) {
        if (rule.isSupported(context)) {
            rules << &rule;
        }
    }
    return rules;
}
