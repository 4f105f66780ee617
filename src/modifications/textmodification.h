/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "abstractmodification.h"
#include "entrypostprocessor.h"
#include "textrule.h"

#include <QList>
#include <memory>

/** @class TextModification
    @brief An ordered set of TextRule applied to every display line of every entry.
    Rules run in their declared order, each one on the output of the previous one.
    Surrounding override tags ({\\i1}...{\\i0}) are set aside while the rules run and
    restored afterwards. A line emptied by a rule is dropped.
 */
class TextModification : public AbstractModification
{
public:
    TextModification(ModificationInfo info, QList<TextRule> rules, std::unique_ptr<EntryPostProcessor> postProcessor = nullptr);

    Kind kind() const override { return Kind::Text; }

    void apply(SubtitleEntries &entries, ModificationContext &context) const override;

    /** @brief Run the rules over a single line. @param rules are the rules already
        known to be supported for the current entry
    */
    QString processLine(const QString &line, const QList<const TextRule *> &rules, ModificationContext &context) const;
    /** @brief Run every supported rule over a single line */
    QString processLine(const QString &line, ModificationContext &context) const;

    const QList<TextRule> &rules() const;
    /** @brief Returns the rule with identifier @param ruleId, or nullptr */
    const TextRule *rule(const QString &ruleId) const;

protected:
    QList<TextRule> m_rules;
    std::unique_ptr<EntryPostProcessor> m_postProcessor;
    /** Lines are trimmed before the rules run, unless the rules need the surrounding whitespace */
    bool m_trimLines{true};

private:
    QList<const TextRule *> supportedRules(const ModificationContext &context) const;
};
