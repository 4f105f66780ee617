/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/
#include "test_utils.hpp"
// test specific headers
#include "commonfixes.h"

using namespace SubfixerTests;

TEST_CASE("Common fixes rules", "[CommonFixes]")
{
    CommonFixes fixes;
    ModificationContext ctx = context();

    SECTION("Rules are declared in a fixed order")
    {
        REQUIRE(fixes.rules().count() == 25);
        REQUIRE(fixes.rules().first().identifier() == QStringLiteral("CM_hyphens"));
        REQUIRE(fixes.rules().last().identifier() == QStringLiteral("CM_EN_lowercase_i"));
        for (const TextRule &rule : fixes.rules()) {
            INFO(rule.identifier().toStdString());
            CHECK(rule.pattern().isValid());
        }
    }

    SECTION("Dashes")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_hyphens"), QStringLiteral("well‐known﹣word"), ctx) == QStringLiteral("well-known-word"));
        CHECK(applyRule(fixes, QStringLiteral("CM_multidash"), QStringLiteral("Wait--what"), ctx) == QStringLiteral("Wait—what"));
        CHECK(applyRule(fixes, QStringLiteral("CM_multidash"), QStringLiteral("well-known"), ctx) == QStringLiteral("well-known"));
        CHECK(applyRule(fixes, QStringLiteral("CM_dash_space"), QStringLiteral("-Hello"), ctx) == QStringLiteral("- Hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_dash_space"), QStringLiteral("- Hello"), ctx) == QStringLiteral("- Hello"));
    }

    SECTION("Lines without words and leading markers")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_non_word_only"), QStringLiteral("- - -"), ctx).isEmpty());
        CHECK(applyRule(fixes, QStringLiteral("CM_non_word_only"), QStringLiteral("- Hi"), ctx) == QStringLiteral("- Hi"));
        CHECK(applyRule(fixes, QStringLiteral("CM_leading_crocodiles"), QStringLiteral(">> Hello"), ctx) == QStringLiteral("Hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_empty_colon_start"), QStringLiteral(": Hello"), ctx) == QStringLiteral("Hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_leading_ellipsis"), QStringLiteral("...and then"), ctx) == QStringLiteral("and then"));
        CHECK(applyRule(fixes, QStringLiteral("CM_starting_spacedots"), QStringLiteral(". . Hello"), ctx) == QStringLiteral("Hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_crap"), QStringLiteral("Downloaded From www.example.com"), ctx).isEmpty());
    }

    SECTION("Music symbols depend on their position")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_music_symbols"), QStringLiteral("# Singing in the rain #"), ctx) ==
              QStringLiteral("♪ Singing in the rain ♪"));
        CHECK(applyRule(fixes, QStringLiteral("CM_music_symbols"), QStringLiteral("Singing *"), ctx) == QStringLiteral("Singing ♪"));
    }

    SECTION("Quotes")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_double_apostrophe"), QStringLiteral("''Hello''"), ctx) == QStringLiteral("\"Hello\""));
        CHECK(applyRule(fixes, QStringLiteral("CM_double_as_single"), QStringLiteral("don\"t"), ctx) == QStringLiteral("don't"));
        CHECK(applyRule(fixes, QStringLiteral("CM_normalize_quotes"), QStringLiteral("„“Hello"), ctx) == QStringLiteral("\"Hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_normalize_squotes"), QStringLiteral("don’t"), ctx) == QStringLiteral("don't"));
    }

    SECTION("Ellipses and spaces")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_ellipsis_no_space"), QStringLiteral("Wait...what"), ctx) == QStringLiteral("Wait... what"));
        CHECK(applyRule(fixes, QStringLiteral("CM_ellipsis_no_space"), QStringLiteral("Wait..."), ctx) == QStringLiteral("Wait..."));
        CHECK(applyRule(fixes, QStringLiteral("CM_ellipsis_no_space2"), QStringLiteral("Wait. . ."), ctx) == QStringLiteral("Wait . . ."));
        CHECK(applyRule(fixes, QStringLiteral("CM_multiple_spaces"), QStringLiteral("Hello   world"), ctx) == QStringLiteral("Hello world"));
        CHECK(applyRule(fixes, QStringLiteral("CM_dots"), QStringLiteral("Wait....."), ctx) == QStringLiteral("Wait..."));
    }

    SECTION("OCR errors")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_uppercase_i_in_word"), QStringLiteral("heIIo"), ctx) == QStringLiteral("hello"));
        CHECK(applyRule(fixes, QStringLiteral("CM_uppercase_i_in_word"), QStringLiteral("I am"), ctx) == QStringLiteral("I am"));
        CHECK(applyRule(fixes, QStringLiteral("CM_spaces_in_numbers"), QStringLiteral("It costs 1 000 dollars"), ctx) ==
              QStringLiteral("It costs 1000 dollars"));
        // more than one space: a countdown, not a number
        CHECK(applyRule(fixes, QStringLiteral("CM_spaces_in_numbers"), QStringLiteral("10 9 8"), ctx) == QStringLiteral("10 9 8"));
    }

    SECTION("Punctuation")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_uppercase_after_dot"), QStringLiteral("hello. world"), ctx) == QStringLiteral("hello. World"));
        CHECK(applyRule(fixes, QStringLiteral("CM_uppercase_after_dot"), QStringLiteral("it costs 5. then"), ctx) == QStringLiteral("it costs 5. then"));
        CHECK(applyRule(fixes, QStringLiteral("CM_double_interpunct"), QStringLiteral("Hello,, world"), ctx) == QStringLiteral("Hello, world"));
        CHECK(applyRule(fixes, QStringLiteral("CM_punctuation_space"), QStringLiteral("Hello !"), ctx) == QStringLiteral("Hello!"));
        CHECK(applyRule(fixes, QStringLiteral("CM_punctuation_space"), QStringLiteral("Wait . . ."), ctx) == QStringLiteral("Wait . . ."));
        CHECK(applyRule(fixes, QStringLiteral("CM_punctuation_space2"), QStringLiteral("Hello,world"), ctx) == QStringLiteral("Hello, world"));
        // domain names are left alone
        CHECK(applyRule(fixes, QStringLiteral("CM_punctuation_space2"), QStringLiteral("Visit www.example.com"), ctx) ==
              QStringLiteral("Visit www.example.com"));
    }

    SECTION("Lowercase i is only fixed in english")
    {
        CHECK(applyRule(fixes, QStringLiteral("CM_EN_lowercase_i"), QStringLiteral("i think so"), ctx) == QStringLiteral("I think so"));
        const TextRule *rule = fixes.rule(QStringLiteral("CM_EN_lowercase_i"));
        REQUIRE(rule != nullptr);
        CHECK(rule->isSupported(ctx));
        ModificationContext german = context(QStringLiteral("de"));
        CHECK_FALSE(rule->isSupported(german));
        CHECK(fixes.processLine(QStringLiteral("i"), german) == QStringLiteral("i"));
        CHECK(fixes.processLine(QStringLiteral("i"), ctx) == QStringLiteral("I"));
    }
}

TEST_CASE("Common fixes pipeline", "[CommonFixes]")
{
    CommonFixes fixes;
    ModificationContext ctx = context();

    SECTION("Rules run on the output of the previous ones")
    {
        CHECK(fixes.processLine(QStringLiteral("-hello   world"), ctx) == QStringLiteral("- hello world"));
        CHECK(fixes.processLine(QStringLiteral("Hello,, how are you ?"), ctx) == QStringLiteral("Hello, how are you?"));
    }

    SECTION("Applying the fixes twice changes nothing")
    {
        const QStringList inputs = {QStringLiteral("-hello   world"), QStringLiteral("Hello,, how are you ?"), QStringLiteral("''Hello''"),
                                    QStringLiteral("Wait...what"), QStringLiteral("It costs 1 000 dollars")};
        for (const QString &input : inputs) {
            const QString once = fixes.processLine(input, ctx);
            INFO(input.toStdString() + " -> " + once.toStdString());
            CHECK(fixes.processLine(once, ctx) == once);
        }
    }

    SECTION("Rule order is part of the contract")
    {
        const TextRule *dots = fixes.rule(QStringLiteral("CM_dots"));
        const TextRule *leading = fixes.rule(QStringLiteral("CM_leading_ellipsis"));
        REQUIRE(dots != nullptr);
        REQUIRE(leading != nullptr);
        ModificationInfo info;
        info.identifier = QStringLiteral("ordered");
        TextModification leadingFirst(info, {*leading, *dots});
        TextModification dotsFirst(info, {*dots, *leading});
        const QString input = QStringLiteral("....Hello");
        CHECK(leadingFirst.processLine(input, ctx) == QStringLiteral(".Hello"));
        CHECK(dotsFirst.processLine(input, ctx) == QStringLiteral("Hello"));
    }

    SECTION("Entries are processed line by line, keeping surrounding tags")
    {
        SubtitleEntries entries = {entry(0, 0, 1000, QStringLiteral("{\\i1}-hello   world{\\i0}\\N- - -")),
                                   entry(1, 1000, 2000, QStringLiteral("Downloaded from www.example.com"))};
        fixes.apply(entries, ctx);
        REQUIRE(entries.count() == 2);
        CHECK(entries.at(0).text() == QStringLiteral("{\\i1}- hello world{\\i0}"));
        // emptied entries are still valid entries
        CHECK(entries.at(1).text().isEmpty());
        CHECK(entries.at(1).isValid());
        CHECK(ctx.diagnostics().isEmpty());
    }

    SECTION("A failing rule is skipped and reported")
    {
        ModificationInfo info;
        info.identifier = QStringLiteral("broken");
        QList<TextRule> rules;
        rules << TextRule(QStringLiteral("BAD_pattern"), QStringLiteral("(unclosed"), RuleReplacement::literal(QStringLiteral("x")));
        rules << TextRule(QStringLiteral("BAD_groups"), QStringLiteral("a"), RuleReplacement::transform(MatchTransform::PunctuationSpace));
        rules << TextRule(QStringLiteral("OK_a_to_b"), QStringLiteral("a"), RuleReplacement::literal(QStringLiteral("b")));
        TextModification broken(info, rules);
        SubtitleEntries entries = {entry(0, 0, 1000, QStringLiteral("aaa"))};
        broken.apply(entries, ctx);
        CHECK(entries.at(0).text() == QStringLiteral("bbb"));
        REQUIRE(ctx.diagnostics().count() == 2);
        CHECK(ctx.diagnostics().at(0).identifier == QStringLiteral("BAD_pattern"));
        CHECK(ctx.diagnostics().at(0).snippet == QStringLiteral("aaa"));
        CHECK(ctx.diagnostics().at(1).identifier == QStringLiteral("BAD_groups"));
    }

    SECTION("Invalid entries are left unmodified")
    {
        SubtitleEntries entries = {entry(0, 2000, 1000, QStringLiteral("-hello   world"))};
        fixes.apply(entries, ctx);
        CHECK(entries.at(0).text() == QStringLiteral("-hello   world"));
        CHECK(ctx.diagnostics().count() == 1);
    }
}
