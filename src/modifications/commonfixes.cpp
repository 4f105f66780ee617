/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "commonfixes.h"

#include <KLocalizedString>

const QString CommonFixes::Identifier = QStringLiteral("common");

static ModificationInfo commonFixesInfo()
{
    ModificationInfo info;
    info.identifier = CommonFixes::Identifier;
    info.description = i18n("Basic common fixes");
    info.longDescription = i18n("Fix common and whitespace/punctuation issues in subtitles");
    info.exclusive = true;
    info.order = 40;
    return info;
}

CommonFixes::CommonFixes()
    : TextModification(commonFixesInfo(), buildRules(), std::make_unique<EntryPostProcessor>())
{
}

QList<TextRule> CommonFixes::buildRules()
{
    using L = RuleReplacement;
    QList<TextRule> rules;
    // normalize hyphens
    rules << TextRule(QStringLiteral("CM_hyphens"), QStringLiteral("[‑‐﹘﹣]"), L::literal(QStringLiteral("-")));
    // -- = em dash
    rules << TextRule(QStringLiteral("CM_multidash"), QStringLiteral(R"re((\w|\b|\s|^)(-\s?-{1,2}))re"), L::literal(QStringLiteral("\\1—")));
    // line = _/-/\s
    rules << TextRule(QStringLiteral("CM_non_word_only"), QStringLiteral(R"re((^\W*[-_.:<>~"']+\W*$))re"), L::literal(QString()));
    // remove >>
    rules << TextRule(QStringLiteral("CM_leading_crocodiles"), QStringLiteral(R"re(^\s?>>\s*)re"), L::literal(QString()));
    // line = : text
    rules << TextRule(QStringLiteral("CM_empty_colon_start"), QStringLiteral(R"re((^\W*:\s*(?=\w+)))re"), L::literal(QString()));
    // * text, # text, ¶ text
    rules << TextRule(QStringLiteral("CM_music_symbols"), QStringLiteral(R"re((^[-\s>~]*[*#¶]+\s+)|(\s*[*#¶]+\s*$))re"),
                      L::transform(MatchTransform::MusicSymbol));
    // '' = "
    rules << TextRule(QStringLiteral("CM_double_apostrophe"), QStringLiteral(R"re((['’ʼ❜‘‛]['’ʼ❜‘‛]+))re"), L::literal(QStringLiteral("\"")));
    // double quotes instead of single quotes inside words
    rules << TextRule(QStringLiteral("CM_double_as_single"), QStringLiteral(R"re(([A-zÀ-ž])"([A-zÀ-ž]))re"), L::literal(QStringLiteral("\\1'\\2")));
    rules << TextRule(QStringLiteral("CM_normalize_quotes"), QStringLiteral(R"re((\s*["”“‟„])\s*(["”“‟„]["”“‟„\s]*))re"),
                      L::transform(MatchTransform::NormalizeQuotes));
    rules << TextRule(QStringLiteral("CM_normalize_squotes"), QStringLiteral(R"re((['’ʼ❜‘‛]))re"), L::literal(QStringLiteral("'")));
    // remove leading ...
    rules << TextRule(QStringLiteral("CM_leading_ellipsis"), QStringLiteral(R"re(^\.\.\.[\s]*)re"), L::literal(QString()));
    // release group advertisements
    rules << TextRule(QStringLiteral("CM_crap"), QStringLiteral(R"re(^.*downloaded\s+from.*$)re"), L::literal(QString()), {},
                      QRegularExpression::CaseInsensitiveOption);
    // no space after ellipsis
    rules << TextRule(QStringLiteral("CM_ellipsis_no_space"), QStringLiteral(R"re(\.\.\.(?![\s.,!?'"])(?!$))re"), L::literal(QStringLiteral("... ")));
    // no space before spaced ellipsis
    rules << TextRule(QStringLiteral("CM_ellipsis_no_space2"), QStringLiteral(R"re((?<=[^\s])(?<!\s)\. \. \.)re"), L::literal(QStringLiteral(" . . .")));
    rules << TextRule(QStringLiteral("CM_multiple_spaces"), QStringLiteral(R"re([\s]{2,})re"), L::literal(QStringLiteral(" ")));
    // more than 3 dots
    rules << TextRule(QStringLiteral("CM_dots"), QStringLiteral(R"re(\.{3,})re"), L::literal(QStringLiteral("...")));
    // no space after starting dash
    rules << TextRule(QStringLiteral("CM_dash_space"), QStringLiteral(R"re(^-(?![\s-]))re"), L::literal(QStringLiteral("- ")));
    // remove starting spaced dots (not matching ellipses)
    rules << TextRule(QStringLiteral("CM_starting_spacedots"), QStringLiteral(R"re(^(?!\s?(\.\s\.\s\.)|(\s?\.{3}))(?=\.+\s+)[\s.]*)re"),
                      L::literal(QString()));
    // OCR: uppercase I instead of lowercase l inside words
    rules << TextRule(QStringLiteral("CM_uppercase_i_in_word"), QStringLiteral(R"re(([a-zà-ž]+)(I+))re"), L::transform(MatchTransform::UppercaseIInWord));
    // OCR: spaces in numbers. Comma and dot are only fixed after a space, a span with more than one
    // space is most likely a countdown. Ellipses are left alone.
    rules << TextRule(QStringLiteral("CM_spaces_in_numbers"),
                      QStringLiteral(R"re((\b[0-9]+[0-9:']*(?<!\.\.)\s+(?!\.\.)[0-9,.:'\s]*(?=[0-9]+)[0-9,.:']))re"),
                      L::transform(MatchTransform::SpacesInNumbers));
    // uppercase after dot, unless the word before looks like an abbreviation or a number
    rules << TextRule(QStringLiteral("CM_uppercase_after_dot"), QStringLiteral(R"re(((?![A-ZÀ-Ž\-_0-9.])[^.\s]+\.\s+)([a-zà-ž]))re"),
                      L::transform(MatchTransform::UppercaseAfterDot));
    // remove double interpunction
    rules << TextRule(QStringLiteral("CM_double_interpunct"), QStringLiteral(R"re((\s*[,!?])\s*([,.!?][,.!?\s]*))re"),
                      L::transform(MatchTransform::DoubleInterpunct));
    // remove spaces before punctuation, don't break spaced ellipses
    rules << TextRule(QStringLiteral("CM_punctuation_space"), QStringLiteral(R"re((?:(?<=^)|(?<=\w)) +([!?.,](?![!?.,]| \.)))re"),
                      L::literal(QStringLiteral("\\1")));
    // add space after punctuation, unless it is part of a domain name
    rules << TextRule(QStringLiteral("CM_punctuation_space2"), QStringLiteral(R"re((([^\s]*)([!?.,:])([A-zÀ-ž]{2,})))re"),
                      L::transform(MatchTransform::PunctuationSpace));
    // lowercase i in english
    rules << TextRule(QStringLiteral("CM_EN_lowercase_i"), QStringLiteral(R"re((\b)i(\b))re"), L::literal(QStringLiteral("\\1I\\2")), {QLocale::English});
    return rules;
}
