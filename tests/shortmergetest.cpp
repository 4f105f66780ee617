/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/
#include "test_utils.hpp"
// test specific headers
#include "fixshort.h"
#include "subfixersettings.h"

using namespace SubfixerTests;

TEST_CASE("Merge short entries", "[FixShort]")
{
    FixShort fixShort(FixShort::Limits{});
    ModificationContext ctx = context();

    SECTION("Default limits come from the settings")
    {
        const FixShort::Limits limits = FixShort::Limits::fromSettings();
        CHECK(limits.maxDuration == SubfixerSettings::shortMaxDuration());
        CHECK(limits.maxLineLength == SubfixerSettings::shortMaxLineLength());
        CHECK(limits.maxLines == SubfixerSettings::shortMaxLines());
        CHECK(fixShort.limits().maxDuration == 500);
        CHECK(fixShort.limits().maxLineLength == 200);
        CHECK(fixShort.limits().maxLines == 3);
    }

    SECTION("A short entry joins the short entry before it")
    {
        SubtitleEntries entries = {entry(1, 0, 300, QStringLiteral("Wait")), entry(2, 300, 500, QStringLiteral("for me")),
                                   entry(3, 500, 1100, QStringLiteral("Now!"))};
        fixShort.apply(entries, ctx);
        REQUIRE(entries.count() == 2);
        CHECK(entries.at(0).index() == 1);
        CHECK(entries.at(0).text() == QStringLiteral("Wait\\Nfor me"));
        CHECK(entries.at(0).startTime() == GenTime::fromMs(0));
        CHECK(entries.at(0).endTime() == GenTime::fromMs(500));
        CHECK(entries.at(1).index() == 3);
        CHECK(entries.at(1).text() == QStringLiteral("Now!"));
    }

    SECTION("The first entry is always kept")
    {
        SubtitleEntries entries = {entry(1, 0, 100, QStringLiteral("Oh"))};
        fixShort.apply(entries, ctx);
        REQUIRE(entries.count() == 1);
        CHECK(entries.at(0).text() == QStringLiteral("Oh"));
    }

    SECTION("Long entries are never merged")
    {
        SubtitleEntries entries = {entry(1, 0, 2000, QStringLiteral("First")), entry(2, 2000, 2100, QStringLiteral("Second")),
                                   entry(3, 2100, 5000, QStringLiteral("Third"))};
        fixShort.apply(entries, ctx);
        CHECK(texts(entries) == QStringList({QStringLiteral("First"), QStringLiteral("Second"), QStringLiteral("Third")}));
    }

    SECTION("Merged entries do not exceed the line limit")
    {
        SubtitleEntries entries = {entry(1, 0, 200, QStringLiteral("One\\NTwo")), entry(2, 200, 400, QStringLiteral("Three")),
                                   entry(3, 400, 600, QStringLiteral("Four"))};
        fixShort.apply(entries, ctx);
        REQUIRE(entries.count() == 2);
        CHECK(entries.at(0).text() == QStringLiteral("One\\NTwo\\NThree"));
        CHECK(entries.at(0).lineCount() == 3);
        CHECK(entries.at(1).text() == QStringLiteral("Four"));
    }

    SECTION("Empty entries merge without adding lines")
    {
        SubtitleEntries entries = {entry(1, 0, 200, QStringLiteral("Hey")), entry(2, 200, 400, QString())};
        fixShort.apply(entries, ctx);
        REQUIRE(entries.count() == 1);
        CHECK(entries.at(0).text() == QStringLiteral("Hey"));
        CHECK(entries.at(0).endTime() == GenTime::fromMs(400));
    }

    SECTION("Entries lasting exactly the maximum duration are not short")
    {
        SubtitleEntries entries = {entry(1, 200, 700, QStringLiteral("A")), entry(2, 700, 900, QStringLiteral("B"))};
        fixShort.apply(entries, ctx);
        CHECK(texts(entries) == QStringList({QStringLiteral("A"), QStringLiteral("B")}));

        entries = {entry(1, 900, 1100, QStringLiteral("C")), entry(2, 1100, 1600, QStringLiteral("D"))};
        fixShort.apply(entries, ctx);
        CHECK(texts(entries) == QStringList({QStringLiteral("C"), QStringLiteral("D")}));

        entries = {entry(1, 900, 1100, QStringLiteral("E")), entry(2, 1100, 1599, QStringLiteral("F"))};
        fixShort.apply(entries, ctx);
        CHECK(texts(entries) == QStringList({QStringLiteral("E\\NF")}));
    }

    SECTION("An empty entry that cannot merge stays on its own")
    {
        SubtitleEntries entries = {entry(1, 0, 2000, QStringLiteral("Long enough")), entry(2, 2000, 2100, QString()),
                                   entry(3, 2100, 4000, QStringLiteral("Next"))};
        fixShort.apply(entries, ctx);
        REQUIRE(entries.count() == 3);
        CHECK(entries.at(1).index() == 2);
        CHECK(entries.at(1).text().isEmpty());
        CHECK(entries.at(1).isValid());
        CHECK(entries.at(1).startTime() == GenTime::fromMs(2000));
        CHECK(entries.at(1).endTime() == GenTime::fromMs(2100));
    }

    SECTION("Invalid entries are kept and receive no merge")
    {
        SubtitleEntries entries = {entry(1, 0, 200, QStringLiteral("Hey")), entry(-1, 200, 300, QStringLiteral("Broken")),
                                   entry(3, 300, 400, QStringLiteral("You"))};
        fixShort.apply(entries, ctx);
        CHECK(texts(entries) == QStringList({QStringLiteral("Hey"), QStringLiteral("Broken"), QStringLiteral("You")}));
        CHECK(ctx.diagnostics().count() == 1);
    }

    SECTION("Packing lines")
    {
        CHECK(FixShort::packLines({QStringLiteral("Where"), QStringLiteral("are you?")}, 200) == QStringList({QStringLiteral("Where are you?")}));
        CHECK(FixShort::packLines({QStringLiteral("Where"), QStringLiteral("are you")}, 200)
              == QStringList({QStringLiteral("Where"), QStringLiteral("are you")}));
        CHECK(FixShort::packLines({QStringLiteral("Go!"), QStringLiteral("Go!")}, 200) == QStringList({QStringLiteral("Go!"), QStringLiteral("Go!")}));
        CHECK(FixShort::packLines({QStringLiteral("Where"), QString(), QStringLiteral("now?")}, 200) == QStringList({QStringLiteral("Where now?")}));
        CHECK(FixShort::packLines({QStringLiteral("Where"), QStringLiteral("are you?")}, 10)
              == QStringList({QStringLiteral("Where"), QStringLiteral("are you?")}));
        CHECK(FixShort::packLines({}, 200).isEmpty());
    }
}
