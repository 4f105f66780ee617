/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <KLocalizedString>
#include <QCoreApplication>
#include <QStandardPaths>

/* This file is intended to remain empty.
Write your tests in a file with a name corresponding to what you're testing */

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("subfixer"));
    // never read the user's subfixerrc, settings keep their defaults
    QStandardPaths::setTestModeEnabled(true);
    KLocalizedString::setApplicationDomain("subfixer");
    qSetMessagePattern(QStringLiteral("%{file}:%{line} – %{message}"));

    int result = Catch::Session().run(argc, argv);
    return (result < 0xff ? result : 0xff);
}
