/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

class QStringUtils
{
public:
    /** @returns the pieces of @param text between the matches of @param separator, with every
     *  separator kept as its own piece. Joining the result gives back @param text.
     */
    static QStringList splitKeepingSeparators(const QString &text, const QRegularExpression &separator);
    /** @returns @param text with its first character in upper case and the rest in lower case */
    static QString capitalize(const QString &text);
    /** @returns the start of @param text, elided after @param length characters, for log output */
    static QString snippet(const QString &text, int length = 40);
};
