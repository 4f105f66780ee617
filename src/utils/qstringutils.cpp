/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "qstringutils.h"

QStringList QStringUtils::splitKeepingSeparators(const QString &text, const QRegularExpression &separator)
{
    QStringList pieces;
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = separator.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        if (match.capturedLength() == 0) {
            continue;
        }
        pieces << text.mid(last, match.capturedStart() - last);
        pieces << match.captured();
        last = match.capturedEnd();
    }
    pieces << text.mid(last);
    return pieces;
}

QString QStringUtils::capitalize(const QString &text)
{
    if (text.isEmpty()) {
        return text;
    }
    return text.left(1).toUpper() + text.mid(1).toLower();
}

QString QStringUtils::snippet(const QString &text, int length)
{
    if (text.length() <= length) {
        return text;
    }
    return text.left(length) + QStringLiteral("…");
}
