/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "definitions.h"

#include <QRegularExpression>

QString SubtitleEntry::plainText() const
{
    // ASS override blocks: {\i1}, {\an8\fs20}...
    static const QRegularExpression overrideRe(QStringLiteral("\\{[^}]*\\}"));
    // SRT/WebVTT formatting tags
    static const QRegularExpression formatTagRe(QStringLiteral("</?(?:i|b|u|s|c|v|font|lang|ruby|rt)(?:[\\s.=][^>]*)?>"),
                                                QRegularExpression::CaseInsensitiveOption);
    QString text = m_text;
    text.remove(overrideRe);
    text.remove(formatTagRe);
    text.replace(QLatin1String("\\h"), QLatin1String(" "));
    text.replace(lineBreakMarker(), QLatin1String("\n"));
    return text;
}

void SubtitleEntry::setPlainText(const QString &text)
{
    QString encoded = text;
    encoded.replace(QLatin1Char('\n'), lineBreakMarker());
    m_text = encoded;
}

QStringList SubtitleEntry::lines() const
{
    return splitLines(m_text);
}

void SubtitleEntry::setLines(const QStringList &lines)
{
    m_text = lines.join(lineBreakMarker());
}

int SubtitleEntry::lineCount() const
{
    return splitLines(m_text).count();
}

bool SubtitleEntry::isValid() const
{
    return m_index >= 0 && m_endTime >= m_startTime;
}

// static
const QString SubtitleEntry::lineBreakMarker()
{
    return QStringLiteral("\\N");
}

// static
QStringList SubtitleEntry::splitLines(const QString &text)
{
    if (text.isEmpty()) {
        return {};
    }
    return text.split(lineBreakMarker());
}

bool SubtitleEntry::operator==(const SubtitleEntry &op) const
{
    return m_index == op.m_index && m_startTime == op.m_startTime && m_endTime == op.m_endTime && m_text == op.m_text;
}

bool SubtitleEntry::operator!=(const SubtitleEntry &op) const
{
    return !(*this == op);
}

QDebug operator<<(QDebug qd, const SubtitleEntry &entry)
{
    QDebugStateSaver saver(qd);
    qd.nospace() << "SubtitleEntry(" << entry.index() << ", " << entry.startTime().toString() << " -> " << entry.endTime().toString() << ", "
                 << entry.text() << ')';
    return qd;
}
