/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "utils/gentime.h"

#include <QDebug>
#include <QList>
#include <QString>
#include <QStringList>

/** @class SubtitleEntry
    @brief One timed caption unit. The raw text uses the ASS line break marker (\\N),
    the plain text is derived from it with all markup removed.
*/
class SubtitleEntry
{
public:
    SubtitleEntry() = default;
    SubtitleEntry(int index, const GenTime &start, const GenTime &end, const QString &text)
        : m_index(index)
        , m_startTime(start)
        , m_endTime(end)
        , m_text(text)
    {
    }

    int index() const { return m_index; }
    const GenTime startTime() const { return m_startTime; }
    const GenTime endTime() const { return m_endTime; }
    GenTime duration() const { return m_endTime - m_startTime; }
    const QString text() const { return m_text; }

    void setIndex(int index) { m_index = index; }
    void setStartTime(const GenTime &time) { m_startTime = time; }
    void setEndTime(const GenTime &time) { m_endTime = time; }
    void setText(const QString &text) { m_text = text; }

    /** @brief Returns the text without override blocks and formatting tags, line breaks as '\\n' */
    QString plainText() const;
    /** @brief Replaces the raw text, newlines are encoded with the line break marker */
    void setPlainText(const QString &text);

    /** @brief The display lines of the raw text */
    QStringList lines() const;
    void setLines(const QStringList &lines);
    int lineCount() const;

    /** @brief An entry is invalid if it was never positioned or ends before it starts */
    bool isValid() const;

    /** @brief The marker separating display lines in the raw text */
    static const QString lineBreakMarker();
    /** @brief Split a raw text on line break markers, an empty text has no lines */
    static QStringList splitLines(const QString &text);

    bool operator==(const SubtitleEntry &op) const;
    bool operator!=(const SubtitleEntry &op) const;

private:
    int m_index{-1};
    GenTime m_startTime;
    GenTime m_endTime;
    QString m_text;
};

using SubtitleEntries = QList<SubtitleEntry>;

QDebug operator<<(QDebug qd, const SubtitleEntry &entry);
