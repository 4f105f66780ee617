/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include <QString>

/**
 * @class GenTime
 * @brief A subtitle timestamp. Internally stored in seconds, compared with a
 * tolerance of half a millisecond.
 */
class GenTime
{
public:
    /** @brief Creates a GenTime object, with a time of 0 seconds. */
    GenTime();

    /** @brief Creates a GenTime object, with time given in seconds. */
    explicit GenTime(double seconds);

    /** @brief Creates a GenTime from a number of milliseconds. */
    static GenTime fromMs(qint64 milliseconds);

    /** @brief Gets the time, in seconds. */
    double seconds() const;

    /** @brief Gets the time, in milliseconds */
    double ms() const;

    QString toString() const;

    GenTime &operator+=(GenTime op);
    GenTime operator+(GenTime op) const;
    GenTime operator-(GenTime op) const;

    /* Comparisons consider that two times closer than half a millisecond are equal */
    bool operator<(GenTime op) const;
    bool operator>(GenTime op) const;
    bool operator<=(GenTime op) const;
    bool operator>=(GenTime op) const;
    bool operator==(GenTime op) const;
    bool operator!=(GenTime op) const;

private:
    /** Holds the time in seconds for this object. */
    double m_time;

    static const double s_delta;
};
