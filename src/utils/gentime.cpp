/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#include "gentime.h"

#include <cmath>

const double GenTime::s_delta = 0.0005;

GenTime::GenTime()
    : m_time(0.0)
{
}

GenTime::GenTime(double seconds)
    : m_time(seconds)
{
}

// static
GenTime GenTime::fromMs(qint64 milliseconds)
{
    return GenTime(double(milliseconds) / 1000.);
}

double GenTime::seconds() const
{
    return m_time;
}

double GenTime::ms() const
{
    return m_time * 1000;
}

QString GenTime::toString() const
{
    return QStringLiteral("%1 s").arg(m_time, 0, 'f', 3);
}

GenTime &GenTime::operator+=(GenTime op)
{
    m_time += op.m_time;
    return *this;
}

GenTime GenTime::operator+(GenTime op) const
{
    return GenTime(m_time + op.m_time);
}

GenTime GenTime::operator-(GenTime op) const
{
    return GenTime(m_time - op.m_time);
}

bool GenTime::operator<(GenTime op) const
{
    return m_time + s_delta < op.m_time;
}

bool GenTime::operator>(GenTime op) const
{
    return m_time > op.m_time + s_delta;
}

bool GenTime::operator<=(GenTime op) const
{
    return m_time <= op.m_time + s_delta;
}

bool GenTime::operator>=(GenTime op) const
{
    return m_time + s_delta >= op.m_time;
}

bool GenTime::operator==(GenTime op) const
{
    return std::fabs(m_time - op.m_time) < s_delta;
}

bool GenTime::operator!=(GenTime op) const
{
    return std::fabs(m_time - op.m_time) >= s_delta;
}
