/*
    SPDX-FileCopyrightText: 2026 Subfixer contributors
    SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-KDE-Accepted-GPL
*/

#pragma once

#include "definitions.h"

#include <QList>
#include <QLocale>
#include <QString>

class ModificationContext;

/** @brief Metadata describing a modification, used to select and order it */
struct ModificationInfo
{
    QString identifier;
    QString description;
    QString longDescription;
    /** Exclusive modifications can only be applied once per run */
    bool exclusive{false};
    /** Lower runs earlier */
    int order{0};
    /** Languages this modification applies to, empty for all */
    QList<QLocale::Language> languages;
    /** Only applied on subtitles detected as all uppercase */
    bool onlyUppercase{false};
    /** Applied after all other modifications, regardless of order */
    bool applyLast{false};
};

/** @class AbstractModification
    @brief Base class for everything that can be applied to a subtitle.
    Text modifications work on every line of every entry, file modifications see
    the whole entry list and may rebuild it.
 */
class AbstractModification
{
public:
    enum class Kind { Text, File };

    explicit AbstractModification(ModificationInfo info);
    virtual ~AbstractModification() = default;

    const ModificationInfo &info() const;
    QString identifier() const;
    virtual Kind kind() const = 0;

    /** @brief Returns true if this modification may run for @param context (language, uppercase state) */
    bool isApplicable(const ModificationContext &context) const;

    /** @brief Apply the modification to @param entries. Problems are reported in @param context */
    virtual void apply(SubtitleEntries &entries, ModificationContext &context) const = 0;

protected:
    ModificationInfo m_info;
};

/** @class FileModification
    @brief A stateful transform over the whole ordered entry list.
 */
class FileModification : public AbstractModification
{
public:
    using AbstractModification::AbstractModification;
    Kind kind() const override { return Kind::File; }
};
