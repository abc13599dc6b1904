// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_SETTINGS_H
#define KOLOCATE_SETTINGS_H

#include <QString>
#include <QStringList>
#include <Qt>
#include <chrono>
#include "Categories.h"

/**
 * @brief Persisted configuration, stored with QSettings.
 *
 * Defaults match a stock plocate installation: the system index, an optional second
 * index covering removable media, and pkexec for privilege escalation.
 */
struct Settings {
    static constexpr const char* kDefaultSystemDb = "/var/lib/plocate/plocate.db";

    // [lookup]
    QString lookupTool = QStringLiteral("plocate");
    QString systemDb = QString::fromLatin1(kDefaultSystemDb); // empty = kDefaultSystemDb
    QString mediaDb = QStringLiteral("/var/lib/plocate/media.db");
    int lookupTimeoutSeconds = 120;

    // [rebuild]
    QString rebuildTool = QStringLiteral("updatedb");
    QString escalationHelper = QStringLiteral("pkexec"); // empty = run the rebuild tool directly
    QString mediaScanPath = QStringLiteral("/run/media");
    QStringList excludePaths;
    bool includeMedia = true;

    // [ui]
    int sortColumn = -1; // -1 = lookup order
    Qt::SortOrder sortOrder = Qt::AscendingOrder;
    CategoryId category = CategoryId::AllCategories;
    bool refineRegex = false;

    [[nodiscard]] static Settings load();
    void save() const;

    [[nodiscard]] std::chrono::milliseconds lookupTimeout() const;

    /**
     * Index files to pass to the lookup tool. When the media index exists both files are
     * combined (an empty systemDb counts as kDefaultSystemDb); otherwise the list is empty
     * and the tool uses its default database.
     */
    [[nodiscard]] QStringList lookupDatabases() const;
};

#endif //KOLOCATE_SETTINGS_H
