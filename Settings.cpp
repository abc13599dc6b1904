// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QSettings>
#include <QFileInfo>
#include <QDebug>
#include "Settings.h"

Settings Settings::load() {
    Settings out;
    QSettings s;

    s.beginGroup(QStringLiteral("lookup"));
    out.lookupTool = s.value(QStringLiteral("tool"), out.lookupTool).toString();
    out.systemDb = s.value(QStringLiteral("systemDb"), out.systemDb).toString();
    out.mediaDb = s.value(QStringLiteral("mediaDb"), out.mediaDb).toString();
    out.lookupTimeoutSeconds = s.value(QStringLiteral("timeoutSeconds"), out.lookupTimeoutSeconds).toInt();
    s.endGroup();

    s.beginGroup(QStringLiteral("rebuild"));
    out.rebuildTool = s.value(QStringLiteral("tool"), out.rebuildTool).toString();
    out.escalationHelper = s.value(QStringLiteral("escalationHelper"), out.escalationHelper).toString();
    out.mediaScanPath = s.value(QStringLiteral("mediaScanPath"), out.mediaScanPath).toString();
    out.excludePaths = s.value(QStringLiteral("excludePaths"), out.excludePaths).toStringList();
    out.includeMedia = s.value(QStringLiteral("includeMedia"), out.includeMedia).toBool();
    s.endGroup();

    s.beginGroup(QStringLiteral("ui"));
    out.sortColumn = s.value(QStringLiteral("sortColumn"), out.sortColumn).toInt();
    out.sortOrder = s.value(QStringLiteral("sortOrder"), 0).toInt() == 1 ? Qt::DescendingOrder : Qt::AscendingOrder;
    out.category = Categories::fromKey(s.value(QStringLiteral("category")).toString())
        .value_or(CategoryId::AllCategories);
    out.refineRegex = s.value(QStringLiteral("refineRegex"), out.refineRegex).toBool();
    s.endGroup();

    if (out.lookupTimeoutSeconds <= 0) {
        qWarning() << "Ignoring invalid lookup timeout" << out.lookupTimeoutSeconds << "- using 120s";
        out.lookupTimeoutSeconds = 120;
    }

    return out;
}

void Settings::save() const {
    QSettings s;

    s.beginGroup(QStringLiteral("lookup"));
    s.setValue(QStringLiteral("tool"), lookupTool);
    s.setValue(QStringLiteral("systemDb"), systemDb);
    s.setValue(QStringLiteral("mediaDb"), mediaDb);
    s.setValue(QStringLiteral("timeoutSeconds"), lookupTimeoutSeconds);
    s.endGroup();

    s.beginGroup(QStringLiteral("rebuild"));
    s.setValue(QStringLiteral("tool"), rebuildTool);
    s.setValue(QStringLiteral("escalationHelper"), escalationHelper);
    s.setValue(QStringLiteral("mediaScanPath"), mediaScanPath);
    s.setValue(QStringLiteral("excludePaths"), excludePaths);
    s.setValue(QStringLiteral("includeMedia"), includeMedia);
    s.endGroup();

    s.beginGroup(QStringLiteral("ui"));
    s.setValue(QStringLiteral("sortColumn"), sortColumn);
    s.setValue(QStringLiteral("sortOrder"), sortOrder == Qt::DescendingOrder ? 1 : 0);
    s.setValue(QStringLiteral("category"), Categories::key(category));
    s.setValue(QStringLiteral("refineRegex"), refineRegex);
    s.endGroup();
}

std::chrono::milliseconds Settings::lookupTimeout() const {
    return std::chrono::seconds(lookupTimeoutSeconds);
}

QStringList Settings::lookupDatabases() const {
    if (mediaDb.isEmpty() || !QFileInfo::exists(mediaDb)) {
        return {};
    }
    const QString system = systemDb.trimmed().isEmpty() ? QString::fromLatin1(kDefaultSystemDb) : systemDb;
    return { system, mediaDb };
}
