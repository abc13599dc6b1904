// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QtTest/QtTest>
#include <QFile>
#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "Settings.h"

class TestSettings : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QCoreApplication::setOrganizationName(QStringLiteral("kolocate-tests"));
        QCoreApplication::setApplicationName(QStringLiteral("test_settings"));
    }

    void init()
    {
        QSettings().clear();
    }

    void cleanupTestCase()
    {
        QSettings().clear();
    }

    void testDefaults()
    {
        const Settings s = Settings::load();
        QCOMPARE(s.lookupTool, QStringLiteral("plocate"));
        QCOMPARE(s.escalationHelper, QStringLiteral("pkexec"));
        QCOMPARE(s.lookupTimeoutSeconds, 120);
        QCOMPARE(s.sortColumn, -1);
        QCOMPARE(s.category, CategoryId::AllCategories);
        QVERIFY(s.includeMedia);
    }

    void testSaveAndLoad()
    {
        Settings s;
        s.lookupTool = QStringLiteral("/opt/plocate/bin/plocate");
        s.lookupTimeoutSeconds = 30;
        s.excludePaths = {QStringLiteral("/mnt/backup"), QStringLiteral("/tmp")};
        s.includeMedia = false;
        s.sortColumn = 1;
        s.sortOrder = Qt::DescendingOrder;
        s.category = CategoryId::Images;
        s.refineRegex = true;
        s.save();

        const Settings loaded = Settings::load();
        QCOMPARE(loaded.lookupTool, s.lookupTool);
        QCOMPARE(loaded.lookupTimeoutSeconds, 30);
        QVERIFY(loaded.lookupTimeout() == std::chrono::milliseconds(30'000));
        QCOMPARE(loaded.excludePaths, s.excludePaths);
        QVERIFY(!loaded.includeMedia);
        QCOMPARE(loaded.sortColumn, 1);
        QCOMPARE(loaded.sortOrder, Qt::DescendingOrder);
        QCOMPARE(loaded.category, CategoryId::Images);
        QVERIFY(loaded.refineRegex);
    }

    void testInvalidTimeoutFallsBack()
    {
        QSettings s;
        s.setValue(QStringLiteral("lookup/timeoutSeconds"), 0);
        s.setValue(QStringLiteral("ui/category"), QStringLiteral("no-such-category"));
        s.sync();

        const Settings loaded = Settings::load();
        QCOMPARE(loaded.lookupTimeoutSeconds, 120);
        QCOMPARE(loaded.category, CategoryId::AllCategories);
    }

    void testMediaDatabaseIsCombinedOnlyWhenPresent()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        Settings s;
        s.systemDb = dir.filePath(QStringLiteral("plocate.db"));
        s.mediaDb = dir.filePath(QStringLiteral("media.db"));
        QVERIFY(s.lookupDatabases().isEmpty());

        QFile media(s.mediaDb);
        QVERIFY(media.open(QIODevice::WriteOnly));
        media.close();
        QCOMPARE(s.lookupDatabases(), (QStringList{s.systemDb, s.mediaDb}));
    }

    void testEmptySystemDatabaseFallsBackToDefault()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        Settings s;
        s.mediaDb = dir.filePath(QStringLiteral("media.db"));
        QFile media(s.mediaDb);
        QVERIFY(media.open(QIODevice::WriteOnly));
        media.close();

        const QStringList expected{QString::fromLatin1(Settings::kDefaultSystemDb), s.mediaDb};

        s.systemDb.clear();
        QCOMPARE(s.lookupDatabases(), expected);

        s.systemDb = QStringLiteral("   ");
        QCOMPARE(s.lookupDatabases(), expected);

        // Every entry reaches the lookup tool as a separate, non-empty database path.
        for (const QString& db : s.lookupDatabases()) {
            QVERIFY(!db.trimmed().isEmpty());
        }
    }
};

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
