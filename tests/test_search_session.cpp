// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>
#include "ResultsModel.h"
#include "SearchSession.h"

namespace {

bool writeExecutableScript(const QString& path, const QByteArray& body)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    file.write("#!/bin/sh\n");
    file.write(body);
    file.close();
    return file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
}

QStringList names(const QVector<Entry>& entries)
{
    QStringList out;
    for (const Entry& e : entries) out << e.name;
    return out;
}

} // namespace

class TestSearchSession : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_root;    // directory the fake lookup tool reports results from
    QString m_callLog; // one line per lookup tool invocation: its arguments

    Settings fakeSettings() const
    {
        Settings s;
        s.lookupTool = m_dir->filePath(QStringLiteral("plocate"));
        s.lookupTimeoutSeconds = 20;
        s.mediaDb.clear();
        s.rebuildTool = m_dir->filePath(QStringLiteral("updatedb"));
        s.escalationHelper.clear();
        s.includeMedia = false;
        return s;
    }

    QStringList calls() const
    {
        QFile f(m_callLog);
        if (!f.open(QIODevice::ReadOnly)) {
            return {};
        }
        return QString::fromUtf8(f.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    }

    static bool waitIdle(const SearchSession& session)
    {
        return QTest::qWaitFor([&session]() { return !session.isLookupActive(); }, 10'000);
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<TaskHandle>("TaskHandle");
        qRegisterMetaType<LookupResult>("LookupResult");
        qRegisterMetaType<RebuildStepResult>("RebuildStepResult");
        qRegisterMetaType<EntryMetadata>("EntryMetadata");
        qRegisterMetaType<LaunchKind>("LaunchKind");

        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());

        m_root = m_dir->filePath(QStringLiteral("home"));
        m_callLog = m_dir->filePath(QStringLiteral("calls.log"));
        QVERIFY(QDir().mkpath(m_root + QStringLiteral("/docs")));

        QFile report(m_root + QStringLiteral("/report.pdf"));
        QVERIFY(report.open(QIODevice::WriteOnly));
        report.write(QByteArray(2048, 'r'));
        report.close();

        // Reports a fixed set of paths regardless of the term, except for a few magic terms.
        const QByteArray script = QStringLiteral(
            "echo \"$*\" >> '%1'\n"
            "if [ \"$1\" = \"-i\" ]; then term=\"$2\"; else term=\"$1\"; fi\n"
            "case \"$term\" in\n"
            "  slow) exec sleep 30 ;;\n"
            "  broken) echo 'database is corrupt' >&2; exit 2 ;;\n"
            "  nothing) exit 1 ;;\n"
            "esac\n"
            "printf '%s\\n' '%2/report.pdf' '%2/Report-final.odt' '%2/photo.jpg' '%2/docs/'\n")
            .arg(m_callLog, m_root).toUtf8();
        QVERIFY(writeExecutableScript(m_dir->filePath(QStringLiteral("plocate")), script));
    }

    void init()
    {
        QFile::remove(m_callLog);
    }

    void testRefiningTokensReuseTheCache()
    {
        SearchSession session(fakeSettings());

        session.runLookup(QStringLiteral("report"));
        QVERIFY(session.isLookupActive());
        QVERIFY(waitIdle(session));
        QCOMPARE(calls(), QStringList{QStringLiteral("-i report")});
        QCOMPARE(session.visibleEntries().size(), 4);

        session.runLookup(QStringLiteral("report pdf"));
        QVERIFY(!session.isLookupActive());
        QCOMPARE(names(session.visibleEntries()), QStringList{QStringLiteral("report.pdf")});

        QSignalSpy category(&session, &SearchSession::categoryChanged);
        session.runLookup(QStringLiteral("report ::doc"));
        QVERIFY(!session.isLookupActive());
        QCOMPARE(category.count(), 1);
        QCOMPARE(session.state().category, CategoryId::Documents);
        QCOMPARE(names(session.visibleEntries()),
                 (QStringList{QStringLiteral("report.pdf"), QStringLiteral("Report-final.odt")}));

        session.setCategory(CategoryId::Directories);
        QCOMPARE(names(session.visibleEntries()), QStringList{QStringLiteral("docs")});

        QCOMPARE(calls().size(), 1);
    }

    void testCaseModeFollowsTheQuery()
    {
        SearchSession session(fakeSettings());
        QSignalSpy caseMode(&session, &SearchSession::caseModeChanged);

        session.runLookup(QStringLiteral("Report"));
        QVERIFY(!session.caseInsensitive());
        QCOMPARE(caseMode.count(), 1);
        QVERIFY(waitIdle(session));

        // A manual choice wins until the query is cleared, and changes what is sent to the tool.
        session.setCaseOverride(true);
        QVERIFY(session.caseInsensitive());
        QVERIFY(waitIdle(session));

        session.runLookup(QStringLiteral("Reports"));
        QVERIFY(session.caseInsensitive());
        QVERIFY(waitIdle(session));

        session.runLookup(QString());
        session.runLookup(QStringLiteral("Report"));
        QVERIFY(!session.caseInsensitive());
        QVERIFY(waitIdle(session));

        // Category shortcuts do not count towards the automatic rule.
        session.runLookup(QStringLiteral("report ::Doc"));
        QVERIFY(session.caseInsensitive());
        QCOMPARE(session.state().category, CategoryId::Documents);
        QVERIFY(waitIdle(session));

        QCOMPARE(calls(), (QStringList{QStringLiteral("Report"), QStringLiteral("-i Report"),
                                       QStringLiteral("-i Reports"), QStringLiteral("Report"),
                                       QStringLiteral("-i report")}));
    }

    void testCaseToggleUsesTheTextBeingTyped()
    {
        SearchSession session(fakeSettings());

        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        // The query line already holds newer text than the last lookup.
        session.setCaseOverride(true, QStringLiteral("Reports"));
        QVERIFY(session.isLookupActive());
        QVERIFY(session.caseInsensitive());
        QCOMPARE(session.state().queryText, QStringLiteral("Reports"));
        QVERIFY(waitIdle(session));

        session.setCaseOverride(false, QStringLiteral("reports"));
        QVERIFY(!session.caseInsensitive());
        QCOMPARE(session.state().queryText, QStringLiteral("reports"));
        QVERIFY(waitIdle(session));

        // Nothing to look up when the line was cleared in the meantime.
        session.setCaseOverride(true, QString());
        QVERIFY(!session.isLookupActive());
        QVERIFY(session.caseInsensitive());
        QVERIFY(session.state().queryText.isEmpty());

        QCOMPARE(calls(), (QStringList{QStringLiteral("-i report"), QStringLiteral("-i Reports"),
                                       QStringLiteral("reports")}));
    }

    void testNoMatchesShowsPlaceholder()
    {
        SearchSession session(fakeSettings());
        ResultsModel model(&session);

        session.runLookup(QStringLiteral("nothing"));
        QVERIFY(waitIdle(session));

        QVERIFY(session.showsPlaceholder());
        QVERIFY(session.visibleEntries().isEmpty());
        QCOMPARE(model.rowCount(), 1);
        QCOMPARE(model.data(model.index(0, 0)).toString(), QString::fromLatin1(ResultsModel::kPlaceholderText));
        QVERIFY(!(model.flags(model.index(0, 0)) & Qt::ItemIsDragEnabled));

        QString error;
        QVERIFY(!session.dispatch(SessionCommand::CopyPath, 0, &error));
        QCOMPARE(error, QStringLiteral("Please select a valid result row."));

        // Filters that remove every row show the placeholder too.
        session.runLookup(QStringLiteral("report zzz"));
        QVERIFY(waitIdle(session));
        QVERIFY(session.showsPlaceholder());

        session.runLookup(QString());
        QVERIFY(!session.showsPlaceholder());
        QCOMPARE(model.rowCount(), 0);
    }

    void testRefineBox()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QVERIFY(session.refineFilter(QStringLiteral("photo")));
        QCOMPARE(names(session.visibleEntries()), QStringList{QStringLiteral("photo.jpg")});

        QVERIFY(session.setRefineRegex(true));
        QCOMPARE(names(session.visibleEntries()), QStringList{QStringLiteral("photo.jpg")});

        QVERIFY(session.refineFilter(QStringLiteral("\\.(pdf|odt)$")));
        QCOMPARE(session.visibleEntries().size(), 2);

        QString error;
        QVERIFY(!session.refineFilter(QStringLiteral("(["), &error));
        QVERIFY(!error.isEmpty());
        QCOMPARE(session.visibleEntries().size(), 2);
        QCOMPARE(session.state().refineText, QStringLiteral("\\.(pdf|odt)$"));

        QVERIFY(session.refineFilter(QString()));
        QCOMPARE(session.visibleEntries().size(), 4);
        QCOMPARE(calls().size(), 1);
    }

    void testLookupFailureClearsResults()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));
        QVERIFY(session.state().raw.has_value());

        QSignalSpy failure(&session, &SearchSession::failure);
        session.runLookup(QStringLiteral("broken"));
        QVERIFY(waitIdle(session));

        QCOMPARE(failure.count(), 1);
        QCOMPARE(failure.at(0).at(0).toString(), QStringLiteral("Search failed"));
        QVERIFY(failure.at(0).at(1).toString().contains(QStringLiteral("database is corrupt")));
        QVERIFY(!session.state().raw.has_value());
        QVERIFY(session.visibleEntries().isEmpty());
        QVERIFY(!session.showsPlaceholder());
    }

    void testMissingToolIsAnExecutionError()
    {
        Settings s = fakeSettings();
        s.lookupTool = m_dir->filePath(QStringLiteral("no-such-tool"));
        SearchSession session(s);

        QSignalSpy failure(&session, &SearchSession::failure);
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QCOMPARE(failure.count(), 1);
        QCOMPARE(failure.at(0).at(0).toString(), QStringLiteral("Execution Error"));
    }

    void testNewQuerySupersedesRunningLookup()
    {
        SearchSession session(fakeSettings());
        QSignalSpy busy(&session, &SearchSession::lookupBusyChanged);
        QSignalSpy views(&session, &SearchSession::viewChanged);

        session.runLookup(QStringLiteral("slow"));
        QTest::qWait(200);
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QCOMPARE(busy.count(), 2);
        QCOMPARE(busy.at(0).at(0).toBool(), true);
        QCOMPARE(busy.at(1).at(0).toBool(), false);

        // Only the latest query ever reached the view.
        QCOMPARE(views.count(), 1);
        QCOMPARE(session.state().raw->term, QStringLiteral("report"));
        QCOMPARE(session.visibleEntries().size(), 4);
        QCOMPARE(calls(), (QStringList{QStringLiteral("-i slow"), QStringLiteral("-i report")}));
    }

    void testCancelActiveLookup()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("slow"));
        QVERIFY(session.dispatch(SessionCommand::CancelActive, -1));
        QVERIFY(waitIdle(session));
        QVERIFY(!session.state().raw.has_value());

        QString error;
        QVERIFY(!session.dispatch(SessionCommand::CancelActive, -1, &error));
        QCOMPARE(error, QStringLiteral("Nothing is running."));
    }

    void testStaleMetadataIsDropped()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QSignalSpy status(&session, &SearchSession::metadataChanged);

        session.selectEntry(0);
        QCOMPARE(status.count(), 1);
        QCOMPARE(status.at(0).at(0).toString(), QStringLiteral("report.pdf  |  Loading..."));
        QTRY_COMPARE_WITH_TIMEOUT(status.count(), 2, 10'000);
        QVERIFY(status.at(1).at(0).toString().startsWith(QStringLiteral("report.pdf  |  2.00 KiB  |  Modified: ")));

        session.selectEntry(2);
        QCOMPARE(status.count(), 3);

        // A late answer for the previous selection must not overwrite the new one.
        EntryMetadata late;
        late.accessible = true;
        session.onMetadataReady(m_root + QStringLiteral("/report.pdf"), late);
        QCOMPARE(status.count(), 3);

        QTRY_COMPARE_WITH_TIMEOUT(status.count(), 4, 10'000);
        QCOMPARE(status.at(3).at(0).toString(), QStringLiteral("photo.jpg  |  Not accessible"));

        session.selectEntry(-1);
        QCOMPARE(status.count(), 5);
        QVERIFY(status.at(4).at(0).toString().isEmpty());
    }

    void testSelectionCommands()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QSignalSpy launches(&session, &SearchSession::launchRequested);

        QVERIFY(session.dispatch(SessionCommand::OpenEntry, 0));
        QVERIFY(session.dispatch(SessionCommand::OpenContainingFolder, 0));
        QVERIFY(session.dispatch(SessionCommand::CopyName, 0));
        QVERIFY(session.dispatch(SessionCommand::CopyPath, 1));
        QVERIFY(session.dispatch(SessionCommand::OpenTerminal, 0));
        QVERIFY(session.dispatch(SessionCommand::OpenTerminal, 3));
        QVERIFY(!session.dispatch(SessionCommand::OpenEntry, 99));

        QCOMPARE(launches.count(), 6);

        auto kindAt = [&launches](int i) { return launches.at(i).at(0).value<LaunchKind>(); };
        auto targetAt = [&launches](int i) { return launches.at(i).at(1).toString(); };

        QCOMPARE(kindAt(0), LaunchKind::OpenUrl);
        QCOMPARE(targetAt(0), m_root + QStringLiteral("/report.pdf"));
        QCOMPARE(targetAt(1), m_root);
        QCOMPARE(kindAt(2), LaunchKind::CopyText);
        QCOMPARE(targetAt(2), QStringLiteral("report.pdf"));
        QCOMPARE(targetAt(3), m_root + QStringLiteral("/Report-final.odt"));
        QCOMPARE(kindAt(4), LaunchKind::OpenTerminal);
        QCOMPARE(targetAt(4), m_root);
        QCOMPARE(targetAt(5), m_root + QStringLiteral("/docs"));
    }

    void testActivatingACellDependsOnTheColumn()
    {
        SearchSession session(fakeSettings());
        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));

        QSignalSpy launches(&session, &SearchSession::launchRequested);

        QVERIFY(session.activate(0, 0));
        QVERIFY(session.activate(0, 1));
        QVERIFY(session.activate(3, 1));

        QString error;
        QVERIFY(!session.activate(99, 1, &error));
        QCOMPARE(error, QStringLiteral("Please select a valid result row."));

        QCOMPARE(launches.count(), 3);
        for (const QList<QVariant>& args : launches) {
            QCOMPARE(args.at(0).value<LaunchKind>(), LaunchKind::OpenUrl);
        }
        QCOMPARE(launches.at(0).at(1).toString(), m_root + QStringLiteral("/report.pdf"));
        QCOMPARE(launches.at(1).at(1).toString(), m_root);
        QCOMPARE(launches.at(2).at(1).toString(), m_root);

        session.runLookup(QStringLiteral("nothing"));
        QVERIFY(waitIdle(session));
        QVERIFY(session.showsPlaceholder());
        QVERIFY(!session.activate(0, 1));
        QVERIFY(!session.activate(0, 0));
        QCOMPARE(launches.count(), 3);
    }

    void testSortingThroughTheModel()
    {
        SearchSession session(fakeSettings());
        ResultsModel model(&session);
        QSignalSpy reset(&model, &QAbstractItemModel::modelReset);

        session.runLookup(QStringLiteral("report"));
        QVERIFY(waitIdle(session));
        QCOMPARE(model.rowCount(), 4);

        model.sort(0, Qt::AscendingOrder);
        QCOMPARE(names(session.visibleEntries()),
                 (QStringList{QStringLiteral("docs"), QStringLiteral("photo.jpg"),
                              QStringLiteral("Report-final.odt"), QStringLiteral("report.pdf")}));
        QCOMPARE(model.data(model.index(0, 0)).toString(), QStringLiteral("docs"));
        QCOMPARE(model.data(model.index(0, 1)).toString(), m_root);

        // The order survives re-filtering.
        session.runLookup(QStringLiteral("report report"));
        QCOMPARE(names(session.visibleEntries()),
                 (QStringList{QStringLiteral("Report-final.odt"), QStringLiteral("report.pdf")}));

        model.sort(0, Qt::DescendingOrder);
        QCOMPARE(names(session.visibleEntries()),
                 (QStringList{QStringLiteral("report.pdf"), QStringLiteral("Report-final.odt")}));
        QVERIFY(reset.count() >= 3);
    }

    void testRebuildIsSingleton()
    {
        QVERIFY(writeExecutableScript(m_dir->filePath(QStringLiteral("updatedb")), "exec sleep 30\n"));

        SearchSession session(fakeSettings());
        QSignalSpy busy(&session, &SearchSession::rebuildBusyChanged);
        QSignalSpy progress(&session, &SearchSession::rebuildProgress);

        QVERIFY(session.dispatch(SessionCommand::StartRebuild, -1));
        QVERIFY(session.isRebuildActive());

        QString error;
        QVERIFY(!session.startRebuild(RebuildOptions{}, &error));
        QCOMPARE(error, QStringLiteral("A database update is already running."));

        QVERIFY(session.cancelActive());
        QTRY_VERIFY_WITH_TIMEOUT(!session.isRebuildActive(), 10'000);

        QCOMPARE(busy.count(), 2);
        QCOMPARE(progress.last().at(0).toString(), QStringLiteral("Database update cancelled."));
    }

    void testRebuildSuccess()
    {
        QVERIFY(writeExecutableScript(m_dir->filePath(QStringLiteral("updatedb")), "exit 0\n"));

        SearchSession session(fakeSettings());
        QSignalSpy succeeded(&session, &SearchSession::rebuildSucceeded);
        QSignalSpy progress(&session, &SearchSession::rebuildProgress);

        RebuildOptions options;
        options.includeMedia = false;
        QVERIFY(session.startRebuild(options));
        QVERIFY(succeeded.wait(10'000));
        QCOMPARE(progress.count(), 1);
        QCOMPARE(progress.at(0).at(0).toString(), QStringLiteral("System database update started."));
        QVERIFY(!session.isRebuildActive());
    }
};

QTEST_MAIN(TestSearchSession)
#include "test_search_session.moc"
