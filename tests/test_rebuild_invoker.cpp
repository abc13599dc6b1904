// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QtTest/QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "RebuildInvoker.h"
#include "Settings.h"

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

} // namespace

class TestRebuildInvoker : public QObject {
    Q_OBJECT

private slots:
    void testSystemStepWithHelper()
    {
        const Settings s;
        const RebuildStep step = RebuildInvoker::systemStep(s, {QStringLiteral(" /mnt/backup "), QString(), QStringLiteral("/tmp")});
        QCOMPARE(step.label, QStringLiteral("System database"));
        QCOMPARE(step.program, QStringLiteral("pkexec"));
        QCOMPARE(step.arguments, (QStringList{QStringLiteral("updatedb"), QStringLiteral("-e"),
                                              QStringLiteral("/mnt/backup"), QStringLiteral("/tmp")}));

        QCOMPARE(RebuildInvoker::systemStep(s, {}).arguments, QStringList{QStringLiteral("updatedb")});
    }

    void testMediaStepWithoutHelper()
    {
        Settings s;
        s.escalationHelper.clear();
        const RebuildStep step = RebuildInvoker::mediaStep(s);
        QCOMPARE(step.program, QStringLiteral("updatedb"));
        QCOMPARE(step.arguments, (QStringList{QStringLiteral("-o"), QStringLiteral("/var/lib/plocate/media.db"),
                                              QStringLiteral("-U"), QStringLiteral("/run/media")}));
    }

    void testBuildPlan()
    {
        const Settings s;
        RebuildOptions options;
        QCOMPARE(RebuildInvoker::buildPlan(s, options).steps.size(), 2);

        options.includeMedia = false;
        const RebuildPlan plan = RebuildInvoker::buildPlan(s, options);
        QCOMPARE(plan.steps.size(), 1);
        QCOMPARE(plan.steps.first().label, QStringLiteral("System database"));
    }

    void testRunStepSucceeds()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        RebuildStep step;
        step.label = QStringLiteral("System database");
        step.program = dir.filePath(QStringLiteral("updatedb"));
        QVERIFY(writeExecutableScript(step.program, "exit 0\n"));

        const RebuildStepResult r = RebuildInvoker::runStep(step, nullptr);
        QVERIFY(r.ok());
        QCOMPARE(r.label, step.label);
    }

    void testRunStepFailureCarriesDiagnostics()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        RebuildStep step;
        step.program = dir.filePath(QStringLiteral("updatedb"));
        step.arguments = {QStringLiteral("-e"), QStringLiteral("/mnt")};
        QVERIFY(writeExecutableScript(step.program, "echo 'updatedb: permission denied' >&2\nexit 1\n"));

        const RebuildStepResult r = RebuildInvoker::runStep(step, nullptr);
        QCOMPARE(r.status, RebuildStatus::NonZeroExit);
        QCOMPARE(r.exitCode, 1);

        const QString message = RebuildInvoker::describeFailure(r);
        QVERIFY(message.contains(QStringLiteral("permission denied")));
        QVERIFY(message.contains(QStringLiteral("-e /mnt")));
    }

    void testDismissedAuthentication()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        RebuildStep step;
        step.program = dir.filePath(QStringLiteral("pkexec"));
        QVERIFY(writeExecutableScript(step.program, "exit 126\n"));

        const RebuildStepResult r = RebuildInvoker::runStep(step, nullptr);
        QCOMPARE(r.status, RebuildStatus::NonZeroExit);
        QCOMPARE(r.diagnostics, QStringLiteral("Authentication was cancelled."));
    }

    void testMissingHelper()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        RebuildStep step;
        step.program = dir.filePath(QStringLiteral("no-such-helper"));

        const RebuildStepResult r = RebuildInvoker::runStep(step, nullptr);
        QCOMPARE(r.status, RebuildStatus::ProcessNotFound);
        QVERIFY(RebuildInvoker::describeFailure(r).contains(QStringLiteral("polkit")));
    }

    void testCanceledStep()
    {
        RebuildStep step;
        step.program = QStringLiteral("/bin/true");
        std::atomic<bool> cancel{true};

        const RebuildStepResult r = RebuildInvoker::runStep(step, &cancel);
        QCOMPARE(r.status, RebuildStatus::Canceled);
        QVERIFY(RebuildInvoker::describeFailure(r).isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestRebuildInvoker)
#include "test_rebuild_invoker.moc"
