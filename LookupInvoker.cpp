// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDebug>
#include "LookupInvoker.h"

namespace LookupInvoker {

    static QStringList splitOutputLines(const QByteArray& data) {
        QStringList lines;
        const QList<QByteArray> rawLines = data.split('\n');
        lines.reserve(rawLines.size());

        for (const QByteArray& raw : rawLines) {
            const QByteArray t = raw.trimmed();
            if (t.isEmpty()) {
                continue;
            }
            lines.push_back(QString::fromUtf8(t));
        }
        return lines;
    }

    QStringList buildArguments(const SearchIntent& intent) {
        QStringList args;

        if (intent.caseInsensitive) {
            args << QStringLiteral("-i");
        }

        args << intent.primaryTerm;

        if (!intent.databases.isEmpty()) {
            args << QStringLiteral("-d") << intent.databases.join(QLatin1Char(':'));
        }

        return args;
    }

    LookupResult invoke(const SearchIntent& intent,
                        const QString& tool,
                        std::chrono::milliseconds deadline,
                        const std::atomic<bool>* cancel) {
        const QStringList args = buildArguments(intent);

        ProcessRunner::Options opts;
        opts.timeout = deadline;

        const ProcessOutcome outcome = ProcessRunner::run(tool, args, cancel, opts);
        return interpretOutcome(outcome, ProcessRunner::describeCommand(tool, args));
    }

    LookupResult interpretOutcome(const ProcessOutcome& outcome, const QString& command) {
        LookupResult r;
        r.command = command;
        r.exitCode = outcome.exitCode;

        switch (outcome.status) {
            case ProcessOutcome::Status::FailedToStart:
                r.status = LookupStatus::ProcessNotFound;
                r.diagnostics = outcome.errorString;
                return r;
            case ProcessOutcome::Status::TimedOut:
                r.status = LookupStatus::Timeout;
                return r;
            case ProcessOutcome::Status::Canceled:
                r.status = LookupStatus::Canceled;
                return r;
            case ProcessOutcome::Status::Crashed:
                r.status = LookupStatus::NonZeroExit;
                r.diagnostics = outcome.errorString;
                return r;
            case ProcessOutcome::Status::Finished:
                break;
        }

        const QByteArray stdoutTrimmed = outcome.stdoutData.trimmed();
        const QByteArray stderrTrimmed = outcome.stderrData.trimmed();

        if (outcome.exitCode == 0) {
            r.status = LookupStatus::Ok;
            r.lines = splitOutputLines(outcome.stdoutData);
            return r;
        }

        if (outcome.exitCode == 1 && stdoutTrimmed.isEmpty() && stderrTrimmed.isEmpty()) {
            r.status = LookupStatus::Ok; // no matches
            return r;
        }

        r.status = LookupStatus::NonZeroExit;
        r.diagnostics = QString::fromLocal8Bit(!stderrTrimmed.isEmpty() ? stderrTrimmed : stdoutTrimmed);
        return r;
    }

    QString describeFailure(const LookupResult& result) {
        switch (result.status) {
            case LookupStatus::Ok:
            case LookupStatus::Canceled:
                return {};
            case LookupStatus::ProcessNotFound:
                return QStringLiteral("The lookup tool could not be started.\n\nCommand: %1\nDetails: %2\n\n"
                                      "Please ensure plocate is installed.")
                    .arg(result.command, result.diagnostics);
            case LookupStatus::Timeout:
                return QStringLiteral("The lookup did not finish in time and was stopped.\n\nCommand: %1")
                    .arg(result.command);
            case LookupStatus::NonZeroExit:
                return QStringLiteral("Error executing the lookup:\n\nCommand: %1\nExit Status: %2\nDetails:\n%3")
                    .arg(result.command)
                    .arg(result.exitCode)
                    .arg(result.diagnostics.isEmpty()
                        ? QStringLiteral("No detailed error message was returned.")
                        : result.diagnostics);
        }
        return {};
    }
}
