// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QProcess>
#include <QElapsedTimer>
#include <QDebug>
#include "ProcessRunner.h"

namespace ProcessRunner {

    static constexpr int kStartTimeoutMs = 10'000;

    ProcessOutcome run(const QString& program,
                       const QStringList& arguments,
                       const std::atomic<bool>* cancel,
                       const Options& options) {
        ProcessOutcome out;

        auto isCancelled = [cancel]() {
            return cancel && cancel->load();
        };

        if (isCancelled()) {
            out.status = ProcessOutcome::Status::Canceled;
            return out;
        }

        QProcess proc;
        proc.setProgram(program);
        proc.setArguments(arguments);

        qDebug().noquote() << "Launching:" << describeCommand(program, arguments);

        proc.start();
        if (!proc.waitForStarted(kStartTimeoutMs)) {
            out.status = ProcessOutcome::Status::FailedToStart;
            out.errorString = proc.errorString();
            qWarning().noquote() << "Failed to start" << program << ":" << out.errorString;
            return out;
        }

        QElapsedTimer elapsed;
        elapsed.start();

        out.stdoutData.reserve(1024 * 64);

        const int pollMs = static_cast<int>(options.pollInterval.count());
        const qint64 timeoutMs = options.timeout.count();

        // Loop until finished, checking for cancellation and the deadline
        while (!proc.waitForFinished(pollMs)) {
            if (proc.state() == QProcess::NotRunning) {
                break;
            }

            // drain stdout continuously to avoid deadlock if the process writes a lot.
            out.stdoutData += proc.readAllStandardOutput();
            out.stderrData += proc.readAllStandardError();

            if (isCancelled()) {
                qDebug() << "Cancellation requested. Stopping" << program;
                stopProcess(proc, options.terminateGrace);
                out = {};
                out.status = ProcessOutcome::Status::Canceled;
                return out;
            }

            if (timeoutMs > 0 && elapsed.hasExpired(timeoutMs)) {
                qWarning() << program << "exceeded its deadline of" << timeoutMs << "ms";
                stopProcess(proc, options.terminateGrace);
                out = {};
                out.status = ProcessOutcome::Status::TimedOut;
                return out;
            }
        }

        // Drain any remaining stdout/stderr after exit
        out.stdoutData += proc.readAllStandardOutput();
        out.stderrData += proc.readAllStandardError();

        // A cancel that raced with a normal exit still wins; no partial data is exposed.
        if (isCancelled()) {
            out = {};
            out.status = ProcessOutcome::Status::Canceled;
            return out;
        }

        if (proc.exitStatus() == QProcess::CrashExit) {
            out.status = ProcessOutcome::Status::Crashed;
            out.exitCode = proc.exitCode();
            out.errorString = proc.errorString();
            qWarning() << program << "crashed:" << out.errorString;
            return out;
        }

        out.status = ProcessOutcome::Status::Finished;
        out.exitCode = proc.exitCode();
        qDebug() << program << "finished with exit code" << out.exitCode
                 << "in" << elapsed.elapsed() << "ms";
        return out;
    }

    void stopProcess(QProcess& proc, std::chrono::milliseconds grace) {
        if (proc.state() == QProcess::NotRunning) {
            return;
        }

        // Ask nicely first; kill shortly after if it's still alive.
        proc.terminate();
        if (proc.waitForFinished(static_cast<int>(grace.count()))) {
            return;
        }

        if (proc.state() == QProcess::NotRunning) {
            return;
        }

        qDebug() << "Process ignored SIGTERM, sending SIGKILL";
        proc.kill();
        proc.waitForFinished(static_cast<int>(grace.count()));
    }

    QString describeCommand(const QString& program, const QStringList& arguments) {
        QStringList parts;
        parts.reserve(arguments.size() + 1);
        parts.push_back(program);
        for (const QString& a : arguments) {
            parts.push_back(a.contains(QLatin1Char(' ')) ? QStringLiteral("\"%1\"").arg(a) : a);
        }
        return parts.join(QLatin1Char(' '));
    }
}
