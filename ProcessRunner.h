// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_PROCESSRUNNER_H
#define KOLOCATE_PROCESSRUNNER_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <atomic>
#include <chrono>

class QProcess;

struct ProcessOutcome {
    enum class Status : quint8 {
        Finished,      // exited normally; see exitCode
        FailedToStart, // program missing or not executable
        Crashed,
        TimedOut,
        Canceled,
    };

    Status status = Status::Finished;
    int exitCode = 0;
    QByteArray stdoutData;
    QByteArray stderrData;
    QString errorString;
};

namespace ProcessRunner {
    struct Options {
        std::chrono::milliseconds timeout{0};          // 0 = no deadline
        std::chrono::milliseconds terminateGrace{500}; // SIGTERM -> SIGKILL delay
        std::chrono::milliseconds pollInterval{100};
    };

    /**
     * @brief Runs a program to completion on the calling (worker) thread.
     *
     * Polls the cancel flag (raised by the GUI thread) and the deadline while waiting. On cancel or timeout the
     * process is stopped (terminate first, kill after the grace period) and any output
     * collected so far is discarded. Never call this on the GUI thread.
     */
    [[nodiscard]] ProcessOutcome run(const QString& program,
                                     const QStringList& arguments,
                                     const std::atomic<bool>* cancel,
                                     const Options& options);

    /**
     * Asks a process to terminate, then kills it if it is still alive after the grace
     * period. A process that has already exited is left alone; that race is expected.
     */
    void stopProcess(QProcess& proc, std::chrono::milliseconds grace);

    /**
     * Renders a command line for logs and user-facing error messages.
     */
    [[nodiscard]] QString describeCommand(const QString& program, const QStringList& arguments);
}

#endif //KOLOCATE_PROCESSRUNNER_H
