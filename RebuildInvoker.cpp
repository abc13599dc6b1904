// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDebug>
#include <utility>
#include "RebuildInvoker.h"
#include "Settings.h"

namespace RebuildInvoker {

    // Exit code pkexec uses when the authentication dialog was dismissed.
    static constexpr int kPkexecDismissed = 126;

    static RebuildStep escalated(const Settings& settings, QString label, const QStringList& toolArgs) {
        RebuildStep step;
        step.label = std::move(label);

        if (settings.escalationHelper.isEmpty()) {
            step.program = settings.rebuildTool;
            step.arguments = toolArgs;
        } else {
            step.program = settings.escalationHelper;
            step.arguments << settings.rebuildTool << toolArgs;
        }

        return step;
    }

    RebuildStep systemStep(const Settings& settings, const QStringList& excludePaths) {
        QStringList args;

        QStringList cleaned;
        for (const QString& p : excludePaths) {
            const QString t = p.trimmed();
            if (!t.isEmpty()) {
                cleaned.push_back(t);
            }
        }

        if (!cleaned.isEmpty()) {
            args << QStringLiteral("-e") << cleaned;
        }

        return escalated(settings, QStringLiteral("System database"), args);
    }

    RebuildStep mediaStep(const Settings& settings) {
        return escalated(settings, QStringLiteral("Media database"), {
            QStringLiteral("-o"), settings.mediaDb,
            QStringLiteral("-U"), settings.mediaScanPath,
        });
    }

    RebuildPlan buildPlan(const Settings& settings, const RebuildOptions& options) {
        RebuildPlan plan;
        plan.steps.push_back(systemStep(settings, options.excludePaths));

        if (options.includeMedia) {
            plan.steps.push_back(mediaStep(settings));
        }

        return plan;
    }

    RebuildStepResult runStep(const RebuildStep& step, const std::atomic<bool>* cancel) {
        const ProcessOutcome outcome = ProcessRunner::run(step.program, step.arguments, cancel, {});
        return interpretOutcome(outcome, step);
    }

    RebuildStepResult interpretOutcome(const ProcessOutcome& outcome, const RebuildStep& step) {
        RebuildStepResult r;
        r.label = step.label;
        r.command = ProcessRunner::describeCommand(step.program, step.arguments);
        r.exitCode = outcome.exitCode;

        switch (outcome.status) {
            case ProcessOutcome::Status::Finished:
                if (outcome.exitCode == 0) {
                    r.status = RebuildStatus::Ok;
                    return r;
                }
                r.status = RebuildStatus::NonZeroExit;
                r.diagnostics = QString::fromLocal8Bit(!outcome.stderrData.trimmed().isEmpty()
                    ? outcome.stderrData.trimmed()
                    : outcome.stdoutData.trimmed());
                if (r.diagnostics.isEmpty() && outcome.exitCode == kPkexecDismissed) {
                    r.diagnostics = QStringLiteral("Authentication was cancelled.");
                }
                return r;
            case ProcessOutcome::Status::FailedToStart:
                r.status = RebuildStatus::ProcessNotFound;
                r.diagnostics = outcome.errorString;
                return r;
            case ProcessOutcome::Status::Crashed:
                r.status = RebuildStatus::NonZeroExit;
                r.diagnostics = outcome.errorString;
                return r;
            case ProcessOutcome::Status::TimedOut:
                // Rebuild steps carry no deadline today.
                r.status = RebuildStatus::NonZeroExit;
                r.diagnostics = QStringLiteral("The rebuild did not finish in time.");
                return r;
            case ProcessOutcome::Status::Canceled:
                r.status = RebuildStatus::Canceled;
                return r;
        }

        return r;
    }

    QString describeFailure(const RebuildStepResult& result) {
        switch (result.status) {
            case RebuildStatus::Ok:
            case RebuildStatus::Canceled:
                return {};
            case RebuildStatus::ProcessNotFound:
                return QStringLiteral("The command '%1' could not be started (%2).\n\n"
                                      "Please ensure 'polkit' is installed and configured.")
                    .arg(result.command, result.diagnostics);
            case RebuildStatus::NonZeroExit:
                return QStringLiteral("Could not update database:\nCommand: %1\nExit Status: %2\nDetails: \n%3")
                    .arg(result.command)
                    .arg(result.exitCode)
                    .arg(result.diagnostics.isEmpty()
                        ? QStringLiteral("No detailed error message was returned.")
                        : result.diagnostics);
        }
        return {};
    }
}
