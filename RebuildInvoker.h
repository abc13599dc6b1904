// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_REBUILDINVOKER_H
#define KOLOCATE_REBUILDINVOKER_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include "ProcessRunner.h"

struct Settings;

struct RebuildOptions {
    QStringList excludePaths; // system index only
    bool includeMedia = true; // also rebuild the media index after the system one
};

struct RebuildStep {
    QString label; // "System database", "Media database"
    QString program;
    QStringList arguments;
};

/**
 * @brief An ordered chain of rebuild steps. Step N+1 only runs if step N succeeded.
 */
struct RebuildPlan {
    QVector<RebuildStep> steps;
};

enum class RebuildStatus : quint8 {
    Ok,
    ProcessNotFound,
    NonZeroExit,
    Canceled,
};

struct RebuildStepResult {
    RebuildStatus status = RebuildStatus::Ok;
    int stepIndex = 0;
    QString label;
    int exitCode = 0;
    QString diagnostics;
    QString command;

    [[nodiscard]] bool ok() const { return status == RebuildStatus::Ok; }
};

namespace RebuildInvoker {
    /**
     * System index: "<helper> <tool> [-e <excl1> <excl2> ...]".
     */
    [[nodiscard]] RebuildStep systemStep(const Settings& settings, const QStringList& excludePaths);

    /**
     * Media index: "<helper> <tool> -o <mediaDb> -U <mediaScanPath>".
     */
    [[nodiscard]] RebuildStep mediaStep(const Settings& settings);

    [[nodiscard]] RebuildPlan buildPlan(const Settings& settings, const RebuildOptions& options);

    /**
     * Runs one step to completion on the calling worker thread. No deadline applies;
     * only the cancel flag stops it early.
     */
    [[nodiscard]] RebuildStepResult runStep(const RebuildStep& step, const std::atomic<bool>* cancel);

    [[nodiscard]] RebuildStepResult interpretOutcome(const ProcessOutcome& outcome, const RebuildStep& step);

    [[nodiscard]] QString describeFailure(const RebuildStepResult& result);
}

#endif //KOLOCATE_REBUILDINVOKER_H
