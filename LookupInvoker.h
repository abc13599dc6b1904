// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_LOOKUPINVOKER_H
#define KOLOCATE_LOOKUPINVOKER_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include <chrono>
#include <optional>
#include "Categories.h"
#include "Entry.h"
#include "ProcessRunner.h"

/**
 * @brief What one lookup asks for. Built fresh from the query text for every lookup.
 */
struct SearchIntent {
    QString primaryTerm;                // the only term sent to the lookup tool
    QStringList postFilterTokens;       // applied in memory afterwards
    std::optional<CategoryId> category;
    bool caseInsensitive = true;
    QStringList databases;              // combined with ':'; empty = tool default
};

enum class LookupStatus : quint8 {
    Ok,              // includes "no matches" (exit 1, no output)
    ProcessNotFound,
    NonZeroExit,
    Timeout,
    Canceled,
};

struct LookupResult {
    LookupStatus status = LookupStatus::Ok;
    QStringList lines;       // raw output paths, blank lines removed
    QVector<Entry> entries;  // lines classified on the worker (filled by TaskSupervisor)
    int exitCode = 0;
    QString diagnostics;     // stderr (or stdout) text of a failed run
    QString command;         // the command line that was run

    [[nodiscard]] bool ok() const { return status == LookupStatus::Ok; }
    [[nodiscard]] bool noMatches() const { return ok() && lines.isEmpty(); }
};

namespace LookupInvoker {
    inline constexpr std::chrono::seconds kDefaultTimeout{120};

    /**
     * Builds "[-i] <term> [-d <db1>:<db2>...]".
     */
    [[nodiscard]] QStringList buildArguments(const SearchIntent& intent);

    /**
     * @brief Runs the lookup tool and waits for its terminal result.
     *
     * Blocking; runs on a worker thread. Exit code 1 with no output at all is the lookup
     * tool's way of saying "no matches" and is reported as Ok with no lines.
     */
    [[nodiscard]] LookupResult invoke(const SearchIntent& intent,
                                      const QString& tool,
                                      std::chrono::milliseconds deadline,
                                      const std::atomic<bool>* cancel);

    /**
     * Maps a finished process onto the lookup result contract.
     */
    [[nodiscard]] LookupResult interpretOutcome(const ProcessOutcome& outcome, const QString& command);

    /**
     * User-facing description of a failed lookup (command, exit status, diagnostics).
     */
    [[nodiscard]] QString describeFailure(const LookupResult& result);
}

#endif //KOLOCATE_LOOKUPINVOKER_H
