// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_TASKSUPERVISOR_H
#define KOLOCATE_TASKSUPERVISOR_H

#include <QObject>
#include <QString>
#include <QThreadPool>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include "LookupInvoker.h"
#include "RebuildInvoker.h"

enum class TaskKind : quint8 { Lookup, Rebuild };

enum class TaskState : quint8 {
    Pending,   // queued on the worker pool
    Running,
    Completed,
    Canceled,
    Failed,
    Unknown,   // handle not (or no longer) known
};

struct TaskHandle {
    quint64 id = 0;
    TaskKind kind = TaskKind::Lookup;

    [[nodiscard]] bool isValid() const { return id != 0; }
    bool operator==(const TaskHandle& other) const { return id == other.id && kind == other.kind; }
};

Q_DECLARE_METATYPE(TaskHandle)
Q_DECLARE_METATYPE(LookupResult)
Q_DECLARE_METATYPE(RebuildStepResult)

/**
 * @brief Owns the long-running background work: at most one lookup and at most one
 * database rebuild at a time.
 *
 * Work runs on a private, bounded QThreadPool. Results come back to the thread that owns
 * the supervisor (the GUI thread) through QFutureWatcher, so subscribers never see a
 * worker thread. Starting a second task of a kind that is already active is refused and
 * leaves the running task alone.
 *
 * On completion the slot for that kind is released before any signal is emitted, so a
 * subscriber may immediately start a new task from its slot.
 */
class TaskSupervisor final : public QObject {
    Q_OBJECT

public:
    explicit TaskSupervisor(QObject* parent = nullptr);
    ~TaskSupervisor() override;

    void setLookupTool(const QString& tool, std::chrono::milliseconds timeout);

    /**
     * @brief Starts a lookup. Returns std::nullopt (and an explanation in errorOut)
     * if a lookup is already active.
     */
    std::optional<TaskHandle> startLookup(const SearchIntent& intent, QString* errorOut = nullptr);

    /**
     * @brief Starts a rebuild chain. Each step is dispatched only after the previous
     * one succeeded; a failure or cancel ends the chain.
     */
    std::optional<TaskHandle> startRebuild(const RebuildPlan& plan, QString* errorOut = nullptr);

    /**
     * Requests cancellation. Returns false if the handle is not active (already finished
     * tasks are a normal race, not an error). Idempotent.
     */
    bool cancel(const TaskHandle& handle);
    void cancelAll();

    [[nodiscard]] bool isActive(TaskKind kind) const;
    [[nodiscard]] std::optional<TaskHandle> activeHandle(TaskKind kind) const;
    [[nodiscard]] TaskState state(const TaskHandle& handle) const;

signals:
    void lookupFinished(TaskHandle handle, const LookupResult& result);

    void rebuildStepStarted(TaskHandle handle, int stepIndex, const QString& label);
    void rebuildStepFinished(TaskHandle handle, const RebuildStepResult& result);

    // lastResult is the result of the step that ended the chain.
    void rebuildFinished(TaskHandle handle, const RebuildStepResult& lastResult);

    void activeChanged(TaskKind kind, bool active);

private:
    struct TaskControl {
        std::atomic<bool> cancelRequested{false};
        std::atomic<bool> started{false};
    };

    struct ActiveTask {
        TaskHandle handle;
        std::shared_ptr<TaskControl> control;

        // Rebuild chains only
        RebuildPlan plan;
        int stepIndex = 0;
    };

    void dispatchRebuildStep();
    void completeLookup(quint64 id, LookupResult result);
    void completeRebuildStep(quint64 id, RebuildStepResult result);

    void rememberFinalState(quint64 id, TaskState state);

    [[nodiscard]] static TaskState stateFor(LookupStatus status);
    [[nodiscard]] static TaskState stateFor(RebuildStatus status);

    QThreadPool m_pool;

    QString m_lookupTool = QStringLiteral("plocate");
    std::chrono::milliseconds m_lookupTimeout = LookupInvoker::kDefaultTimeout;

    std::optional<ActiveTask> m_lookup;
    std::optional<ActiveTask> m_rebuild;

    // Final states of recently finished tasks, oldest first (ids increase monotonically)
    std::map<quint64, TaskState> m_finishedStates;
    static constexpr std::size_t kMaxRememberedStates = 64;

    quint64 m_nextTaskId = 1;
};

#endif //KOLOCATE_TASKSUPERVISOR_H
