// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>
#include <new>
#include "TaskSupervisor.h"

TaskSupervisor::TaskSupervisor(QObject* parent) : QObject(parent) {
    // One lookup and one rebuild step can run side by side.
    m_pool.setMaxThreadCount(2);
}

TaskSupervisor::~TaskSupervisor() {
    // If the supervisor is destroyed while work is running
    // (e.g. the user closed the window), stop the child processes.
    cancelAll();
    m_pool.waitForDone();
}

void TaskSupervisor::setLookupTool(const QString& tool, std::chrono::milliseconds timeout) {
    m_lookupTool = tool;
    m_lookupTimeout = timeout;
}

std::optional<TaskHandle> TaskSupervisor::startLookup(const SearchIntent& intent, QString* errorOut) {
    if (m_lookup) {
        qDebug() << "Lookup rejected: lookup" << m_lookup->handle.id << "is still running";
        if (errorOut) *errorOut = QStringLiteral("A lookup is already running.");
        return std::nullopt;
    }

    ActiveTask task;
    task.handle = TaskHandle{m_nextTaskId++, TaskKind::Lookup};
    task.control = std::make_shared<TaskControl>();

    const quint64 id = task.handle.id;
    const std::shared_ptr<TaskControl> control = task.control;
    const QString tool = m_lookupTool;
    const std::chrono::milliseconds timeout = m_lookupTimeout;

    m_lookup = std::move(task);

    qDebug().noquote() << "Starting lookup" << id << "for" << intent.primaryTerm;

    auto* watcher = new QFutureWatcher<LookupResult>(this);
    connect(watcher, &QFutureWatcher<LookupResult>::finished, this, [this, watcher, id]() {
        LookupResult r = watcher->result();
        watcher->deleteLater();
        completeLookup(id, std::move(r));
    });

    watcher->setFuture(QtConcurrent::run(&m_pool, [intent, tool, timeout, control]() {
        control->started = true;

        LookupResult r = LookupInvoker::invoke(intent, tool, timeout, &control->cancelRequested);
        if (!r.ok()) {
            return r;
        }

        // Classify on the worker so the GUI thread only swaps the finished set in.
        try {
            r.entries = EntryUtils::classifyLines(r.lines);
        } catch (const std::bad_alloc& e) {
            r = LookupResult{};
            r.status = LookupStatus::NonZeroExit;
            r.command = ProcessRunner::describeCommand(tool, LookupInvoker::buildArguments(intent));
            r.diagnostics = QStringLiteral("Out of memory while processing the results (%1).").arg(e.what());
        }
        return r;
    }));

    Q_EMIT activeChanged(TaskKind::Lookup, true);
    return m_lookup->handle;
}

std::optional<TaskHandle> TaskSupervisor::startRebuild(const RebuildPlan& plan, QString* errorOut) {
    if (m_rebuild) {
        qDebug() << "Rebuild rejected: rebuild" << m_rebuild->handle.id << "is still running";
        if (errorOut) *errorOut = QStringLiteral("A database update is already running.");
        return std::nullopt;
    }

    if (plan.steps.isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("Nothing to update.");
        return std::nullopt;
    }

    ActiveTask task;
    task.handle = TaskHandle{m_nextTaskId++, TaskKind::Rebuild};
    task.control = std::make_shared<TaskControl>();
    task.plan = plan;
    task.stepIndex = 0;

    m_rebuild = std::move(task);

    qInfo() << "Starting database update" << m_rebuild->handle.id
            << "with" << plan.steps.size() << "step(s)";

    Q_EMIT activeChanged(TaskKind::Rebuild, true);

    const TaskHandle handle = m_rebuild->handle;
    dispatchRebuildStep();
    return handle;
}

void TaskSupervisor::dispatchRebuildStep() {
    if (!m_rebuild) {
        return;
    }

    const quint64 id = m_rebuild->handle.id;
    const int stepIndex = m_rebuild->stepIndex;
    const RebuildStep step = m_rebuild->plan.steps.at(stepIndex);
    const std::shared_ptr<TaskControl> control = m_rebuild->control;

    qInfo().noquote() << "Update step" << (stepIndex + 1) << "of" << m_rebuild->plan.steps.size()
                      << "-" << step.label;

    auto* watcher = new QFutureWatcher<RebuildStepResult>(this);
    connect(watcher, &QFutureWatcher<RebuildStepResult>::finished, this, [this, watcher, id]() {
        RebuildStepResult r = watcher->result();
        watcher->deleteLater();
        completeRebuildStep(id, std::move(r));
    });

    watcher->setFuture(QtConcurrent::run(&m_pool, [step, stepIndex, control]() {
        control->started = true;
        RebuildStepResult r = RebuildInvoker::runStep(step, &control->cancelRequested);
        r.stepIndex = stepIndex;
        return r;
    }));

    Q_EMIT rebuildStepStarted(m_rebuild->handle, stepIndex, step.label);
}

void TaskSupervisor::completeLookup(quint64 id, LookupResult result) {
    if (!m_lookup || m_lookup->handle.id != id) {
        qWarning() << "Ignoring completion of unknown lookup" << id;
        return;
    }

    const TaskHandle handle = m_lookup->handle;
    if (m_lookup->control->cancelRequested.load()) {
        result = LookupResult{};
        result.status = LookupStatus::Canceled;
    }

    // Release the slot BEFORE notifying, so subscribers can start a new lookup right away.
    m_lookup.reset();
    rememberFinalState(id, stateFor(result.status));

    qDebug() << "Lookup" << id << "finished with status" << static_cast<int>(result.status)
             << "and" << result.entries.size() << "entries";

    Q_EMIT activeChanged(TaskKind::Lookup, false);
    Q_EMIT lookupFinished(handle, result);
}

void TaskSupervisor::completeRebuildStep(quint64 id, RebuildStepResult result) {
    if (!m_rebuild || m_rebuild->handle.id != id) {
        qWarning() << "Ignoring completion of unknown rebuild" << id;
        return;
    }

    const TaskHandle handle = m_rebuild->handle;
    const bool cancelled = m_rebuild->control->cancelRequested.load();
    if (cancelled && result.ok()) {
        result.status = RebuildStatus::Canceled;
    }

    const bool moreSteps = m_rebuild->stepIndex + 1 < m_rebuild->plan.steps.size();

    if (result.ok() && moreSteps) {
        Q_EMIT rebuildStepFinished(handle, result);

        // The subscriber may have cancelled in its slot; the flag is checked again by the worker.
        if (m_rebuild && m_rebuild->handle.id == id) {
            m_rebuild->stepIndex += 1;
            dispatchRebuildStep();
        }
        return;
    }

    if (!result.ok()) {
        qWarning().noquote() << "Update step" << result.label << "ended with status"
                             << static_cast<int>(result.status) << result.diagnostics;
    } else {
        qInfo() << "Database update" << id << "completed";
    }

    // End of chain: release the slot before notifying.
    m_rebuild.reset();
    rememberFinalState(id, stateFor(result.status));

    Q_EMIT activeChanged(TaskKind::Rebuild, false);
    Q_EMIT rebuildStepFinished(handle, result);
    Q_EMIT rebuildFinished(handle, result);
}

bool TaskSupervisor::cancel(const TaskHandle& handle) {
    std::optional<ActiveTask>& slot = handle.kind == TaskKind::Lookup ? m_lookup : m_rebuild;

    if (!slot || slot->handle.id != handle.id) {
        return false;
    }

    // Idempotent cancel.
    if (slot->control->cancelRequested.exchange(true)) {
        return true;
    }

    qDebug() << "Cancellation requested for task" << handle.id;
    return true;
}

void TaskSupervisor::cancelAll() {
    if (m_lookup) cancel(m_lookup->handle);
    if (m_rebuild) cancel(m_rebuild->handle);
}

bool TaskSupervisor::isActive(TaskKind kind) const {
    return kind == TaskKind::Lookup ? m_lookup.has_value() : m_rebuild.has_value();
}

std::optional<TaskHandle> TaskSupervisor::activeHandle(TaskKind kind) const {
    const std::optional<ActiveTask>& slot = kind == TaskKind::Lookup ? m_lookup : m_rebuild;
    if (!slot) {
        return std::nullopt;
    }
    return slot->handle;
}

TaskState TaskSupervisor::state(const TaskHandle& handle) const {
    const std::optional<ActiveTask>& slot = handle.kind == TaskKind::Lookup ? m_lookup : m_rebuild;
    if (slot && slot->handle.id == handle.id) {
        return slot->control->started.load() ? TaskState::Running : TaskState::Pending;
    }

    const auto it = m_finishedStates.find(handle.id);
    return it != m_finishedStates.end() ? it->second : TaskState::Unknown;
}

void TaskSupervisor::rememberFinalState(quint64 id, TaskState state) {
    m_finishedStates[id] = state;
    while (m_finishedStates.size() > kMaxRememberedStates) {
        m_finishedStates.erase(m_finishedStates.begin());
    }
}

TaskState TaskSupervisor::stateFor(LookupStatus status) {
    switch (status) {
        case LookupStatus::Ok:       return TaskState::Completed;
        case LookupStatus::Canceled: return TaskState::Canceled;
        default:                     return TaskState::Failed;
    }
}

TaskState TaskSupervisor::stateFor(RebuildStatus status) {
    switch (status) {
        case RebuildStatus::Ok:       return TaskState::Completed;
        case RebuildStatus::Canceled: return TaskState::Canceled;
        default:                      return TaskState::Failed;
    }
}
