// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDebug>
#include <utility>
#include "GuiUtils.h"
#include "QueryTokenizer.h"
#include "SearchSession.h"

SearchSession::SearchSession(Settings settings, QObject* parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_supervisor(new TaskSupervisor(this))
    , m_metadata(new MetadataFetcher(this))
{
    m_supervisor->setLookupTool(m_settings.lookupTool, m_settings.lookupTimeout());

    m_state.category = m_settings.category;
    m_state.refineRegex = m_settings.refineRegex;
    m_state.sortColumn = SortEngine::columnFromIndex(m_settings.sortColumn);
    m_state.sortOrder = m_settings.sortOrder;

    connect(m_supervisor, &TaskSupervisor::lookupFinished, this, &SearchSession::onLookupFinished);
    connect(m_supervisor, &TaskSupervisor::rebuildStepStarted, this, &SearchSession::onRebuildStepStarted);
    connect(m_supervisor, &TaskSupervisor::rebuildFinished, this, &SearchSession::onRebuildFinished);
    connect(m_metadata, &MetadataFetcher::metadataReady, this, &SearchSession::onMetadataReady);
}

SearchSession::~SearchSession() {
    // Stop running processes before the children (supervisor, fetcher) are torn down.
    m_supervisor->cancelAll();
}

void SearchSession::setSettings(const Settings& settings) {
    m_settings = settings;
    m_supervisor->setLookupTool(m_settings.lookupTool, m_settings.lookupTimeout());
}

// ---- Query ----

void SearchSession::runLookup(const QString& text) {
    m_state.queryText = text;
    m_casePolicy.queryTextChanged(text);

    const TokenizedQuery query = QueryTokenizer::tokenize(text);

    if (query.category && *query.category != m_state.category) {
        m_state.category = *query.category;
        Q_EMIT categoryChanged(m_state.category);
    }

    if (text.trimmed().isEmpty()) {
        resetResults();
        return;
    }

    // Only the searchable text decides the case mode, not a shortcut like "::Doc".
    updateCaseMode(m_casePolicy.caseInsensitiveFor(query.tokens.join(QLatin1Char(' '))));

    if (query.tokens.isEmpty()) {
        // Category shortcut on its own: narrow whatever is cached.
        m_state.postFilterTokens.clear();
        recompute();
        return;
    }

    const SearchIntent intent = makeIntent(query.tokens);
    m_state.postFilterTokens = intent.postFilterTokens;

    if (servedByCache(intent)) {
        if (m_state.lookup) {
            // The running lookup is for a term the user has moved away from.
            m_state.pendingIntent.reset();
            m_supervisor->cancel(*m_state.lookup);
        }
        recompute();
        return;
    }

    if (m_state.lookup) {
        qDebug().noquote() << "Superseding running lookup with" << intent.primaryTerm;
        m_state.pendingIntent = intent;
        m_supervisor->cancel(*m_state.lookup);
        return;
    }

    startLookup(intent);
}

SearchIntent SearchSession::makeIntent(const QStringList& tokens) const {
    SearchIntent intent;
    intent.primaryTerm = tokens.first();
    intent.postFilterTokens = tokens.mid(1);
    intent.category = m_state.category;
    intent.caseInsensitive = m_state.caseInsensitive;
    intent.databases = m_settings.lookupDatabases();
    return intent;
}

bool SearchSession::servedByCache(const SearchIntent& intent) const {
    return m_state.raw
        && m_state.raw->term == intent.primaryTerm
        && m_state.raw->caseInsensitive == intent.caseInsensitive
        && m_state.raw->databases == intent.databases;
}

void SearchSession::startLookup(const SearchIntent& intent) {
    // Still set when a superseded lookup hands over to its replacement.
    const bool wasBusy = m_state.lookup.has_value();

    QString error;
    const std::optional<TaskHandle> handle = m_supervisor->startLookup(intent, &error);
    if (!handle) {
        qWarning().noquote() << "Could not start lookup:" << error;
        m_state.lookup.reset();
        m_state.lookupIntent.reset();
        if (wasBusy) {
            Q_EMIT lookupBusyChanged(false);
        }
        Q_EMIT failure(QStringLiteral("Search failed"), error);
        return;
    }

    m_state.lookup = handle;
    m_state.lookupIntent = intent;
    if (!wasBusy) {
        Q_EMIT lookupBusyChanged(true);
    }
}

void SearchSession::onLookupFinished(TaskHandle handle, const LookupResult& result) {
    if (!m_state.lookup || m_state.lookup->id != handle.id) {
        qDebug() << "Ignoring result of lookup" << handle.id;
        return;
    }

    if (m_state.pendingIntent) {
        // The finished lookup was superseded; its result (usually Canceled) is dropped.
        const SearchIntent next = std::move(*m_state.pendingIntent);
        m_state.pendingIntent.reset();
        startLookup(next);
        return;
    }

    const SearchIntent intent = *m_state.lookupIntent;
    m_state.lookup.reset();
    m_state.lookupIntent.reset();

    Q_EMIT lookupBusyChanged(false);

    switch (result.status) {
        case LookupStatus::Ok:
            m_state.raw = RawResultSet{intent.primaryTerm, intent.caseInsensitive, intent.databases, result.entries};
            recompute();
            return;

        case LookupStatus::Canceled:
            qDebug() << "Lookup" << handle.id << "was cancelled";
            return;

        case LookupStatus::ProcessNotFound:
        case LookupStatus::NonZeroExit:
        case LookupStatus::Timeout:
            break;
    }

    m_state.raw.reset();
    recompute();

    const QString title = result.status == LookupStatus::ProcessNotFound
        ? QStringLiteral("Execution Error")
        : QStringLiteral("Search failed");
    Q_EMIT failure(title, LookupInvoker::describeFailure(result));
}

void SearchSession::resetResults() {
    m_state.postFilterTokens.clear();
    m_state.pendingIntent.reset();
    if (m_state.lookup) {
        m_supervisor->cancel(*m_state.lookup);
    }
    m_state.raw.reset();
    recompute();
}

// ---- Local filtering ----

bool SearchSession::refineFilter(const QString& text, QString* errorOut) {
    const QString pattern = text.trimmed();

    if (m_state.refineRegex && !pattern.isEmpty()) {
        std::optional<QRegularExpression> re =
            FilterEngine::compileRefinePattern(pattern, m_state.caseInsensitive, errorOut);
        if (!re) {
            qDebug().noquote() << "Rejected refine pattern" << pattern;
            return false;
        }
        m_state.refinePattern = std::move(re);
    } else {
        m_state.refinePattern.reset();
    }

    m_state.refineText = text;
    recompute();
    return true;
}

bool SearchSession::setRefineRegex(const bool enabled, QString* errorOut) {
    const bool previous = m_state.refineRegex;
    m_state.refineRegex = enabled;

    if (!refineFilter(m_state.refineText, errorOut)) {
        m_state.refineRegex = previous;
        return false;
    }
    return true;
}

void SearchSession::setCategory(const CategoryId category) {
    if (category == m_state.category) {
        return;
    }

    m_state.category = category;
    Q_EMIT categoryChanged(category);
    recompute();
}

void SearchSession::setCaseOverride(const bool caseInsensitive) {
    setCaseOverride(caseInsensitive, m_state.queryText);
}

void SearchSession::setCaseOverride(const bool caseInsensitive, const QString& queryText) {
    m_casePolicy.setManualOverride(caseInsensitive);

    if (queryText.trimmed().isEmpty()) {
        // runLookup() would drop the override again for an empty query.
        m_state.queryText = queryText;
        updateCaseMode(caseInsensitive);
        return;
    }
    runLookup(queryText);
}

void SearchSession::clearCaseOverride() {
    m_casePolicy.clearManualOverride();
    runLookup(m_state.queryText);
}

void SearchSession::updateCaseMode(const bool caseInsensitive) {
    if (caseInsensitive == m_state.caseInsensitive) {
        return;
    }

    m_state.caseInsensitive = caseInsensitive;

    // A pattern that compiled before compiles again with other options.
    if (m_state.refinePattern) {
        m_state.refinePattern = FilterEngine::compileRefinePattern(m_state.refineText.trimmed(), caseInsensitive);
    }

    Q_EMIT caseModeChanged(caseInsensitive);
}

void SearchSession::setSort(const std::optional<SortColumn> column, const Qt::SortOrder order) {
    m_state.sortColumn = column;
    m_state.sortOrder = order;
    recompute();
}

void SearchSession::recompute() {
    clearSelection();

    if (!m_state.raw) {
        m_state.visible.clear();
        Q_EMIT viewChanged();
        return;
    }

    QStringList tokens = m_state.postFilterTokens;
    if (!m_state.refineRegex) {
        static const QRegularExpression ws(QStringLiteral("\\s+"));
        tokens += m_state.refineText.split(ws, Qt::SkipEmptyParts);
    }

    const QRegularExpression* refine = m_state.refinePattern ? &*m_state.refinePattern : nullptr;

    m_state.visible = FilterEngine::filter(m_state.raw->entries,
                                           Categories::matcherFor(m_state.category),
                                           tokens,
                                           m_state.caseInsensitive,
                                           refine);

    if (m_state.sortColumn) {
        SortEngine::sortEntries(m_state.visible, *m_state.sortColumn, m_state.sortOrder);
    }

    Q_EMIT viewChanged();
}

bool SearchSession::showsPlaceholder() const {
    return m_state.raw.has_value() && m_state.visible.isEmpty();
}

// ---- Selection ----

const Entry* SearchSession::entryAt(const int row) const {
    if (row < 0 || row >= m_state.visible.size()) {
        return nullptr;
    }
    const Entry& entry = m_state.visible.at(row);
    return entry.isPlaceholder() ? nullptr : &entry;
}

void SearchSession::clearSelection() {
    if (!m_state.selected) {
        return;
    }
    m_state.selected.reset();
    Q_EMIT metadataChanged(QString());
}

void SearchSession::selectEntry(const int row) {
    const Entry* entry = entryAt(row);
    if (!entry) {
        clearSelection();
        return;
    }

    if (m_state.selected && m_state.selected->path == entry->path) {
        return;
    }

    m_state.selected = *entry;
    Q_EMIT metadataChanged(QStringLiteral("%1  |  Loading...").arg(entry->name));
    m_metadata->request(entry->path);
}

void SearchSession::onMetadataReady(const QString& subjectKey, const EntryMetadata& metadata) {
    if (!m_state.selected || m_state.selected->path != subjectKey) {
        qDebug().noquote() << "Dropping stale metadata for" << subjectKey;
        return;
    }

    Q_EMIT metadataChanged(GuiUtils::formatMetadataStatus(*m_state.selected, metadata));
}

// ---- Rebuild ----

bool SearchSession::startRebuild(const RebuildOptions& options, QString* errorOut) {
    const RebuildPlan plan = RebuildInvoker::buildPlan(m_settings, options);

    const std::optional<TaskHandle> handle = m_supervisor->startRebuild(plan, errorOut);
    if (!handle) {
        return false;
    }

    m_state.rebuild = handle;
    Q_EMIT rebuildBusyChanged(true);
    return true;
}

void SearchSession::onRebuildStepStarted(TaskHandle handle, int stepIndex, const QString& label) {
    if (!m_state.rebuild || m_state.rebuild->id != handle.id) {
        return;
    }
    Q_UNUSED(stepIndex);
    Q_EMIT rebuildProgress(QStringLiteral("%1 update started.").arg(label));
}

void SearchSession::onRebuildFinished(TaskHandle handle, const RebuildStepResult& lastResult) {
    if (!m_state.rebuild || m_state.rebuild->id != handle.id) {
        return;
    }

    m_state.rebuild.reset();
    Q_EMIT rebuildBusyChanged(false);

    switch (lastResult.status) {
        case RebuildStatus::Ok:
            Q_EMIT rebuildSucceeded(QStringLiteral("The database update completed successfully."));
            return;
        case RebuildStatus::Canceled:
            Q_EMIT rebuildProgress(QStringLiteral("Database update cancelled."));
            return;
        case RebuildStatus::ProcessNotFound:
            Q_EMIT failure(QStringLiteral("Execution Error"), RebuildInvoker::describeFailure(lastResult));
            return;
        case RebuildStatus::NonZeroExit:
            Q_EMIT failure(QStringLiteral("Update Error"), RebuildInvoker::describeFailure(lastResult));
            return;
    }
}

bool SearchSession::cancelActive() {
    if (m_state.rebuild) {
        return m_supervisor->cancel(*m_state.rebuild);
    }
    if (m_state.lookup) {
        m_state.pendingIntent.reset();
        return m_supervisor->cancel(*m_state.lookup);
    }
    return false;
}

// ---- Commands ----

bool SearchSession::dispatch(const SessionCommand command, const int row, QString* errorOut) {
    switch (command) {
        case SessionCommand::StartRebuild: {
            RebuildOptions options;
            options.excludePaths = m_settings.excludePaths;
            options.includeMedia = m_settings.includeMedia;
            return startRebuild(options, errorOut);
        }
        case SessionCommand::CancelActive:
            if (!cancelActive()) {
                if (errorOut) *errorOut = QStringLiteral("Nothing is running.");
                return false;
            }
            return true;
        default:
            break;
    }

    const Entry* entry = entryAt(row);
    if (!entry) {
        if (errorOut) *errorOut = QStringLiteral("Please select a valid result row.");
        return false;
    }

    switch (command) {
        case SessionCommand::OpenEntry:
            Q_EMIT launchRequested(LaunchKind::OpenUrl, entry->path);
            break;
        case SessionCommand::OpenContainingFolder:
            Q_EMIT launchRequested(LaunchKind::OpenUrl, entry->parentPath);
            break;
        case SessionCommand::CopyName:
            Q_EMIT launchRequested(LaunchKind::CopyText, entry->name);
            break;
        case SessionCommand::CopyPath:
            Q_EMIT launchRequested(LaunchKind::CopyText, entry->path);
            break;
        case SessionCommand::OpenTerminal:
            Q_EMIT launchRequested(LaunchKind::OpenTerminal, entry->isDirectory ? entry->path : entry->parentPath);
            break;
        case SessionCommand::StartRebuild:
        case SessionCommand::CancelActive:
            break;
    }
    return true;
}

bool SearchSession::activate(const int row, const int column, QString* errorOut) {
    const SessionCommand command = SortEngine::columnFromIndex(column) == SortColumn::Path
                                       ? SessionCommand::OpenContainingFolder
                                       : SessionCommand::OpenEntry;
    return dispatch(command, row, errorOut);
}
