// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_SEARCHSESSION_H
#define KOLOCATE_SEARCHSESSION_H

#include <QObject>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include "Categories.h"
#include "Entry.h"
#include "FilterEngine.h"
#include "LookupInvoker.h"
#include "MetadataFetcher.h"
#include "RebuildInvoker.h"
#include "Settings.h"
#include "SortEngine.h"
#include "TaskSupervisor.h"

/**
 * @brief Output of the last successful lookup, together with the inputs that produced it.
 *
 * A later query with the same term, case mode and databases is served from here.
 */
struct RawResultSet {
    QString term;
    bool caseInsensitive = true;
    QStringList databases;
    QVector<Entry> entries;
};

/**
 * @brief Everything the user is currently looking at. Lives on the GUI thread only.
 */
struct SessionState {
    QString queryText;
    QStringList postFilterTokens;
    CategoryId category = CategoryId::AllCategories;
    bool caseInsensitive = true;

    // Refine box
    QString refineText;
    bool refineRegex = false;
    std::optional<QRegularExpression> refinePattern; // set only in regex mode

    std::optional<RawResultSet> raw;
    QVector<Entry> visible; // filtered and sorted

    std::optional<SortColumn> sortColumn; // std::nullopt = lookup order
    Qt::SortOrder sortOrder = Qt::AscendingOrder;

    std::optional<Entry> selected; // its path is the subject key of metadata requests

    std::optional<TaskHandle> lookup;
    std::optional<SearchIntent> lookupIntent; // inputs of the running lookup
    std::optional<TaskHandle> rebuild;

    // Set while an outdated lookup is being cancelled; started once the slot is free.
    std::optional<SearchIntent> pendingIntent;
};

enum class SessionCommand : quint8 {
    OpenEntry,
    OpenContainingFolder,
    CopyName,
    CopyPath,
    OpenTerminal,
    StartRebuild,
    CancelActive,
};

// What the front-end must do for a selection command.
enum class LaunchKind : quint8 {
    OpenUrl,
    OpenTerminal,
    CopyText,
};

/**
 * @brief The controller between the widgets and the query pipeline.
 *
 * Owns SessionState and the background machinery (TaskSupervisor, MetadataFetcher).
 * Front-ends forward user intents here and render what is published through the signals;
 * they never touch the result set themselves.
 */
class SearchSession final : public QObject {
    Q_OBJECT

public:
    explicit SearchSession(Settings settings, QObject* parent = nullptr);
    ~SearchSession() override;

    /**
     * Parses the query and runs a lookup if its primary term, case mode or databases differ
     * from the cached result set; otherwise only re-filters the cache. An empty query resets
     * the view. A lookup that is still running is cancelled and replaced.
     */
    void runLookup(const QString& text);

    /**
     * Applies the refine box text. Synchronous. In regex mode an invalid pattern returns
     * false with the compile error in errorOut, and the view is left unchanged.
     */
    bool refineFilter(const QString& text, QString* errorOut = nullptr);
    bool setRefineRegex(bool enabled, QString* errorOut = nullptr);

    void setCategory(CategoryId category);

    void setCaseOverride(bool caseInsensitive);

    /**
     * Sets the manual case mode and re-runs queryText under it. Used when the query line
     * holds text that has not reached runLookup() yet (a pending debounce).
     */
    void setCaseOverride(bool caseInsensitive, const QString& queryText);
    void clearCaseOverride();

    void setSort(std::optional<SortColumn> column, Qt::SortOrder order);

    /**
     * Row index into visibleEntries(); -1 (or the placeholder row) clears the selection.
     */
    void selectEntry(int row);

    bool startRebuild(const RebuildOptions& options, QString* errorOut = nullptr);

    /**
     * Cancels the running rebuild if there is one, otherwise the running lookup.
     */
    bool cancelActive();

    /**
     * Runs a command against the given row. Selection commands refuse the placeholder row
     * and rows out of range.
     */
    bool dispatch(SessionCommand command, int row, QString* errorOut = nullptr);

    /**
     * Activation (double click) of a cell: the path column opens the containing folder,
     * any other column opens the entry itself.
     */
    bool activate(int row, int column, QString* errorOut = nullptr);

    [[nodiscard]] const SessionState& state() const { return m_state; }
    [[nodiscard]] const QVector<Entry>& visibleEntries() const { return m_state.visible; }

    /**
     * True when a lookup completed but nothing survived the filters.
     */
    [[nodiscard]] bool showsPlaceholder() const;

    [[nodiscard]] bool caseInsensitive() const { return m_state.caseInsensitive; }
    [[nodiscard]] bool isLookupActive() const { return m_state.lookup.has_value(); }
    [[nodiscard]] bool isRebuildActive() const { return m_state.rebuild.has_value(); }

    [[nodiscard]] const Settings& settings() const { return m_settings; }
    void setSettings(const Settings& settings);

    // Exposed for tests and front-ends that want task level detail.
    [[nodiscard]] TaskSupervisor* supervisor() const { return m_supervisor; }

public slots:
    void onMetadataReady(const QString& subjectKey, const EntryMetadata& metadata);

signals:
    void viewChanged();
    void categoryChanged(CategoryId category);
    void caseModeChanged(bool caseInsensitive);
    void lookupBusyChanged(bool busy);

    void metadataChanged(const QString& statusText);

    void launchRequested(LaunchKind kind, const QString& target);

    void rebuildBusyChanged(bool busy);
    void rebuildProgress(const QString& message);
    void rebuildSucceeded(const QString& message);

    void failure(const QString& title, const QString& message);

private slots:
    void onLookupFinished(TaskHandle handle, const LookupResult& result);
    void onRebuildStepStarted(TaskHandle handle, int stepIndex, const QString& label);
    void onRebuildFinished(TaskHandle handle, const RebuildStepResult& lastResult);

private:
    [[nodiscard]] SearchIntent makeIntent(const QStringList& tokens) const;
    [[nodiscard]] bool servedByCache(const SearchIntent& intent) const;

    void startLookup(const SearchIntent& intent);
    void resetResults();
    void recompute();
    void clearSelection();
    void updateCaseMode(bool caseInsensitive);

    [[nodiscard]] const Entry* entryAt(int row) const;

    Settings m_settings;
    SessionState m_state;
    CasePolicy m_casePolicy;

    TaskSupervisor* m_supervisor = nullptr;
    MetadataFetcher* m_metadata = nullptr;
};

Q_DECLARE_METATYPE(LaunchKind)

#endif //KOLOCATE_SEARCHSESSION_H
