// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QStatusBar>
#include <QMessageBox>
#include <QContextMenuEvent>
#include <QCloseEvent>
#include <QResizeEvent>
#include <QMenu>
#include <QClipboard>
#include <QShortcut>
#include <QGuiApplication>
#include <QMimeDatabase>
#include <QMimeType>
#include <QStyledItemDelegate>
#include <QEvent>
#include <QPainter>
#include <QSignalBlocker>
#include <QUrl>
#include <KFileItemActions>
#include <KFileItemListProperties>
#include <KFileItem>
#include <KIO/ApplicationLauncherJob>
#include <KIO/JobUiDelegateFactory>
#include <KTerminalLauncherJob>
#include <KService>
#include <KApplicationTrader>
#include <KAboutData>
#include <KAboutApplicationDialog>
#include "GuiUtils.h"
#include "MainWindow.h"
#include "ProcessRunner.h"
#include "ResultsModel.h"
#include "SettingsDialog.h"

namespace {
    class HoverRowDelegate final : public QStyledItemDelegate {
    public:
        explicit HoverRowDelegate(const MainWindow* owner)
            : QStyledItemDelegate(const_cast<MainWindow*>(owner)), m_owner(owner) {}

        void paint(QPainter* painter, const QStyleOptionViewItem& option,
                   const QModelIndex& index) const override
        {
            QStyleOptionViewItem opt(option);
            initStyleOption(&opt, index);

            const bool isHoveredRow = (m_owner && index.row() == m_owner->hoveredRow());
            const bool isSelected = (opt.state & QStyle::State_Selected);

            if (isHoveredRow && !isSelected) {
                // alternatingRowColors: prevent "alternate row" painting from overriding our hover
                opt.features &= ~QStyleOptionViewItem::Alternate;

                QColor hover = opt.palette.color(QPalette::Highlight);
                hover.setAlpha(40);
                painter->fillRect(opt.rect, hover);

                opt.backgroundBrush = Qt::NoBrush;
            }

            QStyledItemDelegate::paint(painter, opt, index);
        }

    private:
        const MainWindow* m_owner = nullptr;
    };
}

MainWindow::MainWindow(QWidget *parent) : QMainWindow(parent) {
    m_session = new SearchSession(Settings::load(), this);

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);

    // --- Category + Search Row ---
    auto* topRow = new QHBoxLayout();
    layout->addLayout(topRow);

    m_categoryCombo = new QComboBox(centralWidget);
    for (const CategoryId id : kAllCategoryIds) {
        m_categoryCombo->addItem(Categories::displayName(id), static_cast<int>(id));
    }
    m_categoryCombo->setCurrentIndex(static_cast<int>(m_session->state().category));
    m_categoryCombo->setToolTip(QStringLiteral("Show only results of this kind (or type ::doc, ::img, ... in the search)"));
    topRow->addWidget(m_categoryCombo);

    searchLine = new QLineEdit(centralWidget);
    searchLine->setPlaceholderText("Search files...");
    searchLine->setClearButtonEnabled(true);

    // Add magnifying glass icon to the search bar
    searchLine->addAction(QIcon::fromTheme("edit-find"), QLineEdit::LeadingPosition);
    topRow->addWidget(searchLine, 1);

    m_caseCheck = new QCheckBox(QStringLiteral("Case insensitive"), centralWidget);
    m_caseCheck->setChecked(m_session->caseInsensitive());
    m_caseCheck->setToolTip(QStringLiteral("Chosen automatically from the query unless set here"));
    topRow->addWidget(m_caseCheck);
    // --- End Category + Search Row ---

    // --- Refine Row ---
    auto* refineRow = new QHBoxLayout();
    layout->addLayout(refineRow);

    m_refineLine = new QLineEdit(centralWidget);
    m_refineLine->setPlaceholderText("Filter results...");
    m_refineLine->setClearButtonEnabled(true);
    m_refineLine->addAction(QIcon::fromTheme("view-filter"), QLineEdit::LeadingPosition);
    refineRow->addWidget(m_refineLine, 1);

    m_regexCheck = new QCheckBox(QStringLiteral("Regex"), centralWidget);
    m_regexCheck->setChecked(m_session->state().refineRegex);
    refineRow->addWidget(m_regexCheck);
    // --- End Refine Row ---

    // --- Burger Menu Setup ---
    auto *menu = new QMenu(this);

    auto* settingsAct = new QAction(QIcon::fromTheme("settings-configure"), "Settings", this);
    connect(settingsAct, &QAction::triggered, this, &MainWindow::openSettings);
    menu->addAction(settingsAct);

    menu->addSeparator();

    m_updateDbAction = new QAction(QIcon::fromTheme("view-refresh"), "Update Database", this);
    m_updateDbAction->setShortcut(QKeySequence::Refresh);
    connect(m_updateDbAction, &QAction::triggered, this, &MainWindow::updateDatabase);
    menu->addAction(m_updateDbAction);
    addAction(m_updateDbAction); // Register with window for shortcuts

    menu->addSeparator();

    auto *aboutAct = new QAction(QIcon::fromTheme("kolocate"), "About Kolocate", this);
    connect(aboutAct, &QAction::triggered, this, &MainWindow::showAbout);
    menu->addAction(aboutAct);

    auto *quitAct = new QAction(QIcon::fromTheme("application-exit"), "Quit", this);
    quitAct->setShortcut(QKeySequence::Quit);
    connect(quitAct, &QAction::triggered, this, &QWidget::close);
    menu->addAction(quitAct);
    addAction(quitAct);

    // Add the menu to a button inside the search line
    auto *menuAction = searchLine->addAction(QIcon::fromTheme("application-menu"), QLineEdit::TrailingPosition);
    connect(menuAction, &QAction::triggered, [menu]() {
        menu->exec(QCursor::pos());
    });
    // ---------------------

    tableView = new QTableView(centralWidget);
    model = new ResultsModel(m_session, this);
    tableView->setModel(model);

    // Enable Sorting. The persisted sort is applied by the session; only the indicator is set here.
    tableView->setSortingEnabled(false);
    tableView->horizontalHeader()->setSortIndicatorShown(true);
    if (const auto column = m_session->state().sortColumn) {
        tableView->horizontalHeader()->setSortIndicator(static_cast<int>(*column), m_session->state().sortOrder);
    } else {
        tableView->horizontalHeader()->setSortIndicator(-1, Qt::AscendingOrder);
    }
    tableView->setSortingEnabled(true);

    // Table Styling
    tableView->setAlternatingRowColors(true);
    tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    tableView->verticalHeader()->setVisible(false);
    tableView->setWordWrap(false);

    // Full-row hover
    tableView->setItemDelegate(new HoverRowDelegate(this));
    tableView->setMouseTracking(true);
    tableView->viewport()->setMouseTracking(true);
    connect(tableView, &QAbstractItemView::entered, this, &MainWindow::onTableHovered);
    connect(tableView, &QAbstractItemView::viewportEntered, this, &MainWindow::onTableViewportHovered);
    tableView->viewport()->installEventFilter(this);

    // --- Drag and Drop Configuration ---
    tableView->setDragEnabled(true);
    tableView->setDragDropMode(QAbstractItemView::DragOnly);
    tableView->setDefaultDropAction(Qt::CopyAction);
    // ---------------------

    tableView->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    tableView->horizontalHeader()->setStretchLastSection(true);
    tableView->setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);

    layout->addWidget(tableView);

    auto* infoLabel = new QLabel(
        QStringLiteral("Double click to open. Search automatically combines system and media databases if both exist."),
        centralWidget);
    infoLabel->setEnabled(false);
    layout->addWidget(infoLabel);

    // --- Status Bar ---
    m_busyLabel = new QLabel(this);
    m_busyLabel->setVisible(false);
    statusBar()->addPermanentWidget(m_busyLabel);

    m_stopButton = new QToolButton(this);
    m_stopButton->setIcon(QIcon::fromTheme("process-stop"));
    m_stopButton->setToolTip(QStringLiteral("Stop"));
    m_stopButton->setAutoRaise(true);
    m_stopButton->setVisible(false);
    connect(m_stopButton, &QToolButton::clicked, this, [this]() { runCommand(SessionCommand::CancelActive); });
    statusBar()->addPermanentWidget(m_stopButton);

    m_countLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_countLabel);
    // ---------------------

    setCentralWidget(centralWidget);
    resize(1000, 650);

    // --- Session wiring ---
    m_searchDebounceTimer = new QTimer(this);
    m_searchDebounceTimer->setSingleShot(true);
    m_searchDebounceTimer->setInterval(250);
    connect(m_searchDebounceTimer, &QTimer::timeout, this, [this]() {
        m_session->runLookup(searchLine->text());
    });

    connect(searchLine, &QLineEdit::textChanged, this, [this](const QString& text) {
        if (text.trimmed().isEmpty()) {
            // Clearing is immediate; there is no process to spare.
            m_searchDebounceTimer->stop();
            m_session->runLookup(text);
            return;
        }
        m_searchDebounceTimer->start();
    });

    connect(m_categoryCombo, &QComboBox::currentIndexChanged, this, [this](int idx) {
        m_session->setCategory(static_cast<CategoryId>(m_categoryCombo->itemData(idx).toInt()));
    });
    connect(m_session, &SearchSession::categoryChanged, this, [this](CategoryId category) {
        const QSignalBlocker blocker(m_categoryCombo);
        m_categoryCombo->setCurrentIndex(m_categoryCombo->findData(static_cast<int>(category)));
    });

    connect(m_caseCheck, &QCheckBox::clicked, this, [this](bool checked) {
        // A pending debounce means the line holds text the session has not seen yet.
        m_searchDebounceTimer->stop();
        m_session->setCaseOverride(checked, searchLine->text());
    });
    connect(m_session, &SearchSession::caseModeChanged, this, [this](bool caseInsensitive) {
        const QSignalBlocker blocker(m_caseCheck);
        m_caseCheck->setChecked(caseInsensitive);
    });

    connect(m_refineLine, &QLineEdit::textChanged, this, &MainWindow::onRefineEdited);
    connect(m_regexCheck, &QCheckBox::toggled, this, &MainWindow::onRegexToggled);

    connect(m_session, &SearchSession::viewChanged, this, &MainWindow::onViewChanged);
    connect(m_session, &SearchSession::launchRequested, this, &MainWindow::onLaunchRequested);
    connect(m_session, &SearchSession::failure, this, &MainWindow::onFailure);

    connect(m_session, &SearchSession::metadataChanged, this, [this](const QString& text) {
        m_statusBaseline = text;
        statusBar()->showMessage(text, 0);
    });

    connect(m_session, &SearchSession::lookupBusyChanged, this, &MainWindow::updateBusyIndicator);
    connect(m_session, &SearchSession::lookupBusyChanged, this, [this](bool busy) {
        if (!busy) applyResponsiveColumnSizing();
    });
    connect(m_session, &SearchSession::rebuildBusyChanged, this, &MainWindow::updateBusyIndicator);
    connect(m_session, &SearchSession::rebuildProgress, this, [this](const QString& message) {
        showTransientStatus(message, 5000);
    });
    connect(m_session, &SearchSession::rebuildSucceeded, this, [this](const QString& message) {
        QMessageBox::information(this, QStringLiteral("Update Complete"), message);
    });

    connect(tableView->selectionModel(), &QItemSelectionModel::currentRowChanged, this,
            [this](const QModelIndex& current) {
                m_session->selectEntry(current.isValid() ? current.row() : -1);
                updateActionStates();
            });
    // ---------------------

    // --- Keyboard Navigation (Search Bar focus logic) ---
    auto *downToTable = new QShortcut(QKeySequence(Qt::Key_Down), searchLine);
    auto *upToTable = new QShortcut(QKeySequence(Qt::Key_Up), searchLine);
    downToTable->setContext(Qt::WidgetShortcut);
    upToTable->setContext(Qt::WidgetShortcut);

    auto focusTable = [this]() {
        tableView->setFocus();
        if (tableView->currentIndex().row() < 0 && model->rowCount() > 0) {
            tableView->setCurrentIndex(model->index(0, 0));
        }
    };
    connect(downToTable, &QShortcut::activated, focusTable);
    connect(upToTable, &QShortcut::activated, focusTable);

    // Escape key in search line clears the search
    auto *clearSearch = new QShortcut(QKeySequence(Qt::Key_Escape), searchLine);
    clearSearch->setContext(Qt::WidgetShortcut);
    connect(clearSearch, &QShortcut::activated, searchLine, &QLineEdit::clear);
    // ---------------------

    // --- Global Window Actions (Shortcuts + Menu items) ---
    // Ctrl+L and Alt+D: Focus Search
    auto *focusSearchAct = new QAction(this);
    focusSearchAct->setShortcuts({QKeySequence(Qt::CTRL | Qt::Key_L), QKeySequence(Qt::ALT | Qt::Key_D)});
    connect(focusSearchAct, &QAction::triggered, searchLine, [this]() {
        searchLine->setFocus();
        searchLine->selectAll();
    });
    addAction(focusSearchAct);

    // Enter: Open
    auto *openAct = new QAction(QIcon::fromTheme("system-run"), "Open", this);
    openAct->setShortcut(QKeySequence(Qt::Key_Return));
    openAct->setObjectName("openAction");
    connect(openAct, &QAction::triggered, this, [this]() { runCommand(SessionCommand::OpenEntry); });
    addAction(openAct);

    // Ctrl+Enter: Open File Location
    auto *openLocAct = new QAction(QIcon::fromTheme("folder-open"), "Open File Location", this);
    openLocAct->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Return));
    openLocAct->setObjectName("openLocationAction");
    connect(openLocAct, &QAction::triggered, this, [this]() { runCommand(SessionCommand::OpenContainingFolder); });
    addAction(openLocAct);

    // Ctrl+Shift+C: Copy File Name
    auto *copyNameAct = new QAction(QIcon::fromTheme("edit-copy"), "Copy File Name", this);
    copyNameAct->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_C));
    copyNameAct->setObjectName("copyFileNameAction");
    connect(copyNameAct, &QAction::triggered, this, [this]() { runCommand(SessionCommand::CopyName); });
    addAction(copyNameAct);

    // Ctrl+Alt+C: Copy Full Path
    auto *copyPathAct = new QAction(QIcon::fromTheme("edit-copy-path"), "Copy Full Path", this);
    copyPathAct->setShortcut(QKeySequence(Qt::CTRL | Qt::ALT | Qt::Key_C));
    copyPathAct->setObjectName("copyPathAction");
    connect(copyPathAct, &QAction::triggered, this, [this]() { runCommand(SessionCommand::CopyPath); });
    addAction(copyPathAct);

    // Alt+Shift+F4: Open Terminal
    auto *terminalAct = new QAction(QIcon::fromTheme("utilities-terminal"), "Open Terminal Here", this);
    terminalAct->setShortcut(QKeySequence(Qt::ALT | Qt::SHIFT | Qt::Key_F4));
    terminalAct->setObjectName("openTerminalAction");
    connect(terminalAct, &QAction::triggered, this, [this]() { runCommand(SessionCommand::OpenTerminal); });
    addAction(terminalAct);
    // ---------------------

    // Handle double-click on item in table view to open file
    connect(tableView, &QTableView::doubleClicked, this, [this](const QModelIndex& index) {
        if (!index.isValid()) return;
        tableView->setCurrentIndex(index);

        QString err;
        if (!m_session->activate(index.row(), index.column(), &err)) {
            QMessageBox::information(this, QStringLiteral("Info"), err);
        }
    });

    updateActionStates();
    updateBusyIndicator();
}

int MainWindow::currentRow() const {
    const QModelIndex idx = tableView->currentIndex();
    if (!idx.isValid() || m_session->showsPlaceholder()) {
        return -1;
    }
    return idx.row();
}

void MainWindow::updateActionStates() {
    const bool hasEntry = currentRow() >= 0;

    for (const char* name : {"openAction", "openLocationAction", "copyFileNameAction", "copyPathAction", "openTerminalAction"}) {
        if (QAction* act = findChild<QAction*>(name)) {
            act->setEnabled(hasEntry);
        }
    }
}

void MainWindow::updateBusyIndicator() {
    const bool rebuilding = m_session->isRebuildActive();
    const bool searching = m_session->isLookupActive();

    if (rebuilding) {
        m_busyLabel->setText(QStringLiteral("Updating database..."));
    } else if (searching) {
        m_busyLabel->setText(QStringLiteral("Searching..."));
    }

    m_busyLabel->setVisible(rebuilding || searching);
    m_stopButton->setVisible(rebuilding || searching);
    m_updateDbAction->setEnabled(!rebuilding);
}

void MainWindow::applyResponsiveColumnSizing() {
    const std::optional<int> width = GuiUtils::responsiveNameColumnWidth(tableView->viewport()->width());
    if (width) {
        tableView->horizontalHeader()->resizeSection(0, *width);
    }
}

void MainWindow::onViewChanged() {
    if (m_session->state().raw) {
        m_countLabel->setText(QString("%L1 objects found").arg(m_session->visibleEntries().size()));
    } else {
        m_countLabel->clear();
    }
    updateActionStates();
}

void MainWindow::onTableHovered(const QModelIndex& index) {
    const int newRow = index.isValid() ? index.row() : -1;
    if (newRow == m_hoveredRow) {
        return;
    }

    m_hoveredRow = newRow;
    tableView->viewport()->update();
}

void MainWindow::onTableViewportHovered() {
    if (m_hoveredRow != -1) {
        m_hoveredRow = -1;
        tableView->viewport()->update();
    }
}

bool MainWindow::eventFilter(QObject* watched, QEvent* event) {
    if (watched == tableView->viewport()) {
        if (event->type() == QEvent::Leave) {
            if (m_hoveredRow != -1) {
                m_hoveredRow = -1;
                tableView->viewport()->update();
            }
        }
    }

    return QMainWindow::eventFilter(watched, event);
}

void MainWindow::onRefineEdited() {
    QString err;
    if (!m_session->refineFilter(m_refineLine->text(), &err)) {
        // Keep showing the previous view while the pattern is incomplete.
        m_refineLine->setToolTip(err);
        m_refineLine->setStyleSheet(QStringLiteral("color: palette(link-visited);"));
        return;
    }
    m_refineLine->setToolTip(QString());
    m_refineLine->setStyleSheet(QString());
}

void MainWindow::onRegexToggled(bool enabled) {
    QString err;
    if (!m_session->setRefineRegex(enabled, &err)) {
        QMessageBox::warning(this, QStringLiteral("Error"),
                             QStringLiteral("Filter contains an invalid regex pattern.\n\n%1").arg(err));
        const QSignalBlocker blocker(m_regexCheck);
        m_regexCheck->setChecked(!enabled);
        return;
    }
    m_refineLine->setToolTip(QString());
    m_refineLine->setStyleSheet(QString());
}

void MainWindow::runCommand(SessionCommand command) {
    QString err;
    if (!m_session->dispatch(command, currentRow(), &err)) {
        if (command == SessionCommand::CancelActive) {
            return; // nothing was running; the button is about to disappear anyway
        }
        QMessageBox::information(this, QStringLiteral("Info"), err);
    }
}

void MainWindow::onLaunchRequested(LaunchKind kind, const QString& target) {
    switch (kind) {
        case LaunchKind::CopyText:
            QGuiApplication::clipboard()->setText(target);
            showTransientStatus(QStringLiteral("Copied to clipboard."), 2000);
            return;

        case LaunchKind::OpenTerminal: {
            // KTerminalLauncherJob automatically finds the preferred terminal
            // and handles the command-line arguments to set the working directory.
            auto *job = new KTerminalLauncherJob(QString()); // Empty string means "default terminal"
            job->setWorkingDirectory(target);
            job->setAutoDelete(true);

            // Provide a UI delegate for error reporting (e.g., if no terminal is found)
            job->setUiDelegate(KIO::createDefaultJobUiDelegate(KJobUiDelegate::AutoHandlingEnabled, this));
            job->start();
            return;
        }

        case LaunchKind::OpenUrl: {
            const QUrl url = QUrl::fromLocalFile(target);

            // Launch with the preferred service for the MIME type (folders open in the file manager)
            QMimeDatabase mimeDb;
            const QString mimeType = mimeDb.mimeTypeForUrl(url).name();
            KService::Ptr service = KApplicationTrader::preferredService(mimeType);

            auto *job = service ? new KIO::ApplicationLauncherJob(service)
                                : new KIO::ApplicationLauncherJob();

            job->setUrls({url});
            job->setAutoDelete(true);
            job->setUiDelegate(KIO::createDefaultJobUiDelegate(KJobUiDelegate::AutoHandlingEnabled, this));
            job->start();
            return;
        }
    }
}

void MainWindow::onFailure(const QString& title, const QString& message) {
    QMessageBox::critical(this, title, message);
}

void MainWindow::updateDatabase() {
    const Settings& settings = m_session->settings();

    RebuildOptions options;
    options.excludePaths = settings.excludePaths;
    options.includeMedia = settings.includeMedia;

    const RebuildPlan plan = RebuildInvoker::buildPlan(settings, options);

    QStringList commands;
    for (const RebuildStep& step : plan.steps) {
        commands << ProcessRunner::describeCommand(step.program, step.arguments);
    }

    const auto answer = QMessageBox::question(
        this,
        QStringLiteral("Update Database"),
        QStringLiteral("The following commands will be run with administrator privileges:\n\n%1\n\n"
                       "This can take a while. Continue?").arg(commands.join('\n')));
    if (answer != QMessageBox::Yes) {
        return;
    }

    QString err;
    if (!m_session->startRebuild(options, &err)) {
        QMessageBox::warning(this, QStringLiteral("Update Database"), err);
    }
}

void MainWindow::openSettings() {
    SettingsDialog dlg(m_session->settings(), this);
    if (dlg.exec() != QDialog::Accepted) {
        return;
    }

    Settings updated = dlg.settings();

    // Keep the current view preferences; the dialog only edits tools and paths.
    const SessionState& state = m_session->state();
    updated.sortColumn = state.sortColumn ? static_cast<int>(*state.sortColumn) : -1;
    updated.sortOrder = state.sortOrder;
    updated.category = state.category;
    updated.refineRegex = state.refineRegex;

    updated.save();
    m_session->setSettings(updated);
}

void MainWindow::showAbout() {
    auto *dialog = new KAboutApplicationDialog(KAboutData::applicationData(), this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    dialog->show();
}

void MainWindow::showTransientStatus(const QString& msg, int timeoutMs) {
    const quint64 token = ++m_statusMessageToken;
    statusBar()->showMessage(msg, timeoutMs);

    QTimer::singleShot(timeoutMs, this, [this, token]() {
        if (token != m_statusMessageToken) return; // newer message happened
        if (!m_statusBaseline.isEmpty()) {
            statusBar()->showMessage(m_statusBaseline, 0);
        } else {
            statusBar()->clearMessage();
        }
    });
}

void MainWindow::contextMenuEvent(QContextMenuEvent *event) {
    // Map the position correctly to the viewport
    // This ensures the row index is perfectly aligned with the mouse
    QPoint viewportPos = tableView->viewport()->mapFrom(this, event->pos());
    QModelIndex clickIndex = tableView->indexAt(viewportPos);

    // If user clicks empty space (or the placeholder row), don't show the file menu
    if (!clickIndex.isValid() || m_session->showsPlaceholder()) {
        return;
    }

    tableView->setCurrentIndex(clickIndex);

    const QVector<Entry>& entries = m_session->visibleEntries();
    if (clickIndex.row() >= entries.size()) {
        return;
    }
    const Entry& entry = entries.at(clickIndex.row());

    QMenu menu(this);
    KFileItemActions menuActions;

    // Explicitly create a KFileItem and determine MIME type
    // This is so the context menu will have the correct options
    KFileItem fileItem(QUrl::fromLocalFile(entry.path));
    fileItem.determineMimeType();
    menuActions.setItemListProperties(KFileItemListProperties(KFileItemList{fileItem}));
    menuActions.insertOpenWithActionsTo(nullptr, &menu, QStringList());

    menu.addAction(findChild<QAction*>("openAction"));
    menu.addAction(findChild<QAction*>("openLocationAction"));
    menu.addAction(findChild<QAction*>("openTerminalAction"));

    menu.addSeparator();
    menu.addAction(findChild<QAction*>("copyFileNameAction"));
    menu.addAction(findChild<QAction*>("copyPathAction"));

    menu.addSeparator();
    menuActions.addActionsTo(&menu);

    menu.exec(event->globalPos());
}

void MainWindow::resizeEvent(QResizeEvent* event) {
    QMainWindow::resizeEvent(event);
    applyResponsiveColumnSizing();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    Settings s = m_session->settings();

    const SessionState& state = m_session->state();
    s.sortColumn = state.sortColumn ? static_cast<int>(*state.sortColumn) : -1;
    s.sortOrder = state.sortOrder;
    s.category = state.category;
    s.refineRegex = state.refineRegex;
    s.save();

    // Running processes are stopped by the session when it is destroyed with the window.
    QMainWindow::closeEvent(event);
}
