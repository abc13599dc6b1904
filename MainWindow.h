// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_MAINWINDOW_H
#define KOLOCATE_MAINWINDOW_H

#include <QMainWindow>
#include <QCheckBox>
#include <QComboBox>
#include <QLabel>
#include <QLineEdit>
#include <QTableView>
#include <QTimer>
#include <QToolButton>
#include "SearchSession.h"

class ResultsModel;

/**
 * @brief The main application window for searching and viewing files.
 *
 * Holds no search state of its own: user input is forwarded to the SearchSession and the
 * widgets render whatever the session publishes.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    /**
     * @brief Retrieves the index of the currently hovered row in the table view.
     *
     * @return The index of the hovered row, or -1 if no row is hovered.
     */
    int hoveredRow() const { return m_hoveredRow; }

protected:
    /**
     * @brief Handles right-click events to show the file context menu.
     */
    void contextMenuEvent(QContextMenuEvent *event) override;

    bool eventFilter(QObject* watched, QEvent* event) override;

    void closeEvent(QCloseEvent* event) override;

    /**
     * @brief Keeps the Name column at its share of the table width.
     */
    void resizeEvent(QResizeEvent* event) override;

private slots:
    /**
     * @brief Tracks which row is currently hovered so we can paint a full-row hover highlight.
     */
    void onTableHovered(const QModelIndex& index);

    /**
     * @brief Tracks when the empty area of the table is hovered (below the last item in the list)
     */
    void onTableViewportHovered();

    void onViewChanged();
    void onLaunchRequested(LaunchKind kind, const QString& target);
    void onFailure(const QString& title, const QString& message);
    void onRefineEdited();
    void onRegexToggled(bool enabled);

    void openSettings();

    /**
     * @brief Asks for confirmation, then rebuilds the system (and media) databases.
     */
    void updateDatabase();

    void showAbout();

    void runCommand(SessionCommand command);

private:
    [[nodiscard]] int currentRow() const;
    void updateActionStates();
    void updateBusyIndicator();
    void applyResponsiveColumnSizing();

    void showTransientStatus(const QString& msg, int timeoutMs);

    SearchSession* m_session = nullptr;

    QLineEdit *searchLine = nullptr;
    QComboBox* m_categoryCombo = nullptr;
    QCheckBox* m_caseCheck = nullptr;

    QLineEdit* m_refineLine = nullptr;
    QCheckBox* m_regexCheck = nullptr;

    QTableView *tableView = nullptr;
    ResultsModel *model = nullptr;

    QLabel* m_countLabel = nullptr;
    QLabel* m_busyLabel = nullptr;
    QToolButton* m_stopButton = nullptr;

    QAction* m_updateDbAction = nullptr;

    // Lookups spawn a process; wait for a pause in typing before starting one.
    QTimer* m_searchDebounceTimer = nullptr;

    int m_hoveredRow = -1;

    quint64 m_statusMessageToken = 0;
    QString m_statusBaseline; // metadata of the selected entry
};

#endif //KOLOCATE_MAINWINDOW_H
