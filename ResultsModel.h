// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_RESULTSMODEL_H
#define KOLOCATE_RESULTSMODEL_H

#include <QAbstractTableModel>

class SearchSession;

/**
 * @brief The ResultsModel class presents the visible entries of a SearchSession in a QTableView.
 *
 * Columns are Name and Path. When a lookup finished but nothing survived the filters, a
 * single "No results found" row is shown instead. Sorting is delegated to the session so
 * the sort order survives re-filtering.
 */
class ResultsModel final : public QAbstractTableModel {
    Q_OBJECT

public:
    explicit ResultsModel(SearchSession* session, QObject* parent = nullptr);

    /**
     * @brief Sorts through the session (parallel, case-insensitive).
     */
    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;

    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    /**
     * @brief Provides data for the view, including text display and file/folder icons.
     */
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;

    /**
     * @brief Enables dragging for real entries (not the placeholder row).
     */
    Qt::ItemFlags flags(const QModelIndex& index) const override;

    /**
     * @brief text/uri-list, the standard format for file transfers on Linux.
     */
    QStringList mimeTypes() const override;
    QMimeData* mimeData(const QModelIndexList& indexes) const override;

    static constexpr const char* kPlaceholderText = "No results found";

private slots:
    void onViewChanged();

private:
    SearchSession* m_session = nullptr;
};

#endif //KOLOCATE_RESULTSMODEL_H
