// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_SORTENGINE_H
#define KOLOCATE_SORTENGINE_H

#include <QVector>
#include <Qt>
#include <optional>
#include "Entry.h"

enum class SortColumn : int {
    Name = 0,
    Path = 1,
};

namespace SortEngine {
    /**
     * @brief Sorts entries in place by the given column.
     *
     * Comparison is case-insensitive and the sort is stable in both directions, so rows
     * with equal keys keep their lookup order. Uses C++17 parallel algorithms (TBB).
     */
    void sortEntries(QVector<Entry>& entries, SortColumn column, Qt::SortOrder order);

    /**
     * Maps a view column index to a sortable column, if that column is sortable.
     */
    [[nodiscard]] std::optional<SortColumn> columnFromIndex(int column);
}

#endif //KOLOCATE_SORTENGINE_H
