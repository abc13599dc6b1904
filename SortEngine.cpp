// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <execution>
#include <algorithm>
#include "SortEngine.h"

namespace SortEngine {

    void sortEntries(QVector<Entry>& entries, SortColumn column, Qt::SortOrder order) {
        if (entries.size() < 2) {
            return;
        }

        // Use parallel execution policy to leverage multiple CPU cores via TBB
        auto policy = std::execution::par;

        auto keyOf = [column](const Entry& e) -> const QString& {
            return column == SortColumn::Path ? e.parentPath : e.name;
        };

        if (order == Qt::AscendingOrder) {
            std::stable_sort(policy, entries.begin(), entries.end(), [&](const Entry& a, const Entry& b) {
                return QString::compare(keyOf(a), keyOf(b), Qt::CaseInsensitive) < 0;
            });
        } else {
            // For descending, we check if B < A.
            // Swapping the operands keeps strict weak ordering and stability.
            std::stable_sort(policy, entries.begin(), entries.end(), [&](const Entry& a, const Entry& b) {
                return QString::compare(keyOf(b), keyOf(a), Qt::CaseInsensitive) < 0;
            });
        }
    }

    std::optional<SortColumn> columnFromIndex(int column) {
        switch (column) {
            case 0: return SortColumn::Name;
            case 1: return SortColumn::Path;
            default: return std::nullopt;
        }
    }
}
