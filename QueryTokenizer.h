// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_QUERYTOKENIZER_H
#define KOLOCATE_QUERYTOKENIZER_H

#include <QString>
#include <QStringList>
#include <optional>
#include "Categories.h"

struct TokenizedQuery {
    QStringList tokens;                 // quoted phrases first, then plain words
    std::optional<CategoryId> category; // from an inline "::name" shortcut
};

namespace QueryTokenizer {
    inline constexpr QLatin1String kShortcutPrefix("::");

    /**
     * Splits raw query text into search tokens.
     *
     * 1. The first "::name" token (bounded by whitespace or the string ends) whose name is
     *    a known category shortcut is removed and becomes the category. Unknown names are
     *    left in place and end up as ordinary words.
     * 2. Text inside double quotes becomes a single token, kept verbatim.
     * 3. Whatever is left is split on whitespace.
     *
     * Empty or whitespace-only input yields no tokens and no category.
     */
    [[nodiscard]] TokenizedQuery tokenize(const QString& raw);
}

#endif //KOLOCATE_QUERYTOKENIZER_H
