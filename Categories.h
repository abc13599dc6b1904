// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_CATEGORIES_H
#define KOLOCATE_CATEGORIES_H

#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QStringView>
#include <array>
#include <optional>

struct Entry;

enum class CategoryId : quint8 {
    AllCategories,
    Directories,
    Documents,
    Images,
    Videos,
    Audio,
    Apps,
    Code,
    Archives,
    GenericText,
};

inline constexpr std::array<CategoryId, 10> kAllCategoryIds = {
    CategoryId::AllCategories,
    CategoryId::Directories,
    CategoryId::Documents,
    CategoryId::Images,
    CategoryId::Videos,
    CategoryId::Audio,
    CategoryId::Apps,
    CategoryId::Code,
    CategoryId::Archives,
    CategoryId::GenericText,
};

/**
 * @brief Decides whether an entry belongs to a category.
 *
 * A matcher is one of three things: accept everything, accept directories only,
 * or accept paths ending in one of a fixed set of extensions (case-insensitive).
 */
class CategoryMatcher {
public:
    enum class Kind : quint8 { MatchAll, DirectoriesOnly, Extension };

    CategoryMatcher() = default;

    [[nodiscard]] static CategoryMatcher matchAll();
    [[nodiscard]] static CategoryMatcher directoriesOnly();
    [[nodiscard]] static CategoryMatcher extensions(const QString& pattern);

    [[nodiscard]] Kind kind() const { return m_kind; }
    [[nodiscard]] bool matchesEverything() const { return m_kind == Kind::MatchAll; }

    /**
     * @brief The regex source for extension matchers, empty for the other kinds.
     */
    [[nodiscard]] QString pattern() const { return m_regex.pattern(); }

    [[nodiscard]] bool matches(const Entry& entry) const;

private:
    Kind m_kind = Kind::MatchAll;
    QRegularExpression m_regex;
};

namespace Categories {
    /**
     * Lower-case extensions (without the dot) belonging to a category.
     * Empty for AllCategories and Directories.
     */
    [[nodiscard]] const QStringList& extensionsFor(CategoryId category);

    /**
     * Builds the regex source for a category. The result depends only on the id, so a
     * category chosen via a query shortcut and one chosen in the UI yield identical matchers.
     */
    [[nodiscard]] QString patternFor(CategoryId category);

    /**
     * Returns the shared, pre-compiled matcher for a category.
     */
    [[nodiscard]] const CategoryMatcher& matcherFor(CategoryId category);

    /**
     * Resolves a query shortcut identifier ("doc", "img", ...) case-insensitively.
     */
    [[nodiscard]] std::optional<CategoryId> fromShortcut(QStringView identifier);

    /**
     * Stable key for persisting a category (e.g. in QSettings).
     */
    [[nodiscard]] QString key(CategoryId category);
    [[nodiscard]] std::optional<CategoryId> fromKey(const QString& key);

    // Presentation only; never used as a lookup key.
    [[nodiscard]] QString displayName(CategoryId category);
}

#endif //KOLOCATE_CATEGORIES_H
