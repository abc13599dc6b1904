// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_FILTERENGINE_H
#define KOLOCATE_FILTERENGINE_H

#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include "Categories.h"
#include "Entry.h"

namespace FilterEngine {
    /**
     * Narrows a cached result set without touching the lookup tool.
     *
     * The category predicate runs first. An entry then survives only if every token is a
     * substring of its joined path (AND semantics), compared case-insensitively when
     * caseInsensitive is set. If refine is given, its regex must also match the path.
     *
     * With no tokens, no refine regex and a match-all category the input is returned as is,
     * which callers rely on to skip recomputation.
     *
     * Pure and synchronous; intended to be re-run on every keystroke.
     */
    [[nodiscard]] QVector<Entry> filter(const QVector<Entry>& raw,
                                        const CategoryMatcher& category,
                                        const QStringList& tokens,
                                        bool caseInsensitive,
                                        const QRegularExpression* refine = nullptr);

    /**
     * Compiles a user-supplied refine pattern. Returns std::nullopt and fills errorOut
     * (with the offset of the problem) when the pattern is invalid.
     */
    [[nodiscard]] std::optional<QRegularExpression> compileRefinePattern(const QString& pattern,
                                                                         bool caseInsensitive,
                                                                         QString* errorOut = nullptr);
}

/**
 * @brief Decides whether a query is matched case-insensitively.
 *
 * Automatic rule: any upper-case character in the query text means case-sensitive,
 * otherwise case-insensitive. A manual choice by the user overrides the rule until the
 * query text is cleared, after which the automatic rule applies again.
 */
class CasePolicy {
public:
    [[nodiscard]] static bool autoCaseInsensitive(const QString& queryText);

    void setManualOverride(bool caseInsensitive) { m_override = caseInsensitive; }
    void clearManualOverride() { m_override.reset(); }
    [[nodiscard]] std::optional<bool> manualOverride() const { return m_override; }

    /**
     * Must be called whenever the query text changes; an empty query drops the override.
     */
    void queryTextChanged(const QString& queryText);

    [[nodiscard]] bool caseInsensitiveFor(const QString& queryText) const;

private:
    std::optional<bool> m_override;
};

#endif //KOLOCATE_FILTERENGINE_H
