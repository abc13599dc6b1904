// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FilterEngine.h"

#include <QStringMatcher>
#include <vector>

namespace FilterEngine {

    QVector<Entry> filter(const QVector<Entry>& raw,
                          const CategoryMatcher& category,
                          const QStringList& tokens,
                          bool caseInsensitive,
                          const QRegularExpression* refine) {
        const bool hasRefine = refine && !refine->pattern().isEmpty();

        if (tokens.isEmpty() && !hasRefine && category.matchesEverything()) {
            return raw;
        }

        const Qt::CaseSensitivity cs = caseInsensitive ? Qt::CaseInsensitive : Qt::CaseSensitive;

        // Build each matcher once per call, not once per entry.
        std::vector<QStringMatcher> matchers;
        matchers.reserve(static_cast<size_t>(tokens.size()));
        for (const QString& t : tokens) {
            if (!t.isEmpty()) {
                matchers.emplace_back(t, cs);
            }
        }

        QVector<Entry> out;
        out.reserve(raw.size());

        for (const Entry& e : raw) {
            if (!category.matches(e)) {
                continue;
            }

            bool keep = true;
            for (const QStringMatcher& m : matchers) {
                if (m.indexIn(e.path) < 0) {
                    keep = false;
                    break;
                }
            }

            if (keep && hasRefine && !refine->match(e.path).hasMatch()) {
                keep = false;
            }

            if (keep) {
                out.push_back(e);
            }
        }

        return out;
    }

    std::optional<QRegularExpression> compileRefinePattern(const QString& pattern,
                                                           bool caseInsensitive,
                                                           QString* errorOut) {
        QRegularExpression re(pattern, caseInsensitive
            ? QRegularExpression::CaseInsensitiveOption
            : QRegularExpression::NoPatternOption);

        if (!re.isValid()) {
            if (errorOut) {
                *errorOut = QStringLiteral("%1 (at offset %2)")
                    .arg(re.errorString())
                    .arg(re.patternErrorOffset());
            }
            return std::nullopt;
        }

        re.optimize();
        return re;
    }
}

bool CasePolicy::autoCaseInsensitive(const QString& queryText) {
    for (const QChar ch : queryText) {
        if (ch.isUpper()) {
            return false;
        }
    }
    return true;
}

void CasePolicy::queryTextChanged(const QString& queryText) {
    if (queryText.trimmed().isEmpty()) {
        m_override.reset();
    }
}

bool CasePolicy::caseInsensitiveFor(const QString& queryText) const {
    if (m_override) {
        return *m_override;
    }
    return autoCaseInsensitive(queryText);
}
