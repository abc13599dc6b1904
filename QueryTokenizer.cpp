// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryTokenizer.h"

#include <QRegularExpression>

namespace QueryTokenizer {

    TokenizedQuery tokenize(const QString& raw) {
        TokenizedQuery out;

        if (raw.trimmed().isEmpty()) {
            return out;
        }

        static const QRegularExpression kShortcutRe(QStringLiteral("(?:^|\\s)::([A-Za-z0-9]+)(?=\\s|$)"));
        static const QRegularExpression kQuotedRe(QStringLiteral("\"([^\"]*)\""));
        static const QRegularExpression kWhitespaceRe(QStringLiteral("\\s+"));

        QString working = raw;

        // 1. Category shortcut
        auto shortcuts = kShortcutRe.globalMatch(working);
        while (shortcuts.hasNext()) {
            const QRegularExpressionMatch m = shortcuts.next();
            const auto category = Categories::fromShortcut(m.capturedView(1));
            if (!category) {
                continue; // treated as literal text
            }

            out.category = category;

            const qsizetype start = m.capturedStart(1) - kShortcutPrefix.size();
            working.replace(start, m.capturedEnd(1) - start, QLatin1Char(' '));
            break;
        }

        // 2. Quoted phrases
        QString remainder;
        remainder.reserve(working.size());
        qsizetype last = 0;

        auto quoted = kQuotedRe.globalMatch(working);
        while (quoted.hasNext()) {
            const QRegularExpressionMatch m = quoted.next();

            remainder += QStringView(working).mid(last, m.capturedStart(0) - last);
            remainder += QLatin1Char(' ');
            last = m.capturedEnd(0);

            const QString phrase = m.captured(1);
            if (!phrase.trimmed().isEmpty()) {
                out.tokens.push_back(phrase);
            }
        }
        remainder += QStringView(working).mid(last);

        // 3. Plain words
        out.tokens += remainder.split(kWhitespaceRe, Qt::SkipEmptyParts);

        return out;
    }
}
