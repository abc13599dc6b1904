// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Entry.h"

namespace EntryUtils {

    static constexpr QChar kSeparator = QLatin1Char('/');

    QString joinPath(const QString& parentPath, const QString& name) {
        if (name == kSeparator && parentPath == kSeparator) {
            return parentPath;
        }

        if (parentPath.endsWith(kSeparator)) {
            return parentPath + name;
        }

        return parentPath + kSeparator + name;
    }

    Entry classifyLine(const QString& rawLine) {
        Entry e;

        if (rawLine == kSeparator) {
            e.name = kSeparator;
            e.parentPath = kSeparator;
            e.isDirectory = true;
            e.path = kSeparator;
            return e;
        }

        e.isDirectory = rawLine.endsWith(kSeparator);

        // Strip trailing separators so "/home/user/Photos/" splits like "/home/user/Photos".
        qsizetype end = rawLine.size();
        while (end > 1 && rawLine.at(end - 1) == kSeparator) {
            --end;
        }
        const QStringView trimmed = QStringView(rawLine).left(end);

        const qsizetype sep = trimmed.lastIndexOf(kSeparator);
        if (sep < 0) {
            // Relative output (not produced by plocate, but keep it displayable)
            e.name = trimmed.toString();
            e.parentPath = kSeparator;
        } else {
            e.name = trimmed.mid(sep + 1).toString();
            e.parentPath = trimmed.left(sep).toString();
        }

        if (e.parentPath.isEmpty()) {
            e.parentPath = kSeparator;
        }

        // A line made only of separators ("//") collapses to the root.
        if (e.name.isEmpty()) {
            e.name = kSeparator;
        }

        e.path = joinPath(e.parentPath, e.name);
        return e;
    }

    QVector<Entry> classifyLines(const QStringList& rawLines) {
        QVector<Entry> out;
        out.reserve(rawLines.size());

        for (const QString& line : rawLines) {
            const QString t = line.trimmed();
            if (t.isEmpty()) {
                continue;
            }
            out.push_back(classifyLine(t));
        }

        return out;
    }
}
