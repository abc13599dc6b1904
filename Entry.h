// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_ENTRY_H
#define KOLOCATE_ENTRY_H

#include <QString>
#include <QStringList>
#include <QVector>

/**
 * @brief One matched filesystem path, split into a displayable name and its containing directory.
 *
 * Entries are created from lookup output lines and never modified afterwards. The joined
 * path is computed once at creation so that filtering does not rebuild it per keystroke.
 */
struct Entry {
    QString name;
    QString parentPath; // never empty for real entries; "/" for the root
    bool isDirectory = false;
    QString path;       // parentPath joined with name

    // A default-constructed entry has no name. It stands for nothing and must never be
    // acted upon (open, copy, metadata).
    [[nodiscard]] bool isPlaceholder() const { return name.isEmpty(); }

    bool operator==(const Entry& other) const {
        return name == other.name && parentPath == other.parentPath && isDirectory == other.isDirectory;
    }
};

namespace EntryUtils {
    /**
     * Joins a parent directory and a name without doubling the separator.
     * The root entry ("/" in "/") joins to "/".
     */
    [[nodiscard]] QString joinPath(const QString& parentPath, const QString& name);

    /**
     * Converts one raw lookup output line into an Entry.
     *
     * A line ending in "/" is a directory. "/" alone becomes {name "/", parent "/", dir}.
     * Otherwise the line is split at its last separator (after trailing separators are
     * stripped) and an empty parent is normalized to "/".
     *
     * The line must not be blank; classifyLines() filters those out.
     */
    [[nodiscard]] Entry classifyLine(const QString& rawLine);

    /**
     * Classifies every non-blank line, trimming surrounding whitespace first.
     */
    [[nodiscard]] QVector<Entry> classifyLines(const QStringList& rawLines);
}

#endif //KOLOCATE_ENTRY_H
