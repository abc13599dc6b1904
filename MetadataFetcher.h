// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_METADATAFETCHER_H
#define KOLOCATE_METADATAFETCHER_H

#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>

/**
 * @brief What the status bar shows for the selected entry.
 *
 * Not found, permission denied and any other I/O error all collapse to accessible == false.
 */
struct EntryMetadata {
    bool accessible = false;
    uint64_t sizeBytes = 0;
    int64_t modifiedAt = 0; // seconds since the Unix epoch
    bool isDirectory = false;
};

Q_DECLARE_METATYPE(EntryMetadata)

/**
 * @brief Looks up size and modification time of entries off the GUI thread.
 *
 * Requests are fire-and-forget. Each completion carries the subject key (the path that
 * was asked for) so the receiver can drop results for an entry that is no longer selected.
 *
 * Every request gets its own short-lived thread. A request stuck on an unresponsive mount
 * holds up nothing else, and is never waited for: once the fetcher is gone its late
 * completion is discarded.
 */
class MetadataFetcher final : public QObject {
    Q_OBJECT

public:
    using FetchFunction = std::function<EntryMetadata(const QString& path)>;

    explicit MetadataFetcher(QObject* parent = nullptr);

    /**
     * Uses fetchFunction instead of fetch(). It is called on the request threads.
     */
    explicit MetadataFetcher(FetchFunction fetchFunction, QObject* parent = nullptr);

    /**
     * Blocking stat(2) of a single path. Safe to call from any thread.
     */
    [[nodiscard]] static EntryMetadata fetch(const QString& path);

    void request(const QString& path);

signals:
    void metadataReady(const QString& subjectKey, const EntryMetadata& metadata);

private:
    FetchFunction m_fetch;
};

#endif //KOLOCATE_METADATAFETCHER_H
