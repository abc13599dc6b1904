// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QFile>
#include <QThread>
#include <QDebug>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>
#include "MetadataFetcher.h"

MetadataFetcher::MetadataFetcher(QObject* parent)
    : MetadataFetcher(&MetadataFetcher::fetch, parent) {}

MetadataFetcher::MetadataFetcher(FetchFunction fetchFunction, QObject* parent)
    : QObject(parent), m_fetch(std::move(fetchFunction)) {}

EntryMetadata MetadataFetcher::fetch(const QString& path) {
    EntryMetadata md;
    if (path.isEmpty()) {
        return md;
    }

    const QByteArray encoded = QFile::encodeName(path);

    struct stat st{};
    if (::stat(encoded.constData(), &st) != 0) {
        const int err = errno;
        qDebug().noquote() << "stat failed for" << path << "-" << std::strerror(err);
        return md;
    }

    md.accessible = true;
    md.isDirectory = S_ISDIR(st.st_mode);
    md.sizeBytes = st.st_size > 0 ? static_cast<uint64_t>(st.st_size) : 0;
    md.modifiedAt = static_cast<int64_t>(st.st_mtime);
    return md;
}

void MetadataFetcher::request(const QString& path) {
    auto result = std::make_shared<EntryMetadata>();
    const FetchFunction fetchFunction = m_fetch;

    // stat() on a hung network mount may never return. The thread owns nothing but its
    // copies, so it can be left behind when the fetcher (or the application) goes away.
    QThread* worker = QThread::create([fetchFunction, path, result]() {
        *result = fetchFunction(path);
    });

    // `this` is the context: the hand-back is dropped if the fetcher was destroyed meanwhile.
    connect(worker, &QThread::finished, this, [this, path, result]() {
        Q_EMIT metadataReady(path, *result);
    });
    connect(worker, &QThread::finished, worker, &QObject::deleteLater);

    worker->start();
}
