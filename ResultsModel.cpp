// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QIcon>
#include <QMimeData>
#include <QSet>
#include <QUrl>
#include "ResultsModel.h"
#include "SearchSession.h"

ResultsModel::ResultsModel(SearchSession* session, QObject* parent)
    : QAbstractTableModel(parent)
    , m_session(session)
{
    connect(m_session, &SearchSession::viewChanged, this, &ResultsModel::onViewChanged);
}

void ResultsModel::onViewChanged() {
    // Every recompute replaces the visible set wholesale.
    beginResetModel();
    endResetModel();
}

void ResultsModel::sort(int column, Qt::SortOrder order) {
    const std::optional<SortColumn> sortColumn = SortEngine::columnFromIndex(column);
    if (!sortColumn) {
        return;
    }
    // The session recomputes and emits viewChanged, which resets this model.
    m_session->setSort(sortColumn, order);
}

int ResultsModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    if (m_session->showsPlaceholder()) return 1;
    return static_cast<int>(m_session->visibleEntries().size());
}

int ResultsModel::columnCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return 2; // Name, Path
}

QVariant ResultsModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (role != Qt::DisplayRole || orientation != Qt::Horizontal) return {};
    switch (section) {
        case 0: return QStringLiteral("Name");
        case 1: return QStringLiteral("Path");
        default: return {};
    }
}

QVariant ResultsModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()
        || (!(role == Qt::DecorationRole && index.column() == 0) && role != Qt::DisplayRole)) {
        return {};
    }

    if (m_session->showsPlaceholder()) {
        if (role == Qt::DisplayRole && index.column() == 0) {
            return QString::fromLatin1(kPlaceholderText);
        }
        return {};
    }

    const QVector<Entry>& entries = m_session->visibleEntries();
    if (index.row() < 0 || index.row() >= entries.size()) {
        return {};
    }

    const Entry& entry = entries.at(index.row());

    // DecorationRole provides the icon shown next to the name
    if (role == Qt::DecorationRole) {
        // Using standard KDE/Freedesktop theme names for icons
        return entry.isDirectory ? QIcon::fromTheme("inode-directory") : QIcon::fromTheme("document-new");
    }

    switch (index.column()) {
        case 0: return entry.name;
        case 1: return entry.parentPath;
        default: return {};
    }
}

Qt::ItemFlags ResultsModel::flags(const QModelIndex& index) const {
    Qt::ItemFlags f = QAbstractTableModel::flags(index);

    // Allow dragging rows out of the view (Dolphin, desktop, etc.)
    if (index.isValid() && !m_session->showsPlaceholder()) {
        f |= Qt::ItemIsDragEnabled;
    }
    return f;
}

QStringList ResultsModel::mimeTypes() const {
    return {QStringLiteral("text/uri-list")};
}

QMimeData* ResultsModel::mimeData(const QModelIndexList& indexes) const {
    auto* md = new QMimeData();
    if (m_session->showsPlaceholder()) return md;

    const QVector<Entry>& entries = m_session->visibleEntries();

    // Collect unique rows (one index per column arrives for each row)
    QSet<int> seen;
    QList<QUrl> urls;
    for (const auto& idx : indexes) {
        if (!idx.isValid() || idx.row() >= entries.size() || seen.contains(idx.row())) continue;
        seen.insert(idx.row());
        urls.push_back(QUrl::fromLocalFile(entries.at(idx.row()).path));
    }

    md->setUrls(urls);
    return md;
}
