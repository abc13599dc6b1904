// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "GuiUtils.h"
#include "Entry.h"
#include "MetadataFetcher.h"
#include <algorithm>
#include <array>
#include <ctime>
#include <limits>

namespace GuiUtils {

    std::string int64ToFormattedTime(const int64_t timeSeconds) {
        using time_limits = std::numeric_limits<std::time_t>;

        // Range-check before casting to time_t (prevents implementation-defined narrowing/overflow).
        const auto min_tt = static_cast<std::int64_t>(time_limits::min());
        const auto max_tt = static_cast<std::int64_t>(time_limits::max());

        if (timeSeconds < min_tt || timeSeconds > max_tt) {
            return "out-of-range";
        }

        const std::time_t tt = static_cast<std::time_t>(timeSeconds);

        std::tm tm{};
        if (::localtime_r(&tt, &tm) == nullptr) {
            return "invalid-time";
        }

        std::array<char, 32> buf{}; // "YYYY-MM-DD HH:MM:SS" + '\0', with room for years past 9999
        if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
            return "format-error";
        }
        return std::string{buf.data()};
    }

    QString formatSizeBinary(const uint64_t bytes) {
        static constexpr std::array<const char*, 6> kUnits = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

        if (bytes < 1024) {
            return QStringLiteral("%1 B").arg(bytes);
        }

        double value = static_cast<double>(bytes) / 1024.0;
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size()) {
            value /= 1024.0;
            ++unit;
        }

        return QStringLiteral("%1 %2").arg(value, 0, 'f', 2).arg(QLatin1String(kUnits[unit]));
    }

    QString formatMetadataStatus(const Entry& entry, const EntryMetadata& metadata) {
        if (!metadata.accessible) {
            return QStringLiteral("%1  |  Not accessible").arg(entry.name);
        }

        const QString modified = QString::fromStdString(int64ToFormattedTime(metadata.modifiedAt));

        if (metadata.isDirectory) {
            return QStringLiteral("%1  |  Folder  |  Modified: %2").arg(entry.name, modified);
        }

        return QStringLiteral("%1  |  %2  |  Modified: %3")
            .arg(entry.name, formatSizeBinary(metadata.sizeBytes), modified);
    }

    std::optional<int> responsiveNameColumnWidth(const int viewportWidth) {
        if (viewportWidth <= 0) {
            return std::nullopt;
        }
        const int target = static_cast<int>(viewportWidth * kNameColumnShare);
        return std::max(target, kMinNameColumnWidth);
    }
}
