// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_GUIUTILS_H
#define KOLOCATE_GUIUTILS_H

#include <QString>
#include <optional>
#include <string>
#include <cstdint>

struct Entry;
struct EntryMetadata;

namespace GuiUtils {
    /**
     * Converts a timestamp in seconds since the Unix epoch to a formatted
     * date and time string in the local time zone.
     *
     * The timestamp is validated to ensure it is within the valid range for
     * conversion to a `std::time_t`, and formatted as "YYYY-MM-DD HH:MM:SS".
     * If the timestamp is outside the representable range for the local system,
     * the string "out-of-range" is returned. If a conversion or formatting
     * error occurs, "invalid-time" or "format-error" is returned.
     *
     * @param timeSeconds Seconds since January 1, 1970 (UTC). May be negative.
     * @return A std::string containing the formatted local date and time,
     *         or an error indicator such as "out-of-range", "invalid-time",
     *         or "format-error".
     */
    [[nodiscard]] std::string int64ToFormattedTime(int64_t timeSeconds);

    /**
     * Formats a byte count with 1024-based units and two decimals, e.g. "1.50 KiB".
     * Values below one KiB are shown as whole bytes ("512 B").
     */
    [[nodiscard]] QString formatSizeBinary(uint64_t bytes);

    /**
     * The status bar text for the selected entry, e.g.
     * "report.pdf  |  1.50 MiB  |  Modified: 2025-03-01 10:22:13".
     * Inaccessible entries read "Not accessible".
     */
    [[nodiscard]] QString formatMetadataStatus(const Entry& entry, const EntryMetadata& metadata);

    inline constexpr double kNameColumnShare = 0.40;
    inline constexpr int kMinNameColumnWidth = 150;

    /**
     * Width of the Name column for a results table whose viewport is viewportWidth pixels
     * wide: 40% of it, but at least 150. std::nullopt while the viewport has no width yet.
     */
    [[nodiscard]] std::optional<int> responsiveNameColumnWidth(int viewportWidth);
}

#endif //KOLOCATE_GUIUTILS_H
