// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Categories.h"
#include "Entry.h"

#include <utility>

CategoryMatcher CategoryMatcher::matchAll() {
    return {};
}

CategoryMatcher CategoryMatcher::directoriesOnly() {
    CategoryMatcher m;
    m.m_kind = Kind::DirectoriesOnly;
    return m;
}

CategoryMatcher CategoryMatcher::extensions(const QString& pattern) {
    CategoryMatcher m;
    m.m_kind = Kind::Extension;
    m.m_regex = QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
    m.m_regex.optimize();
    return m;
}

bool CategoryMatcher::matches(const Entry& entry) const {
    switch (m_kind) {
        case Kind::MatchAll:
            return true;
        case Kind::DirectoriesOnly:
            return entry.isDirectory;
        case Kind::Extension:
            return m_regex.match(entry.path).hasMatch();
    }
    return false;
}

namespace Categories {

    namespace {
        struct ShortcutName {
            const char* name;
            CategoryId category;
        };

        constexpr std::array<ShortcutName, 24> kShortcuts = {{
            {"all", CategoryId::AllCategories},
            {"dir", CategoryId::Directories},
            {"dirs", CategoryId::Directories},
            {"folder", CategoryId::Directories},
            {"doc", CategoryId::Documents},
            {"docs", CategoryId::Documents},
            {"img", CategoryId::Images},
            {"image", CategoryId::Images},
            {"images", CategoryId::Images},
            {"pic", CategoryId::Images},
            {"vid", CategoryId::Videos},
            {"video", CategoryId::Videos},
            {"videos", CategoryId::Videos},
            {"audio", CategoryId::Audio},
            {"music", CategoryId::Audio},
            {"app", CategoryId::Apps},
            {"apps", CategoryId::Apps},
            {"code", CategoryId::Code},
            {"src", CategoryId::Code},
            {"zip", CategoryId::Archives},
            {"archive", CategoryId::Archives},
            {"archives", CategoryId::Archives},
            {"txt", CategoryId::GenericText},
            {"text", CategoryId::GenericText},
        }};

        std::size_t indexOf(CategoryId category) {
            return static_cast<std::size_t>(category);
        }
    }

    const QStringList& extensionsFor(CategoryId category) {
        // Keep each list lower case; matching is case-insensitive.
        static const std::array<QStringList, kAllCategoryIds.size()> kExtensions = {{
            {}, // AllCategories
            {}, // Directories
            {QStringLiteral("pdf"), QStringLiteral("doc"), QStringLiteral("docx"), QStringLiteral("odt"),
             QStringLiteral("ods"), QStringLiteral("odp"), QStringLiteral("xls"), QStringLiteral("xlsx"),
             QStringLiteral("ppt"), QStringLiteral("pptx"), QStringLiteral("rtf"), QStringLiteral("tex"),
             QStringLiteral("epub"), QStringLiteral("djvu")},
            {QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("png"), QStringLiteral("gif"),
             QStringLiteral("bmp"), QStringLiteral("svg"), QStringLiteral("webp"), QStringLiteral("tif"),
             QStringLiteral("tiff"), QStringLiteral("heic"), QStringLiteral("ico"), QStringLiteral("xcf"),
             QStringLiteral("raw"), QStringLiteral("cr2"), QStringLiteral("nef")},
            {QStringLiteral("mp4"), QStringLiteral("mkv"), QStringLiteral("avi"), QStringLiteral("mov"),
             QStringLiteral("wmv"), QStringLiteral("flv"), QStringLiteral("webm"), QStringLiteral("m4v"),
             QStringLiteral("mpg"), QStringLiteral("mpeg"), QStringLiteral("3gp"), QStringLiteral("ts")},
            {QStringLiteral("mp3"), QStringLiteral("flac"), QStringLiteral("ogg"), QStringLiteral("opus"),
             QStringLiteral("wav"), QStringLiteral("m4a"), QStringLiteral("aac"), QStringLiteral("wma"),
             QStringLiteral("aiff"), QStringLiteral("mid")},
            {QStringLiteral("appimage"), QStringLiteral("desktop"), QStringLiteral("deb"), QStringLiteral("rpm"),
             QStringLiteral("flatpak"), QStringLiteral("flatpakref"), QStringLiteral("snap"), QStringLiteral("exe"),
             QStringLiteral("msi"), QStringLiteral("run"), QStringLiteral("bin"), QStringLiteral("jar")},
            {QStringLiteral("c"), QStringLiteral("cc"), QStringLiteral("cpp"), QStringLiteral("cxx"),
             QStringLiteral("h"), QStringLiteral("hpp"), QStringLiteral("py"), QStringLiteral("js"),
             QStringLiteral("java"), QStringLiteral("rs"), QStringLiteral("go"), QStringLiteral("rb"),
             QStringLiteral("php"), QStringLiteral("cs"), QStringLiteral("kt"), QStringLiteral("lua"),
             QStringLiteral("pl"), QStringLiteral("sh"), QStringLiteral("bash"), QStringLiteral("sql"),
             QStringLiteral("html"), QStringLiteral("css"), QStringLiteral("json"), QStringLiteral("xml"),
             QStringLiteral("yaml"), QStringLiteral("yml"), QStringLiteral("toml"), QStringLiteral("cmake")},
            {QStringLiteral("zip"), QStringLiteral("tar"), QStringLiteral("gz"), QStringLiteral("tgz"),
             QStringLiteral("bz2"), QStringLiteral("xz"), QStringLiteral("zst"), QStringLiteral("7z"),
             QStringLiteral("rar"), QStringLiteral("iso"), QStringLiteral("lz4")},
            {QStringLiteral("txt"), QStringLiteral("md"), QStringLiteral("log"), QStringLiteral("cfg"),
             QStringLiteral("conf"), QStringLiteral("ini"), QStringLiteral("csv"), QStringLiteral("nfo"),
             QStringLiteral("rst")},
        }};

        return kExtensions[indexOf(category)];
    }

    QString patternFor(CategoryId category) {
        const QStringList& exts = extensionsFor(category);
        if (exts.isEmpty()) {
            return {};
        }

        QStringList escaped;
        escaped.reserve(exts.size());
        for (const QString& ext : exts) {
            escaped.push_back(QRegularExpression::escape(ext));
        }

        return QStringLiteral("\\.(?:%1)$").arg(escaped.join(QLatin1Char('|')));
    }

    const CategoryMatcher& matcherFor(CategoryId category) {
        // Compiled once; QRegularExpression matching is safe from multiple threads.
        static const std::array<CategoryMatcher, kAllCategoryIds.size()> kMatchers = [] {
            std::array<CategoryMatcher, kAllCategoryIds.size()> out;
            for (CategoryId id : kAllCategoryIds) {
                CategoryMatcher m;
                if (id == CategoryId::AllCategories) {
                    m = CategoryMatcher::matchAll();
                } else if (id == CategoryId::Directories) {
                    m = CategoryMatcher::directoriesOnly();
                } else {
                    m = CategoryMatcher::extensions(patternFor(id));
                }
                out[indexOf(id)] = std::move(m);
            }
            return out;
        }();

        return kMatchers[indexOf(category)];
    }

    std::optional<CategoryId> fromShortcut(QStringView identifier) {
        for (const auto& s : kShortcuts) {
            if (identifier.compare(QLatin1String(s.name), Qt::CaseInsensitive) == 0) {
                return s.category;
            }
        }
        return std::nullopt;
    }

    QString key(CategoryId category) {
        switch (category) {
            case CategoryId::AllCategories: return QStringLiteral("all");
            case CategoryId::Directories:   return QStringLiteral("directories");
            case CategoryId::Documents:     return QStringLiteral("documents");
            case CategoryId::Images:        return QStringLiteral("images");
            case CategoryId::Videos:        return QStringLiteral("videos");
            case CategoryId::Audio:         return QStringLiteral("audio");
            case CategoryId::Apps:          return QStringLiteral("apps");
            case CategoryId::Code:          return QStringLiteral("code");
            case CategoryId::Archives:      return QStringLiteral("archives");
            case CategoryId::GenericText:   return QStringLiteral("text");
        }
        return QStringLiteral("all");
    }

    std::optional<CategoryId> fromKey(const QString& k) {
        for (CategoryId id : kAllCategoryIds) {
            if (key(id) == k) {
                return id;
            }
        }
        return std::nullopt;
    }

    QString displayName(CategoryId category) {
        switch (category) {
            case CategoryId::AllCategories: return QStringLiteral("All Categories");
            case CategoryId::Directories:   return QStringLiteral("Folders");
            case CategoryId::Documents:     return QStringLiteral("Documents");
            case CategoryId::Images:        return QStringLiteral("Images");
            case CategoryId::Videos:        return QStringLiteral("Videos");
            case CategoryId::Audio:         return QStringLiteral("Audio");
            case CategoryId::Apps:          return QStringLiteral("Applications");
            case CategoryId::Code:          return QStringLiteral("Code & Scripts");
            case CategoryId::Archives:      return QStringLiteral("Archives");
            case CategoryId::GenericText:   return QStringLiteral("Text Files");
        }
        return {};
    }
}
