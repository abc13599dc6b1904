// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QApplication>
#include <QDebug>
#include <QIcon>
#include <KAboutData>
#include <iostream>
#include <string_view>
#include "MainWindow.h"
#include "Settings.h"
#include "Version.h"

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--version") {
            std::cout << "kolocate v" << Version::VERSION << std::endl;
            return 0;
        }
    }

    QApplication app(argc, argv);

    // QSettings() picks these up: ~/.config/kolocate/kolocate.conf
    QApplication::setOrganizationName(QStringLiteral("kolocate"));
    QApplication::setApplicationName(QStringLiteral("kolocate"));

    KAboutData aboutData(
        QStringLiteral("kolocate"),
        QStringLiteral("Kolocate"),
        QString::fromUtf8(Version::VERSION),
        QStringLiteral("A desktop front-end for the plocate file index."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters &lt;https://github.com/Reikooters&gt;")
    );

    aboutData.addAuthor("Reikooters", "Developer", "https://github.com/Reikooters");
    aboutData.setBugAddress("https://github.com/Reikooters/kolocate/issues");
    aboutData.setHomepage("https://github.com/Reikooters/kolocate");

    // This tells KDE to look for the icon named 'kolocate' in the system theme
    aboutData.setProgramLogo(QIcon::fromTheme(QStringLiteral("kolocate")));

    KAboutData::setApplicationData(aboutData);

    // This must match the .desktop filename exactly
    QApplication::setDesktopFileName(QStringLiteral("net.reikooters.kolocate"));

    QApplication::setWindowIcon(QIcon::fromTheme(QStringLiteral("kolocate")));

    qRegisterMetaType<TaskHandle>();
    qRegisterMetaType<LookupResult>();
    qRegisterMetaType<RebuildStepResult>();
    qRegisterMetaType<EntryMetadata>();

    {
        const Settings settings = Settings::load();
        const QStringList dbs = settings.lookupDatabases();
        qInfo().noquote() << "Lookup tool:" << settings.lookupTool
                          << "databases:" << (dbs.isEmpty() ? QStringLiteral("(tool default)") : dbs.join(':'));
    }

    MainWindow window;
    window.show();

    return app.exec();
}
