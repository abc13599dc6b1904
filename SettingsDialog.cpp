// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SettingsDialog.h"

#include <QVBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QDialogButtonBox>
#include <QRegularExpression>

SettingsDialog::SettingsDialog(const Settings& settings, QWidget* parent)
    : QDialog(parent), m_initial(settings)
{
    setWindowTitle(QStringLiteral("Kolocate Settings"));
    resize(620, 420);

    auto* root = new QVBoxLayout(this);

    // --- Search ---
    auto* lookupBox = new QGroupBox(QStringLiteral("Search"), this);
    auto* lookupForm = new QFormLayout(lookupBox);

    m_lookupTool = new QLineEdit(settings.lookupTool, lookupBox);
    lookupForm->addRow(QStringLiteral("Lookup tool:"), m_lookupTool);

    m_systemDb = new QLineEdit(settings.systemDb, lookupBox);
    lookupForm->addRow(QStringLiteral("System database:"), m_systemDb);

    m_mediaDb = new QLineEdit(settings.mediaDb, lookupBox);
    m_mediaDb->setToolTip(QStringLiteral("Searched together with the system database when this file exists"));
    lookupForm->addRow(QStringLiteral("Media database:"), m_mediaDb);

    m_timeout = new QSpinBox(lookupBox);
    m_timeout->setRange(1, 3600);
    m_timeout->setSuffix(QStringLiteral(" s"));
    m_timeout->setValue(settings.lookupTimeoutSeconds);
    lookupForm->addRow(QStringLiteral("Give up after:"), m_timeout);

    root->addWidget(lookupBox);

    // --- Database update ---
    auto* rebuildBox = new QGroupBox(QStringLiteral("Database Update"), this);
    auto* rebuildForm = new QFormLayout(rebuildBox);

    m_rebuildTool = new QLineEdit(settings.rebuildTool, rebuildBox);
    rebuildForm->addRow(QStringLiteral("Update tool:"), m_rebuildTool);

    m_escalationHelper = new QLineEdit(settings.escalationHelper, rebuildBox);
    m_escalationHelper->setPlaceholderText(QStringLiteral("(run directly)"));
    rebuildForm->addRow(QStringLiteral("Run as administrator with:"), m_escalationHelper);

    m_excludePaths = new QLineEdit(settings.excludePaths.join(QLatin1Char(' ')), rebuildBox);
    m_excludePaths->setPlaceholderText(QStringLiteral("Paths to exclude, separated by spaces"));
    rebuildForm->addRow(QStringLiteral("Exclude:"), m_excludePaths);

    m_includeMedia = new QCheckBox(QStringLiteral("Also update the media database"), rebuildBox);
    m_includeMedia->setChecked(settings.includeMedia);
    rebuildForm->addRow(QString(), m_includeMedia);

    m_mediaScanPath = new QLineEdit(settings.mediaScanPath, rebuildBox);
    m_mediaScanPath->setEnabled(settings.includeMedia);
    rebuildForm->addRow(QStringLiteral("Media location:"), m_mediaScanPath);

    connect(m_includeMedia, &QCheckBox::toggled, m_mediaScanPath, &QWidget::setEnabled);

    root->addWidget(rebuildBox);
    root->addStretch(1);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    root->addWidget(buttons);
}

Settings SettingsDialog::settings() const {
    Settings s = m_initial;

    // An emptied tool field falls back to the previous value rather than to nothing.
    const QString lookupTool = m_lookupTool->text().trimmed();
    if (!lookupTool.isEmpty()) s.lookupTool = lookupTool;

    const QString rebuildTool = m_rebuildTool->text().trimmed();
    if (!rebuildTool.isEmpty()) s.rebuildTool = rebuildTool;

    s.systemDb = m_systemDb->text().trimmed();
    s.mediaDb = m_mediaDb->text().trimmed();
    s.lookupTimeoutSeconds = m_timeout->value();

    s.escalationHelper = m_escalationHelper->text().trimmed();
    s.mediaScanPath = m_mediaScanPath->text().trimmed();
    s.includeMedia = m_includeMedia->isChecked();

    static const QRegularExpression ws(QStringLiteral("\\s+"));
    s.excludePaths = m_excludePaths->text().split(ws, Qt::SkipEmptyParts);

    return s;
}
