// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KOLOCATE_SETTINGSDIALOG_H
#define KOLOCATE_SETTINGSDIALOG_H

#include <QDialog>
#include <QCheckBox>
#include <QLineEdit>
#include <QSpinBox>
#include "Settings.h"

/**
 * @brief Edits the lookup and database update configuration.
 *
 * View preferences (sort, category, regex mode) are not shown here; they follow the main window.
 */
class SettingsDialog final : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(const Settings& settings, QWidget* parent = nullptr);

    /**
     * The edited settings. Fields this dialog does not show keep the values it was opened with.
     */
    [[nodiscard]] Settings settings() const;

private:
    Settings m_initial;

    QLineEdit* m_lookupTool = nullptr;
    QLineEdit* m_systemDb = nullptr;
    QLineEdit* m_mediaDb = nullptr;
    QSpinBox* m_timeout = nullptr;

    QLineEdit* m_rebuildTool = nullptr;
    QLineEdit* m_escalationHelper = nullptr;
    QLineEdit* m_mediaScanPath = nullptr;
    QLineEdit* m_excludePaths = nullptr;
    QCheckBox* m_includeMedia = nullptr;
};

#endif //KOLOCATE_SETTINGSDIALOG_H
