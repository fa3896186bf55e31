// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/Constants.hpp"
#include "backup/internal/BackupTracker.hpp"

#include <QtCore/QString>

class QSettings;

namespace Backup {

// [backup] group of the application INI file.
struct BACKUP_EXPORT BackupSettings final {
	bool enabled = true;
	int debounceMs = Constants::kDefaultDebounceMs;
	int maxDelayMs = Constants::kDefaultMaxDelayMs;
	int retryDelayMs = Constants::kDefaultRetryDelayMs;
	int maxRetryDelayMs = Constants::kDefaultMaxRetryDelayMs;
	QString homeDir;

	static QString defaultSettingsPath();
	static QString defaultHomeDir();

	static BackupSettings load(QSettings& settings);
	static BackupSettings loadFromFile(const QString& iniPath = defaultSettingsPath());
	void save(QSettings& settings) const;

	// Brings every value into its supported range and fills in the home.
	void normalize();

	Internal::BackupTrackerOptions trackerOptions() const;
};

} // namespace Backup
