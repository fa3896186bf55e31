// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/state/BackupSettings.hpp"

#include <QtCore/QDir>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>

#include <algorithm>

namespace Backup {

namespace {

const QString kGroup = QStringLiteral("backup");
const QString kEnabledKey = QStringLiteral("enabled");
const QString kDebounceKey = QStringLiteral("debounceMs");
const QString kMaxDelayKey = QStringLiteral("maxDelayMs");
const QString kRetryDelayKey = QStringLiteral("retryDelayMs");
const QString kMaxRetryDelayKey = QStringLiteral("maxRetryDelayMs");
const QString kHomeDirKey = QStringLiteral("homeDir");

int readInt(const QSettings& settings, const QString& key, int fallback)
{
	bool ok = false;
	const int value = settings.value(key, fallback).toInt(&ok);
	if (!ok) {
		qCWarning(backuplog) << "BackupSettings: ignoring malformed value for" << key;
		return fallback;
	}
	return value;
}

} // namespace

QString BackupSettings::defaultSettingsPath()
{
	const QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
	return QDir(QDir(base).filePath(QStringLiteral("Lifeboat"))).filePath(QStringLiteral("global.ini"));
}

QString BackupSettings::defaultHomeDir()
{
	const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	return QDir(base).filePath(QStringLiteral("Backups"));
}

BackupSettings BackupSettings::load(QSettings& settings)
{
	BackupSettings out;

	settings.beginGroup(kGroup);
	out.enabled = settings.value(kEnabledKey, out.enabled).toBool();
	out.debounceMs = readInt(settings, kDebounceKey, out.debounceMs);
	out.maxDelayMs = readInt(settings, kMaxDelayKey, out.maxDelayMs);
	out.retryDelayMs = readInt(settings, kRetryDelayKey, out.retryDelayMs);
	out.maxRetryDelayMs = readInt(settings, kMaxRetryDelayKey, out.maxRetryDelayMs);
	out.homeDir = settings.value(kHomeDirKey).toString().trimmed();
	settings.endGroup();

	out.normalize();
	return out;
}

BackupSettings BackupSettings::loadFromFile(const QString& iniPath)
{
	QSettings settings(iniPath, QSettings::IniFormat);
	settings.setFallbacksEnabled(false);
	if (settings.status() != QSettings::NoError)
		qCWarning(backuplog) << "BackupSettings: cannot read" << iniPath << "- using defaults";
	return load(settings);
}

void BackupSettings::save(QSettings& settings) const
{
	settings.beginGroup(kGroup);
	settings.setValue(kEnabledKey, enabled);
	settings.setValue(kDebounceKey, debounceMs);
	settings.setValue(kMaxDelayKey, maxDelayMs);
	settings.setValue(kRetryDelayKey, retryDelayMs);
	settings.setValue(kMaxRetryDelayKey, maxRetryDelayMs);
	settings.setValue(kHomeDirKey, homeDir);
	settings.endGroup();
}

void BackupSettings::normalize()
{
	debounceMs = std::clamp(debounceMs, Constants::kMinDebounceMs, Constants::kMaxDebounceMs);

	// 0 disables the cap; otherwise it cannot be shorter than the debounce.
	if (maxDelayMs <= 0)
		maxDelayMs = 0;
	else
		maxDelayMs = std::clamp(maxDelayMs, debounceMs, Constants::kMaxRetryDelayCeilingMs);

	retryDelayMs = std::clamp(retryDelayMs, 1, Constants::kMaxRetryDelayCeilingMs);
	maxRetryDelayMs = std::clamp(maxRetryDelayMs, retryDelayMs, Constants::kMaxRetryDelayCeilingMs);

	if (homeDir.isEmpty())
		homeDir = defaultHomeDir();
	homeDir = QDir::cleanPath(homeDir);
}

Internal::BackupTrackerOptions BackupSettings::trackerOptions() const
{
	Internal::BackupTrackerOptions options;
	options.debounceMs = debounceMs;
	options.maxDelayMs = maxDelayMs;
	options.retryDelayMs = retryDelayMs;
	options.maxRetryDelayMs = maxRetryDelayMs;
	return options;
}

} // namespace Backup
