// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/BackupTypes.hpp"
#include "backup/state/BackupSettings.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>

#include <memory>

namespace Backup::Api {
class IBackupStore;
class IEditorHost;
}

namespace Backup::Internal {
class BackupRestorer;
class BackupTracker;
}

namespace Backup {

class BackupWorkspaceRegistry;

// Crash recovery for one window and its workspace: restores what the last
// run left behind, then keeps backups of dirty documents until stop().
class BACKUP_EXPORT BackupSession final : public QObject {
	Q_OBJECT

public:
	enum class StopMode : unsigned char {
		// Normal close: the workspace's backups are deleted.
		Clean,
		// Hot exit: pending writes are flushed and backups stay for the next launch.
		KeepBackups
	};

	BackupSession(Api::IEditorHost* host,
				  const BackupSettings& settings,
				  const QString& workspaceRoot,
				  QObject* parent = nullptr);

	// Uses an externally owned store; no workspace registration happens.
	BackupSession(Api::IEditorHost* host,
				  Api::IBackupStore* store,
				  const BackupSettings& settings,
				  QObject* parent = nullptr);

	~BackupSession() override;

	void start();
	void stop(StopMode mode);

	bool isActive() const noexcept { return m_active; }
	bool isRestoring() const;

	const BackupSettings& settings() const noexcept { return m_settings; }
	Api::IBackupStore* store() const;
	Internal::BackupTracker* tracker() const noexcept { return m_tracker.get(); }
	Internal::BackupRestorer* restorer() const noexcept { return m_restorer.get(); }

signals:
	void restoreFinished(const Backup::Api::RestoreResult& result);
	// Emitted at most once per start().
	void backupsUnavailable(const QString& message);
	void stopped();

private:
	void init(Api::IEditorHost* host);
	void handleRestoreFinished(const Api::RestoreResult& result);
	void notifyUnavailable(const QString& message);

	BackupSettings m_settings;
	QString m_workspaceRoot;
	std::unique_ptr<Api::IBackupStore> m_ownedStore;
	QPointer<Api::IBackupStore> m_store;
	std::unique_ptr<BackupWorkspaceRegistry> m_registry;
	std::unique_ptr<Internal::BackupRestorer> m_restorer;
	std::unique_ptr<Internal::BackupTracker> m_tracker;
	bool m_active = false;
	bool m_notified = false;
};

} // namespace Backup
