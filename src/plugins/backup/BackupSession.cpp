// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/BackupSession.hpp"

#include "backup/api/BackupMetaTypes.hpp"
#include "backup/api/IBackupStore.hpp"
#include "backup/internal/BackupRestorer.hpp"
#include "backup/internal/BackupStoreImpl.hpp"
#include "backup/internal/BackupTracker.hpp"
#include "backup/state/BackupWorkspaceRegistry.hpp"

Q_LOGGING_CATEGORY(backuplog, "lifeboat.backup")

namespace Backup {

BackupSession::BackupSession(Api::IEditorHost* host,
							 const BackupSettings& settings,
							 const QString& workspaceRoot,
							 QObject* parent)
	: QObject(parent)
	, m_settings(settings)
	, m_workspaceRoot(workspaceRoot)
{
	m_settings.normalize();
	m_ownedStore = std::make_unique<Internal::BackupStoreImpl>(m_settings.homeDir, m_workspaceRoot);
	m_store = m_ownedStore.get();
	m_registry = std::make_unique<BackupWorkspaceRegistry>(m_settings.homeDir);
	init(host);
}

BackupSession::BackupSession(Api::IEditorHost* host,
							 Api::IBackupStore* store,
							 const BackupSettings& settings,
							 QObject* parent)
	: QObject(parent)
	, m_settings(settings)
	, m_store(store)
{
	m_settings.normalize();
	init(host);
}

BackupSession::~BackupSession()
{
	// The tracker and restorer hold callbacks into the store; drop them first.
	m_tracker.reset();
	m_restorer.reset();
}

void BackupSession::init(Api::IEditorHost* host)
{
	registerBackupMetaTypes();

	m_restorer = std::make_unique<Internal::BackupRestorer>(host, m_store);
	m_tracker = std::make_unique<Internal::BackupTracker>(host, m_store);
	m_tracker->setOptions(m_settings.trackerOptions());

	connect(m_restorer.get(), &Internal::BackupRestorer::finished,
			this, &BackupSession::handleRestoreFinished);
	connect(m_restorer.get(), &Internal::BackupRestorer::storeUnavailable,
			this, &BackupSession::notifyUnavailable);
}

Api::IBackupStore* BackupSession::store() const
{
	return m_store;
}

bool BackupSession::isRestoring() const
{
	return m_restorer && m_restorer->isRunning();
}

void BackupSession::start()
{
	if (m_active)
		return;

	if (!m_settings.enabled) {
		qCInfo(backuplog) << "BackupSession: backups are disabled";
		return;
	}

	if (!m_store) {
		qCWarning(backuplog) << "BackupSession::start: no store";
		return;
	}

	m_active = true;
	m_notified = false;

	if (m_registry) {
		const Utils::Result registered = m_registry->registerWorkspace(m_workspaceRoot);
		if (!registered)
			qCWarning(backuplog) << "BackupSession: cannot register workspace:" << registered.message();
	}

	qCInfo(backuplog) << "BackupSession: starting for workspace" << m_store->workspaceKey();
	m_restorer->run();
}

void BackupSession::stop(StopMode mode)
{
	if (!m_active)
		return;

	m_active = false;

	if (mode == StopMode::KeepBackups) {
		m_tracker->flush();
		m_tracker->stop();
		qCInfo(backuplog) << "BackupSession: stopped, backups kept";
		emit stopped();
		return;
	}

	m_tracker->stop();
	if (!m_store) {
		emit stopped();
		return;
	}

	m_store->clear(this, [this](const Api::BackupStatus& status) {
		if (!status) {
			qCWarning(backuplog) << "BackupSession: cannot clear backups:" << status.message();
		} else if (m_registry) {
			const Utils::Result unregistered = m_registry->unregisterWorkspace(m_workspaceRoot);
			if (!unregistered)
				qCWarning(backuplog) << "BackupSession: cannot unregister workspace:" << unregistered.message();
		}
		qCInfo(backuplog) << "BackupSession: stopped cleanly";
		emit stopped();
	});
}

void BackupSession::handleRestoreFinished(const Api::RestoreResult& result)
{
	if (result.count() > 0)
		qCInfo(backuplog) << "BackupSession:" << result.count() << "unsaved document(s) restored";

	// Restored documents are open and dirty by now, so they get tracked.
	if (m_active)
		m_tracker->start();

	emit restoreFinished(result);
}

void BackupSession::notifyUnavailable(const QString& message)
{
	if (m_notified)
		return;
	m_notified = true;
	emit backupsUnavailable(message);
}

} // namespace Backup
