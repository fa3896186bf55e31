// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/Constants.hpp"
#include "backup/api/BackupTypes.hpp"
#include "backup/api/EditorHostTypes.hpp"

#include <utils/async/DebouncedInvoker.hpp>

#include <QtCore/QHash>
#include <QtCore/QMetaObject>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include <memory>
#include <unordered_map>

namespace Backup::Api {
class IBackupStore;
class IEditorHost;
}

namespace Backup::Internal {

struct BackupTrackerOptions final {
	int debounceMs = Constants::kDefaultDebounceMs;
	int maxDelayMs = Constants::kDefaultMaxDelayMs;
	int retryDelayMs = Constants::kDefaultRetryDelayMs;
	int maxRetryDelayMs = Constants::kDefaultMaxRetryDelayMs;
};

// Watches the editor host and keeps the store in step with the dirty state of
// every open document. Each document runs a small state machine:
//
//   Clean -> Dirty -> PendingWrite -> BackedUp -> Clean
//
// Edits while PendingWrite or BackedUp move back to Dirty and restart the
// debounce. Becoming clean or closing deletes the entry. Bookkeeping is keyed
// by the store's own key so the two can never disagree on identity.
class BACKUP_EXPORT BackupTracker final : public QObject {
	Q_OBJECT

public:
	BackupTracker(Api::IEditorHost* host, Api::IBackupStore* store, QObject* parent = nullptr);
	~BackupTracker() override;

	void setOptions(const BackupTrackerOptions& options);
	const BackupTrackerOptions& options() const noexcept { return m_options; }

	void start();
	void stop();
	bool isRunning() const noexcept { return m_running; }

	void track(const Api::DocumentHandle& handle);
	void untrack(const Api::DocumentHandle& handle);

	// Writes every dirty document now instead of waiting for its debounce.
	void flush();

	Api::TrackedState stateFor(const Api::DocumentIdentity& identity) const;
	bool isTracked(const Api::DocumentIdentity& identity) const;
	int trackedCount() const;

	// Documents whose latest edit is not yet durable.
	int pendingCount() const;

signals:
	void backupWritten(const Backup::Api::DocumentIdentity& identity, quint64 version);
	void backupDiscarded(const Backup::Api::DocumentIdentity& identity);
	void backupFailed(const Backup::Api::DocumentIdentity& identity, const QString& message);

private:
	struct TrackedDocument final {
		Api::DocumentHandle handle;
		QString key;
		Api::TrackedState state = Api::TrackedState::Clean;
		quint64 generation = 0;
		quint64 epoch = 0;
		bool hasStoredEntry = false;
		int retryDelayMs = 0;
		std::unique_ptr<Utils::Async::DebouncedInvoker> timer;
	};

	TrackedDocument* documentByKey(const QString& key) const;
	TrackedDocument* documentForHandle(const Api::DocumentHandle& handle) const;

	void handleDocumentOpened(const Api::DocumentHandle& handle);
	void handleDirtyStateChanged(const Api::DocumentHandle& handle, bool dirty);
	void handleContentChanged(const Api::DocumentHandle& handle);
	void handleDocumentClosed(const Api::DocumentHandle& handle);

	void markDirty(TrackedDocument& doc);
	void markClean(TrackedDocument& doc);
	void writeNow(const QString& key);
	void handlePutFinished(const QString& key, quint64 generation, quint64 epoch,
						   const Api::BackupStatus& status);
	void scheduleRetry(TrackedDocument& doc);

	void removeEntry(const QString& key, const Api::DocumentIdentity& identity);
	void retryFailedRemovals();

	void applyOptions(TrackedDocument& doc) const;

	QPointer<Api::IEditorHost> m_host;
	QPointer<Api::IBackupStore> m_store;
	BackupTrackerOptions m_options;
	bool m_running = false;
	quint64 m_nextVersion = 0;

	std::unordered_map<QString, std::unique_ptr<TrackedDocument>> m_documents;
	QHash<QString, QString> m_keyByHandleId;
	QHash<QString, Api::DocumentIdentity> m_failedRemovals;
	std::unique_ptr<Utils::Async::DebouncedInvoker> m_removalRetry;
	int m_removalRetryDelayMs = 0;
	QVector<QMetaObject::Connection> m_connections;
};

} // namespace Backup::Internal
