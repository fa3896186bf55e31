// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/api/IBackupStore.hpp"
#include "backup/identity/IdentityHasher.hpp"

#include <utils/async/AsyncTask.hpp>

#include <QtCore/QHash>
#include <QtCore/QString>

#include <memory>

namespace Backup::Internal {

// File-backed store for one workspace:
//
//   <backupHome>/<workspaceKey>/index.json     key -> identity text
//   <backupHome>/<workspaceKey>/entries/<key>  header line + content
//
// All disk access happens on a private one-thread pool, which keeps the
// operations of one store strictly in submission order.
class BACKUP_EXPORT BackupStoreImpl final : public Api::IBackupStore {
	Q_OBJECT

public:
	BackupStoreImpl(QString backupHome,
					QString workspaceRoot,
					IdentityHasher hasher = IdentityHasher(),
					QObject* parent = nullptr);
	~BackupStoreImpl() override;

	QString workspaceKey() const override;
	QString keyFor(const Api::DocumentIdentity& identity) const override;

	const QString& backupHome() const noexcept { return m_backupHome; }
	const QString& workspaceRoot() const noexcept { return m_workspaceRoot; }
	QString workspaceDir() const;
	QString entryPath(const QString& key) const;

	// Puts of larger entries fail instead of writing something get() would
	// refuse to read back.
	void setMaxEntryBytes(qint64 bytes);
	qint64 maxEntryBytes() const noexcept { return m_maxEntryBytes; }

	void put(const Api::BackupSnapshot& snapshot, QObject* context, PutCallback done) override;
	void get(const QString& key, QObject* context, GetCallback done) override;
	void list(QObject* context, ListCallback done) override;
	void remove(const QString& key, QObject* context, StatusCallback done) override;
	void clear(QObject* context, StatusCallback done) override;

	// Blocks until every queued operation has run. Completions are still
	// delivered through the event loop.
	bool waitForIdle(int msecs = -1);

private:
	struct Layout final {
		QString workspaceDir;
		QString entriesDir;
		QString indexFile;
	};

	// Touched only from the worker thread.
	struct WorkerState final {
		bool indexLoaded = false;
		QHash<QString, QString> index;
	};

	struct PutOutcome final {
		Api::BackupStatus status;
		QString key;
	};

	struct GetOutcome final {
		Api::BackupStatus status;
		Api::BackupEntry entry;
	};

	struct ListOutcome final {
		Api::BackupStatus status;
		Api::BackupEntryList entries;
	};

	static PutOutcome doPut(const Layout& layout, WorkerState& state, const IdentityHasher& hasher,
							const QString& key, const Api::BackupSnapshot& snapshot, qint64 maxEntryBytes);
	static GetOutcome doGet(const Layout& layout, const IdentityHasher& hasher, const QString& key,
							qint64 maxEntryBytes);
	static ListOutcome doList(const Layout& layout, WorkerState& state);
	static Api::BackupStatus doRemove(const Layout& layout, WorkerState& state, const QString& key);
	static Api::BackupStatus doClear(const Layout& layout, WorkerState& state);

	static void ensureIndexLoaded(const Layout& layout, WorkerState& state);
	static Utils::Result saveIndex(const Layout& layout, const WorkerState& state);

	QString m_backupHome;
	QString m_workspaceRoot;
	IdentityHasher m_hasher;
	QString m_workspaceKey;
	Layout m_layout;
	qint64 m_maxEntryBytes = 0;
	std::shared_ptr<WorkerState> m_state;
	Utils::Async::SerialTaskQueue m_queue;
};

} // namespace Backup::Internal
