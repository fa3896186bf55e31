// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/BackupTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QQueue>
#include <QtCore/QString>

namespace Backup::Api {
class IBackupStore;
class IEditorHost;
}

namespace Backup::Internal {

// Turns the entries of a store back into open, dirty documents. A document
// that is already open receives the backup content instead of a second
// editor. Entries are never deleted here; the tracker takes over once the
// documents are open.
class BACKUP_EXPORT BackupRestorer final : public QObject {
	Q_OBJECT

public:
	BackupRestorer(Api::IEditorHost* host, Api::IBackupStore* store, QObject* parent = nullptr);

	// Asynchronous; finished() reports the outcome. Ignored while running.
	void run();
	bool isRunning() const noexcept { return m_running; }

	const Api::RestoreResult& lastResult() const noexcept { return m_result; }

	static QString editorTypeFor(Api::DocumentKind kind);

signals:
	void finished(const Backup::Api::RestoreResult& result);
	void storeUnavailable(const QString& message);

private:
	void handleListed(const Api::BackupStatus& status, const Api::BackupEntryList& entries);
	void fetchNext();
	void handleEntry(const QString& key, const Api::BackupStatus& status, const Api::BackupEntry& entry);
	void restoreEntry(const Api::BackupEntry& entry);
	void skip(const QString& key, const QString& reason);
	void finish();

	static void reportOriginalChanges(const Api::BackupEntry& entry);

	QPointer<Api::IEditorHost> m_host;
	QPointer<Api::IBackupStore> m_store;
	QQueue<Api::BackupEntryInfo> m_pending;
	Api::RestoreResult m_result;
	bool m_running = false;
};

} // namespace Backup::Internal
