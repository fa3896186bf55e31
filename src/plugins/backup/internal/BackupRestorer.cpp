// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/internal/BackupRestorer.hpp"

#include "backup/Constants.hpp"
#include "backup/api/EditorHostTypes.hpp"
#include "backup/api/IBackupStore.hpp"
#include "backup/api/IEditorHost.hpp"

#include <QtCore/QFileInfo>

namespace Backup::Internal {

namespace {

struct OpenStrategy final {
	Api::DocumentKind kind;
	const char* editorTypeId;
};

// Every kind opens seeded from the backup and dirty; file editors are told
// to take the seed instead of reading the disk.
constexpr OpenStrategy kOpenStrategies[] = {
	{Api::DocumentKind::Untitled, Constants::kEditorTypeUntitled},
	{Api::DocumentKind::FileBacked, Constants::kEditorTypeFile},
	{Api::DocumentKind::Virtual, Constants::kEditorTypeVirtual},
};

} // namespace

BackupRestorer::BackupRestorer(Api::IEditorHost* host, Api::IBackupStore* store, QObject* parent)
	: QObject(parent)
	, m_host(host)
	, m_store(store)
{
}

QString BackupRestorer::editorTypeFor(Api::DocumentKind kind)
{
	for (const OpenStrategy& strategy : kOpenStrategies) {
		if (strategy.kind == kind)
			return QString::fromLatin1(strategy.editorTypeId);
	}
	return {};
}

void BackupRestorer::run()
{
	if (m_running)
		return;

	m_result = {};
	m_pending.clear();

	if (!m_host || !m_store) {
		qCWarning(backuplog) << "BackupRestorer::run: editor host or store is missing";
		m_result.storeAvailable = false;
		emit storeUnavailable(QStringLiteral("No backup store is configured."));
		emit finished(m_result);
		return;
	}

	m_running = true;
	m_store->list(this, [this](const Api::BackupStatus& status, const Api::BackupEntryList& entries) {
		handleListed(status, entries);
	});
}

void BackupRestorer::handleListed(const Api::BackupStatus& status, const Api::BackupEntryList& entries)
{
	if (!status) {
		qCWarning(backuplog) << "BackupRestorer: cannot enumerate backups:" << status.message();
		m_result.storeAvailable = false;
		emit storeUnavailable(QStringLiteral("No backups available: %1").arg(status.message()));
		finish();
		return;
	}

	for (const Api::BackupEntryInfo& info : entries) {
		if (!info.identity.isValid()) {
			skip(info.key, QStringLiteral("%1: unresolvable identity \"%2\"")
							   .arg(Api::errorKindName(Api::BackupErrorKind::CorruptEntry), info.identityText));
			continue;
		}
		m_pending.enqueue(info);
	}

	qCInfo(backuplog) << "BackupRestorer:" << m_pending.size() << "backup(s) to restore";
	fetchNext();
}

void BackupRestorer::fetchNext()
{
	if (m_pending.isEmpty() || !m_store) {
		finish();
		return;
	}

	const QString key = m_pending.dequeue().key;
	m_store->get(key, this, [this, key](const Api::BackupStatus& status, const Api::BackupEntry& entry) {
		handleEntry(key, status, entry);
	});
}

void BackupRestorer::handleEntry(const QString& key, const Api::BackupStatus& status, const Api::BackupEntry& entry)
{
	if (!status)
		skip(key, QStringLiteral("%1: %2").arg(Api::errorKindName(status.code), status.message()));
	else
		restoreEntry(entry);

	fetchNext();
}

void BackupRestorer::restoreEntry(const Api::BackupEntry& entry)
{
	if (!m_host) {
		skip(entry.key, QStringLiteral("editor host is gone"));
		return;
	}

	reportOriginalChanges(entry);

	const Api::DocumentHandle existing = m_host->documentFor(entry.identity);
	if (existing.isValid()) {
		const Utils::Result attached = m_host->attachBackup(existing, entry.content, entry.meta.hints);
		if (!attached) {
			skip(entry.key, attached.message());
			return;
		}
		m_result.attached.push_back(entry.identity);
		qCInfo(backuplog) << "BackupRestorer: attached backup to open document" << entry.identity.toString();
		return;
	}

	Api::OpenDocumentRequest request;
	request.identity = entry.identity;
	request.editorTypeId = editorTypeFor(entry.identity.kind());
	request.contentSeed = entry.content;
	request.hints = entry.meta.hints;
	request.forceDirty = true;

	Api::DocumentHandle handle;
	const Utils::Result opened = m_host->openDocument(request, handle);
	if (!opened) {
		skip(entry.key, opened.message());
		return;
	}

	m_result.opened.push_back(entry.identity);
	qCInfo(backuplog) << "BackupRestorer: reopened" << entry.identity.toString();
}

void BackupRestorer::reportOriginalChanges(const Api::BackupEntry& entry)
{
	if (entry.identity.kind() != Api::DocumentKind::FileBacked || entry.meta.originalSize < 0)
		return;

	const QFileInfo original(entry.identity.localFilePath());
	if (!original.exists()) {
		qCInfo(backuplog) << "BackupRestorer: original of" << entry.identity.toString()
						  << "no longer exists; restoring backup content";
		return;
	}

	const bool sizeChanged = original.size() != entry.meta.originalSize;
	const bool timeChanged = entry.meta.originalModified.isValid()
		&& original.lastModified().toUTC() != entry.meta.originalModified;
	if (sizeChanged || timeChanged) {
		qCInfo(backuplog) << "BackupRestorer:" << entry.identity.toString()
						  << "changed on disk after the backup was taken; backup content wins";
	}
}

void BackupRestorer::skip(const QString& key, const QString& reason)
{
	qCWarning(backuplog).noquote() << QStringLiteral("BackupRestorer: skipping entry %1 (%2)").arg(key, reason);
	m_result.skippedKeys.push_back(key);
}

void BackupRestorer::finish()
{
	m_running = false;
	m_pending.clear();

	qCInfo(backuplog) << "BackupRestorer: restored" << m_result.count() << "document(s),"
					  << m_result.skippedKeys.size() << "skipped";
	emit finished(m_result);
}

} // namespace Backup::Internal
