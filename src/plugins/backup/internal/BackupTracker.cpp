// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/internal/BackupTracker.hpp"

#include "backup/api/IBackupStore.hpp"
#include "backup/api/IEditorHost.hpp"

#include <QtCore/QStringList>
#include <QtCore/QtGlobal>

#include <algorithm>
#include <utility>

namespace Backup::Internal {

using Api::TrackedState;

BackupTracker::BackupTracker(Api::IEditorHost* host, Api::IBackupStore* store, QObject* parent)
	: QObject(parent)
	, m_host(host)
	, m_store(store)
	, m_removalRetry(std::make_unique<Utils::Async::DebouncedInvoker>())
{
	m_removalRetry->setAction([this] { retryFailedRemovals(); });
}

BackupTracker::~BackupTracker()
{
	stop();
}

void BackupTracker::setOptions(const BackupTrackerOptions& options)
{
	m_options = options;
	m_options.debounceMs = std::clamp(m_options.debounceMs, Constants::kMinDebounceMs, Constants::kMaxDebounceMs);
	m_options.maxDelayMs = std::max(m_options.maxDelayMs, 0);
	m_options.retryDelayMs = std::clamp(m_options.retryDelayMs, 1, Constants::kMaxRetryDelayCeilingMs);
	m_options.maxRetryDelayMs =
		std::clamp(m_options.maxRetryDelayMs, m_options.retryDelayMs, Constants::kMaxRetryDelayCeilingMs);

	for (auto& [key, doc] : m_documents)
		applyOptions(*doc);
}

void BackupTracker::applyOptions(TrackedDocument& doc) const
{
	doc.timer->setDelayMs(m_options.debounceMs);
	doc.timer->setMaxDelayMs(m_options.maxDelayMs);
}

void BackupTracker::start()
{
	if (m_running)
		return;

	if (!m_host || !m_store) {
		qCWarning(backuplog) << "BackupTracker::start: editor host or store is missing";
		return;
	}

	m_running = true;
	m_connections.push_back(connect(m_host.data(), &Api::IEditorHost::documentOpened,
									this, &BackupTracker::handleDocumentOpened));
	m_connections.push_back(connect(m_host.data(), &Api::IEditorHost::dirtyStateChanged,
									this, &BackupTracker::handleDirtyStateChanged));
	m_connections.push_back(connect(m_host.data(), &Api::IEditorHost::contentChanged,
									this, &BackupTracker::handleContentChanged));
	m_connections.push_back(connect(m_host.data(), &Api::IEditorHost::documentClosed,
									this, &BackupTracker::handleDocumentClosed));

	const QVector<Api::DocumentHandle> open = m_host->openDocuments();
	for (const Api::DocumentHandle& handle : open)
		track(handle);

	qCInfo(backuplog) << "BackupTracker: started," << trackedCount() << "document(s) tracked";
}

void BackupTracker::stop()
{
	if (!m_running)
		return;

	m_running = false;
	for (const QMetaObject::Connection& connection : std::as_const(m_connections))
		disconnect(connection);
	m_connections.clear();

	for (auto& [key, doc] : m_documents)
		doc->timer->cancel();
	m_documents.clear();
	m_keyByHandleId.clear();

	m_removalRetry->cancel();
	m_failedRemovals.clear();
	m_removalRetryDelayMs = 0;

	qCInfo(backuplog) << "BackupTracker: stopped";
}

void BackupTracker::track(const Api::DocumentHandle& handle)
{
	if (!handle.isValid() || !m_store || !m_host)
		return;

	const QString key = m_store->keyFor(handle.identity);
	if (key.isEmpty())
		return;

	if (m_documents.find(key) != m_documents.end()) {
		m_keyByHandleId.insert(handle.id, key);
		return;
	}

	auto doc = std::make_unique<TrackedDocument>();
	doc->handle = handle;
	doc->key = key;
	doc->timer = std::make_unique<Utils::Async::DebouncedInvoker>();
	doc->timer->setAction([this, key] { writeNow(key); });
	applyOptions(*doc);

	TrackedDocument& ref = *doc;
	m_documents.emplace(key, std::move(doc));
	m_keyByHandleId.insert(handle.id, key);

	qCDebug(backuplog) << "BackupTracker: tracking" << handle.identity.toString();

	// A document that is dirty on arrival may already own an entry (restored
	// documents do), so its eventual clean transition must delete it.
	if (m_host->isDirty(handle)) {
		ref.hasStoredEntry = true;
		markDirty(ref);
	}
}

void BackupTracker::untrack(const Api::DocumentHandle& handle)
{
	TrackedDocument* doc = documentForHandle(handle);
	if (!doc)
		return;

	doc->timer->cancel();

	const QString key = doc->key;
	const Api::DocumentIdentity identity = doc->handle.identity;
	const bool needsDelete = doc->state != TrackedState::Clean || doc->hasStoredEntry;

	for (auto it = m_keyByHandleId.begin(); it != m_keyByHandleId.end();) {
		if (it.value() == key)
			it = m_keyByHandleId.erase(it);
		else
			++it;
	}
	m_documents.erase(key);

	if (needsDelete)
		removeEntry(key, identity);

	qCDebug(backuplog) << "BackupTracker: untracked" << identity.toString();
}

void BackupTracker::flush()
{
	QStringList keys;
	for (const auto& [key, doc] : m_documents) {
		if (doc->state == TrackedState::Dirty)
			keys.push_back(key);
	}

	for (const QString& key : std::as_const(keys)) {
		if (TrackedDocument* doc = documentByKey(key)) {
			doc->timer->cancel();
			writeNow(key);
		}
	}
}

Api::TrackedState BackupTracker::stateFor(const Api::DocumentIdentity& identity) const
{
	if (!m_store)
		return TrackedState::Untracked;

	const TrackedDocument* doc = documentByKey(m_store->keyFor(identity));
	return doc ? doc->state : TrackedState::Untracked;
}

bool BackupTracker::isTracked(const Api::DocumentIdentity& identity) const
{
	return stateFor(identity) != TrackedState::Untracked;
}

int BackupTracker::trackedCount() const
{
	return static_cast<int>(m_documents.size());
}

int BackupTracker::pendingCount() const
{
	return static_cast<int>(std::count_if(m_documents.begin(), m_documents.end(), [](const auto& entry) {
		return entry.second->state == TrackedState::Dirty || entry.second->state == TrackedState::PendingWrite;
	}));
}

BackupTracker::TrackedDocument* BackupTracker::documentByKey(const QString& key) const
{
	if (key.isEmpty())
		return nullptr;

	const auto it = m_documents.find(key);
	return it == m_documents.end() ? nullptr : it->second.get();
}

BackupTracker::TrackedDocument* BackupTracker::documentForHandle(const Api::DocumentHandle& handle) const
{
	const QString key = m_keyByHandleId.value(handle.id);
	if (!key.isEmpty())
		return documentByKey(key);

	if (!handle.identity.isValid() || !m_store)
		return nullptr;
	return documentByKey(m_store->keyFor(handle.identity));
}

void BackupTracker::handleDocumentOpened(const Api::DocumentHandle& handle)
{
	track(handle);
}

void BackupTracker::handleDirtyStateChanged(const Api::DocumentHandle& handle, bool dirty)
{
	TrackedDocument* doc = documentForHandle(handle);
	if (!doc) {
		track(handle);
		return;
	}

	if (dirty)
		markDirty(*doc);
	else
		markClean(*doc);
}

void BackupTracker::handleContentChanged(const Api::DocumentHandle& handle)
{
	TrackedDocument* doc = documentForHandle(handle);
	if (!doc) {
		track(handle);
		return;
	}

	if (doc->state != TrackedState::Clean || (m_host && m_host->isDirty(doc->handle)))
		markDirty(*doc);
}

void BackupTracker::handleDocumentClosed(const Api::DocumentHandle& handle)
{
	untrack(handle);
}

void BackupTracker::markDirty(TrackedDocument& doc)
{
	++doc.generation;
	doc.state = TrackedState::Dirty;

	// A delete that failed earlier must not later wipe the new backup.
	m_failedRemovals.remove(doc.key);

	doc.timer->trigger();
}

void BackupTracker::markClean(TrackedDocument& doc)
{
	doc.timer->cancel();
	++doc.generation;
	++doc.epoch;
	doc.retryDelayMs = 0;

	const bool wasClean = doc.state == TrackedState::Clean;
	doc.state = TrackedState::Clean;

	if (doc.hasStoredEntry) {
		doc.hasStoredEntry = false;
		removeEntry(doc.key, doc.handle.identity);
	} else if (!wasClean) {
		qCDebug(backuplog) << "BackupTracker: clean before any write" << doc.handle.identity.toString();
	}
}

void BackupTracker::writeNow(const QString& key)
{
	TrackedDocument* doc = documentByKey(key);
	if (!doc || doc->state == TrackedState::Clean || !m_host || !m_store)
		return;

	const Api::DocumentSnapshot snapshot = m_host->snapshot(doc->handle);
	if (!snapshot.valid) {
		qCWarning(backuplog) << "BackupTracker: no snapshot available for" << doc->handle.identity.toString();
		scheduleRetry(*doc);
		return;
	}

	Api::BackupSnapshot backup;
	backup.identity = doc->handle.identity;
	backup.content = snapshot.content;
	backup.hints = snapshot.hints;
	backup.version = ++m_nextVersion;

	doc->state = TrackedState::PendingWrite;
	doc->hasStoredEntry = true;

	const quint64 generation = doc->generation;
	const quint64 epoch = doc->epoch;
	const quint64 version = backup.version;
	const Api::DocumentIdentity identity = backup.identity;

	m_store->put(backup, this,
				 [this, key, generation, epoch, version, identity](const Api::BackupStatus& status,
																   const QString&) {
					 handlePutFinished(key, generation, epoch, status);
					 if (status)
						 emit backupWritten(identity, version);
				 });
}

void BackupTracker::handlePutFinished(const QString& key,
									  quint64 generation,
									  quint64 epoch,
									  const Api::BackupStatus& status)
{
	TrackedDocument* doc = documentByKey(key);

	// Untracked or cleaned meanwhile: the delete was queued behind this write.
	if (!doc || doc->epoch != epoch)
		return;

	if (!status) {
		qCWarning(backuplog).noquote()
			<< QStringLiteral("BackupTracker: backup of %1 failed (%2): %3")
				   .arg(doc->handle.identity.toString(), Api::errorKindName(status.code), status.message());
		emit backupFailed(doc->handle.identity, status.message());

		// A newer edit already restarted the debounce.
		if (doc->generation == generation) {
			doc->state = TrackedState::Dirty;
			scheduleRetry(*doc);
		}
		return;
	}

	doc->retryDelayMs = 0;
	if (doc->generation == generation && doc->state == TrackedState::PendingWrite)
		doc->state = TrackedState::BackedUp;
}

void BackupTracker::scheduleRetry(TrackedDocument& doc)
{
	doc.retryDelayMs = doc.retryDelayMs == 0
		? m_options.retryDelayMs
		: std::min(doc.retryDelayMs * 2, m_options.maxRetryDelayMs);
	doc.state = TrackedState::Dirty;
	doc.timer->triggerAfter(doc.retryDelayMs);

	qCDebug(backuplog) << "BackupTracker: retrying" << doc.handle.identity.toString()
					   << "in" << doc.retryDelayMs << "ms";
}

void BackupTracker::removeEntry(const QString& key, const Api::DocumentIdentity& identity)
{
	if (!m_store)
		return;

	m_store->remove(key, this, [this, key, identity](const Api::BackupStatus& status) {
		if (status) {
			if (m_failedRemovals.isEmpty())
				m_removalRetryDelayMs = 0;
			emit backupDiscarded(identity);
			return;
		}

		qCWarning(backuplog).noquote()
			<< QStringLiteral("BackupTracker: cannot delete backup of %1: %2")
				   .arg(identity.toString(), status.message());
		emit backupFailed(identity, status.message());

		if (!m_running)
			return;

		const TrackedDocument* doc = documentByKey(key);
		if (doc && doc->state != TrackedState::Clean)
			return;

		m_failedRemovals.insert(key, identity);
		m_removalRetryDelayMs = m_removalRetryDelayMs == 0
			? m_options.retryDelayMs
			: std::min(m_removalRetryDelayMs * 2, m_options.maxRetryDelayMs);
		m_removalRetry->triggerAfter(m_removalRetryDelayMs);
	});
}

void BackupTracker::retryFailedRemovals()
{
	const QHash<QString, Api::DocumentIdentity> pending = std::exchange(m_failedRemovals, {});
	if (pending.isEmpty()) {
		m_removalRetryDelayMs = 0;
		return;
	}

	for (auto it = pending.cbegin(); it != pending.cend(); ++it) {
		const TrackedDocument* doc = documentByKey(it.key());
		if (doc && doc->state != TrackedState::Clean)
			continue;
		removeEntry(it.key(), it.value());
	}
}

} // namespace Backup::Internal
