// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/internal/BackupStoreImpl.hpp"

#include "backup/BackupGlobal.hpp"
#include "backup/Constants.hpp"
#include "backup/internal/BackupEntryCodec.hpp"

#include <utils/filesystem/AtomicFileUtils.hpp>

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonObject>
#include <QtCore/QSet>

#include <algorithm>
#include <exception>
#include <utility>

namespace Backup::Internal {

using Api::BackupErrorKind;
using Api::BackupStatus;

namespace {

const QString kIndexVersionKey = QStringLiteral("version");
const QString kIndexEntriesKey = QStringLiteral("entries");

// Identity text plus compact metadata; anything longer is not a header.
constexpr qint64 kMaxHeaderBytes = 64 * 1024;

BackupStatus unavailable(const QString& what, const Utils::Result& cause)
{
	return BackupStatus::failure(BackupErrorKind::StoreUnavailable,
								 QStringLiteral("%1: %2").arg(what, cause.message()));
}

// Worker failures that surface as exceptions (out of memory on a huge entry)
// still complete the call.
BackupStatus failedWith(const char* operation, const std::exception& e)
{
	qCWarning(backuplog) << "BackupStore:" << operation << "failed:" << e.what();
	return BackupStatus::failure(BackupErrorKind::StoreUnavailable,
								 QStringLiteral("%1 failed: %2").arg(QString::fromLatin1(operation),
																	  QString::fromLocal8Bit(e.what())));
}

} // namespace

BackupStoreImpl::BackupStoreImpl(QString backupHome,
								 QString workspaceRoot,
								 IdentityHasher hasher,
								 QObject* parent)
	: Api::IBackupStore(parent)
	, m_backupHome(QDir::cleanPath(std::move(backupHome)))
	, m_workspaceRoot(std::move(workspaceRoot))
	, m_hasher(hasher)
	, m_maxEntryBytes(Constants::kMaxEntryBytes)
	, m_state(std::make_shared<WorkerState>())
{
	m_workspaceKey = m_hasher.workspaceKey(m_workspaceRoot);

	const QDir home(m_backupHome);
	m_layout.workspaceDir = home.filePath(m_workspaceKey);
	m_layout.entriesDir = QDir(m_layout.workspaceDir).filePath(QString::fromLatin1(Constants::kEntriesDirName));
	m_layout.indexFile = QDir(m_layout.workspaceDir).filePath(QString::fromLatin1(Constants::kIndexFileName));
}

BackupStoreImpl::~BackupStoreImpl()
{
	m_queue.waitForIdle();
}

QString BackupStoreImpl::workspaceKey() const
{
	return m_workspaceKey;
}

QString BackupStoreImpl::keyFor(const Api::DocumentIdentity& identity) const
{
	return m_hasher.keyFor(identity);
}

QString BackupStoreImpl::workspaceDir() const
{
	return m_layout.workspaceDir;
}

QString BackupStoreImpl::entryPath(const QString& key) const
{
	return QDir(m_layout.entriesDir).filePath(key);
}

void BackupStoreImpl::setMaxEntryBytes(qint64 bytes)
{
	m_maxEntryBytes = bytes > 0 ? bytes : Constants::kMaxEntryBytes;
}

bool BackupStoreImpl::waitForIdle(int msecs)
{
	return m_queue.waitForIdle(msecs);
}

void BackupStoreImpl::put(const Api::BackupSnapshot& snapshot, QObject* context, PutCallback done)
{
	const QString key = m_hasher.keyFor(snapshot.identity);
	if (key.isEmpty()) {
		qCWarning(backuplog) << "BackupStore::put: refusing snapshot with invalid identity";
		Utils::Async::run<PutOutcome>(
			context,
			[] {
				return PutOutcome{BackupStatus::failure(BackupErrorKind::NotFound,
														QStringLiteral("invalid document identity")),
								  QString()};
			},
			[done = std::move(done)](PutOutcome outcome) {
				if (done)
					done(outcome.status, outcome.key);
			},
			m_queue.pool());
		return;
	}

	Utils::Async::run<PutOutcome>(
		context,
		[layout = m_layout, state = m_state, hasher = m_hasher, key, snapshot, maxBytes = m_maxEntryBytes] {
			try {
				return doPut(layout, *state, hasher, key, snapshot, maxBytes);
			} catch (const std::exception& e) {
				return PutOutcome{failedWith("put", e), key};
			}
		},
		[done = std::move(done)](PutOutcome outcome) {
			if (done)
				done(outcome.status, outcome.key);
		},
		m_queue.pool());
}

void BackupStoreImpl::get(const QString& key, QObject* context, GetCallback done)
{
	Utils::Async::run<GetOutcome>(
		context,
		[layout = m_layout, hasher = m_hasher, key, maxBytes = m_maxEntryBytes] {
			try {
				return doGet(layout, hasher, key, maxBytes);
			} catch (const std::exception& e) {
				GetOutcome outcome;
				outcome.status = failedWith("get", e);
				outcome.entry.key = key;
				return outcome;
			}
		},
		[done = std::move(done)](GetOutcome outcome) {
			if (done)
				done(outcome.status, outcome.entry);
		},
		m_queue.pool());
}

void BackupStoreImpl::list(QObject* context, ListCallback done)
{
	Utils::Async::run<ListOutcome>(
		context,
		[layout = m_layout, state = m_state] {
			try {
				return doList(layout, *state);
			} catch (const std::exception& e) {
				return ListOutcome{failedWith("list", e), {}};
			}
		},
		[done = std::move(done)](ListOutcome outcome) {
			if (done)
				done(outcome.status, outcome.entries);
		},
		m_queue.pool());
}

void BackupStoreImpl::remove(const QString& key, QObject* context, StatusCallback done)
{
	Utils::Async::run<BackupStatus>(
		context,
		[layout = m_layout, state = m_state, key] {
			try {
				return doRemove(layout, *state, key);
			} catch (const std::exception& e) {
				return failedWith("remove", e);
			}
		},
		[done = std::move(done)](BackupStatus status) {
			if (done)
				done(status);
		},
		m_queue.pool());
}

void BackupStoreImpl::clear(QObject* context, StatusCallback done)
{
	Utils::Async::run<BackupStatus>(
		context,
		[layout = m_layout, state = m_state] {
			try {
				return doClear(layout, *state);
			} catch (const std::exception& e) {
				return failedWith("clear", e);
			}
		},
		[done = std::move(done)](BackupStatus status) {
			if (done)
				done(status);
		},
		m_queue.pool());
}

void BackupStoreImpl::ensureIndexLoaded(const Layout& layout, WorkerState& state)
{
	if (state.indexLoaded)
		return;

	state.indexLoaded = true;
	state.index.clear();

	if (!QFileInfo::exists(layout.indexFile))
		return;

	QString error;
	const QJsonObject root = Utils::AtomicFileUtils::readObject(layout.indexFile, &error);
	if (!error.isEmpty()) {
		// Entries carry their own identity, so the index can be rebuilt.
		qCWarning(backuplog) << "BackupStore: index is unreadable, rebuilding from entries:" << error;
		return;
	}

	const QJsonObject entries = root.value(kIndexEntriesKey).toObject();
	for (auto it = entries.begin(); it != entries.end(); ++it) {
		if (IdentityHasher::isValidKey(it.key()))
			state.index.insert(it.key(), it.value().toString());
	}
}

Utils::Result BackupStoreImpl::saveIndex(const Layout& layout, const WorkerState& state)
{
	QJsonObject entries;
	for (auto it = state.index.cbegin(); it != state.index.cend(); ++it)
		entries.insert(it.key(), it.value());

	QJsonObject root;
	root.insert(kIndexVersionKey, Constants::kIndexFormatVersion);
	root.insert(kIndexEntriesKey, entries);
	return Utils::AtomicFileUtils::writeObjectAtomic(layout.indexFile, root);
}

BackupStoreImpl::PutOutcome BackupStoreImpl::doPut(const Layout& layout,
												   WorkerState& state,
												   const IdentityHasher& hasher,
												   const QString& key,
												   const Api::BackupSnapshot& snapshot,
												   qint64 maxEntryBytes)
{
	ensureIndexLoaded(layout, state);

	const QString identityText = snapshot.identity.toString();
	const auto existing = state.index.constFind(key);
	if (existing != state.index.cend() && existing.value() != identityText) {
		const Api::DocumentIdentity previous = Api::DocumentIdentity::parse(existing.value());
		if (!hasher.sameDocument(previous, snapshot.identity)) {
			qCWarning(backuplog).noquote()
				<< QStringLiteral("BackupStore: %1: key %2 already belongs to %3, replacing with %4")
					   .arg(Api::errorKindName(BackupErrorKind::IdentityCollision),
							key, existing.value(), identityText);
		}
	}

	Api::BackupEntryMeta meta;
	meta.hints = snapshot.hints;
	meta.version = snapshot.version;
	meta.savedAt = QDateTime::currentDateTimeUtc();
	if (snapshot.identity.kind() == Api::DocumentKind::FileBacked) {
		const QFileInfo original(snapshot.identity.localFilePath());
		if (original.exists() && original.isFile()) {
			meta.originalSize = original.size();
			meta.originalModified = original.lastModified().toUTC();
		}
	}

	const QString path = QDir(layout.entriesDir).filePath(key);
	const QByteArray bytes = BackupEntryCodec::encode(identityText, meta, snapshot.content);
	if (bytes.size() > maxEntryBytes) {
		return {BackupStatus::failure(BackupErrorKind::StoreUnavailable,
									  QStringLiteral("backup of %1 is too large (%2 bytes, limit %3)")
										  .arg(identityText)
										  .arg(bytes.size())
										  .arg(maxEntryBytes)),
				key};
	}

	const Utils::Result written = Utils::AtomicFileUtils::writeBytesAtomic(path, bytes);
	if (!written)
		return {unavailable(QStringLiteral("cannot write backup entry"), written), key};

	if (existing == state.index.cend() || existing.value() != identityText) {
		state.index.insert(key, identityText);
		const Utils::Result indexed = saveIndex(layout, state);
		if (!indexed) {
			// The entry itself is durable and lists it through its header.
			qCWarning(backuplog) << "BackupStore: cannot update index:" << indexed.message();
		}
	}

	qCDebug(backuplog) << "BackupStore: wrote" << key << "version" << snapshot.version
					   << "(" << bytes.size() << "bytes )";
	return {BackupStatus::success(), key};
}

BackupStoreImpl::GetOutcome BackupStoreImpl::doGet(const Layout& layout,
												   const IdentityHasher& hasher,
												   const QString& key,
												   qint64 maxEntryBytes)
{
	GetOutcome outcome;
	outcome.entry.key = key;

	if (!IdentityHasher::isValidKey(key)) {
		outcome.status = BackupStatus::failure(BackupErrorKind::NotFound,
											   QStringLiteral("malformed backup key: %1").arg(key));
		return outcome;
	}

	const QString path = QDir(layout.entriesDir).filePath(key);
	if (!QFileInfo::exists(path)) {
		outcome.status = BackupStatus::failure(BackupErrorKind::NotFound,
											   QStringLiteral("no backup entry for key %1").arg(key));
		return outcome;
	}

	QByteArray bytes;
	const Utils::Result read = Utils::AtomicFileUtils::readBytes(path, bytes, maxEntryBytes);
	if (!read) {
		outcome.status = unavailable(QStringLiteral("cannot read backup entry"), read);
		return outcome;
	}

	const BackupEntryCodec::Decoded decoded = BackupEntryCodec::decode(bytes);
	if (!decoded.ok) {
		outcome.status = BackupStatus::failure(BackupErrorKind::CorruptEntry,
											   QStringLiteral("entry %1: %2").arg(key, decoded.error));
		return outcome;
	}

	const Api::DocumentIdentity identity = Api::DocumentIdentity::parse(decoded.identityText);
	if (!identity.isValid()) {
		outcome.status = BackupStatus::failure(
			BackupErrorKind::CorruptEntry,
			QStringLiteral("entry %1: unparsable identity \"%2\"").arg(key, decoded.identityText));
		return outcome;
	}

	if (hasher.keyFor(identity) != key) {
		outcome.status = BackupStatus::failure(
			BackupErrorKind::CorruptEntry,
			QStringLiteral("entry %1: identity %2 does not hash to its key").arg(key, decoded.identityText));
		return outcome;
	}

	outcome.entry.identity = identity;
	outcome.entry.content = decoded.content;
	outcome.entry.meta = decoded.meta;
	outcome.status = BackupStatus::success();
	return outcome;
}

BackupStoreImpl::ListOutcome BackupStoreImpl::doList(const Layout& layout, WorkerState& state)
{
	ListOutcome outcome;

	const QDir entriesDir(layout.entriesDir);
	if (!entriesDir.exists()) {
		if (QFileInfo::exists(layout.entriesDir)) {
			outcome.status = BackupStatus::failure(
				BackupErrorKind::StoreUnavailable,
				QStringLiteral("backup area is not a directory: %1").arg(layout.entriesDir));
			return outcome;
		}
		outcome.status = BackupStatus::success();
		return outcome;
	}

	if (!QFileInfo(layout.entriesDir).isReadable()) {
		outcome.status = BackupStatus::failure(
			BackupErrorKind::StoreUnavailable,
			QStringLiteral("backup area is not readable: %1").arg(layout.entriesDir));
		return outcome;
	}

	ensureIndexLoaded(layout, state);

	QStringList keys = entriesDir.entryList(QDir::Files | QDir::Hidden, QDir::Name);
	keys.erase(std::remove_if(keys.begin(), keys.end(),
							  [](const QString& name) { return !IdentityHasher::isValidKey(name); }),
			   keys.end());

	const QSet<QString> present(keys.cbegin(), keys.cend());
	bool indexChanged = false;

	for (const QString& key : std::as_const(keys)) {
		Api::BackupEntryInfo info;
		info.key = key;

		const auto indexed = state.index.constFind(key);
		if (indexed != state.index.cend()) {
			info.identityText = indexed.value();
		} else {
			QByteArray line;
			const Utils::Result read = Utils::AtomicFileUtils::readFirstLine(entriesDir.filePath(key), line,
																			  kMaxHeaderBytes);
			const BackupEntryCodec::Decoded header =
				read ? BackupEntryCodec::decodeHeader(line) : BackupEntryCodec::Decoded{};
			if (header.ok) {
				info.identityText = header.identityText;
				state.index.insert(key, header.identityText);
				indexChanged = true;
				qCInfo(backuplog) << "BackupStore: recovered index line for" << key;
			} else {
				qCWarning(backuplog) << "BackupStore: entry" << key << "has no readable header";
			}
		}

		info.identity = Api::DocumentIdentity::parse(info.identityText);
		outcome.entries.push_back(info);
	}

	for (auto it = state.index.begin(); it != state.index.end();) {
		if (!present.contains(it.key())) {
			qCInfo(backuplog) << "BackupStore: pruning stale index line" << it.key();
			it = state.index.erase(it);
			indexChanged = true;
		} else {
			++it;
		}
	}

	if (indexChanged) {
		const Utils::Result saved = saveIndex(layout, state);
		if (!saved)
			qCWarning(backuplog) << "BackupStore: cannot rewrite index:" << saved.message();
	}

	outcome.status = BackupStatus::success();
	return outcome;
}

BackupStatus BackupStoreImpl::doRemove(const Layout& layout, WorkerState& state, const QString& key)
{
	if (!IdentityHasher::isValidKey(key))
		return BackupStatus::success();

	const Utils::Result removed = Utils::AtomicFileUtils::removeFile(QDir(layout.entriesDir).filePath(key));
	if (!removed)
		return unavailable(QStringLiteral("cannot delete backup entry"), removed);

	ensureIndexLoaded(layout, state);
	if (state.index.remove(key)) {
		const Utils::Result saved = saveIndex(layout, state);
		if (!saved)
			qCWarning(backuplog) << "BackupStore: cannot update index:" << saved.message();
	}

	qCDebug(backuplog) << "BackupStore: removed" << key;
	return BackupStatus::success();
}

BackupStatus BackupStoreImpl::doClear(const Layout& layout, WorkerState& state)
{
	state.index.clear();
	state.indexLoaded = true;

	QDir workspaceDir(layout.workspaceDir);
	if (!workspaceDir.exists())
		return BackupStatus::success();

	if (!workspaceDir.removeRecursively()) {
		// Anything left behind is still listed by the next list().
		state.indexLoaded = false;
		return BackupStatus::failure(
			BackupErrorKind::StoreUnavailable,
			QStringLiteral("cannot remove backup area %1").arg(layout.workspaceDir));
	}

	qCInfo(backuplog) << "BackupStore: cleared" << layout.workspaceDir;
	return BackupStatus::success();
}

} // namespace Backup::Internal
