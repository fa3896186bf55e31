// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/state/BackupWorkspaceRegistry.hpp"

#include "backup/Constants.hpp"

#include <utils/filesystem/AtomicFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>

#include <algorithm>
#include <utility>

namespace Backup {

namespace {

const QString kVersionKey = QStringLiteral("version");
const QString kWorkspacesKey = QStringLiteral("workspaces");
const QString kRootKey = QStringLiteral("root");
const QString kKeyKey = QStringLiteral("key");

QString cleanRoot(const QString& root)
{
	const QString trimmed = root.trimmed();
	return trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);
}

} // namespace

BackupWorkspaceRegistry::BackupWorkspaceRegistry(QString backupHome, IdentityHasher hasher)
	: m_backupHome(std::move(backupHome))
	, m_hasher(hasher)
{
}

QString BackupWorkspaceRegistry::filePath() const
{
	return QDir(m_backupHome).filePath(QString::fromLatin1(Constants::kWorkspacesFileName));
}

QVector<BackupWorkspaceRegistry::Record> BackupWorkspaceRegistry::workspaces() const
{
	const QString path = filePath();
	if (!QFileInfo::exists(path))
		return {};

	QString error;
	const QJsonObject root = Utils::AtomicFileUtils::readObject(path, &error);
	if (!error.isEmpty()) {
		qCWarning(backuplog) << "BackupWorkspaceRegistry: treating registry as empty:" << error;
		return {};
	}

	QVector<Record> records;
	const QJsonArray entries = root.value(kWorkspacesKey).toArray();
	for (const QJsonValue& value : entries) {
		const QJsonObject object = value.toObject();
		Record record{object.value(kRootKey).toString(), object.value(kKeyKey).toString()};
		if (record.key.isEmpty())
			continue;
		records.push_back(std::move(record));
	}
	return records;
}

BackupWorkspaceRegistry::Record BackupWorkspaceRegistry::findByRoot(const QString& workspaceRoot) const
{
	return findByKey(m_hasher.workspaceKey(cleanRoot(workspaceRoot)));
}

BackupWorkspaceRegistry::Record BackupWorkspaceRegistry::findByKey(const QString& key) const
{
	const QVector<Record> records = workspaces();
	const auto it = std::find_if(records.cbegin(), records.cend(),
								 [&key](const Record& record) { return record.key == key; });
	return it == records.cend() ? Record{} : *it;
}

Utils::Result BackupWorkspaceRegistry::registerWorkspace(const QString& workspaceRoot)
{
	const QString root = cleanRoot(workspaceRoot);
	const QString key = m_hasher.workspaceKey(root);

	QVector<Record> records = workspaces();
	const auto it = std::find_if(records.begin(), records.end(),
								 [&key](const Record& record) { return record.key == key; });
	if (it != records.end()) {
		if (it->root == root)
			return Utils::Result::success();
		it->root = root;
	} else {
		records.push_back({root, key});
	}
	return write(records);
}

Utils::Result BackupWorkspaceRegistry::unregisterWorkspace(const QString& workspaceRoot)
{
	const QString key = m_hasher.workspaceKey(cleanRoot(workspaceRoot));

	QVector<Record> records = workspaces();
	const auto removed = records.removeIf([&key](const Record& record) { return record.key == key; });
	if (removed == 0)
		return Utils::Result::success();
	return write(records);
}

Utils::Result BackupWorkspaceRegistry::write(const QVector<Record>& records) const
{
	QJsonArray entries;
	for (const Record& record : records) {
		QJsonObject object;
		object.insert(kRootKey, record.root);
		object.insert(kKeyKey, record.key);
		entries.push_back(object);
	}

	QJsonObject root;
	root.insert(kVersionKey, Constants::kIndexFormatVersion);
	root.insert(kWorkspacesKey, entries);

	const Utils::Result written = Utils::AtomicFileUtils::writeObjectAtomic(filePath(), root);
	if (!written)
		qCWarning(backuplog) << "BackupWorkspaceRegistry: cannot write registry:" << written.message();
	return written;
}

} // namespace Backup
