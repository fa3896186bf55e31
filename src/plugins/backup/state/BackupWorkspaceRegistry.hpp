// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/identity/IdentityHasher.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>
#include <QtCore/QVector>

namespace Backup {

// <backupHome>/workspaces.json: the workspaces that currently own a backup
// area. Lets tools find backups without knowing the workspace up front.
class BACKUP_EXPORT BackupWorkspaceRegistry final {
public:
	struct Record final {
		QString root;
		QString key;
	};

	explicit BackupWorkspaceRegistry(QString backupHome, IdentityHasher hasher = IdentityHasher());

	QString filePath() const;

	QVector<Record> workspaces() const;
	Record findByRoot(const QString& workspaceRoot) const;
	Record findByKey(const QString& key) const;

	Utils::Result registerWorkspace(const QString& workspaceRoot);
	Utils::Result unregisterWorkspace(const QString& workspaceRoot);

private:
	Utils::Result write(const QVector<Record>& records) const;

	QString m_backupHome;
	IdentityHasher m_hasher;
};

} // namespace Backup
