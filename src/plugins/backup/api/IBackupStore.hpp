// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/BackupTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>

namespace Backup::Api {

// Durable backup area of one workspace. Every operation returns immediately;
// completions are delivered on the thread of `context` and dropped when the
// context is null or has been destroyed. Operations run in submission order.
class BACKUP_EXPORT IBackupStore : public QObject {
	Q_OBJECT

public:
	using StatusCallback = std::function<void(const BackupStatus&)>;
	using PutCallback = std::function<void(const BackupStatus&, const QString& key)>;
	using GetCallback = std::function<void(const BackupStatus&, const BackupEntry& entry)>;
	using ListCallback = std::function<void(const BackupStatus&, const BackupEntryList& entries)>;

	using QObject::QObject;
	~IBackupStore() override = default;

	virtual QString workspaceKey() const = 0;
	virtual QString keyFor(const DocumentIdentity& identity) const = 0;

	virtual void put(const BackupSnapshot& snapshot, QObject* context, PutCallback done) = 0;
	virtual void get(const QString& key, QObject* context, GetCallback done) = 0;
	virtual void list(QObject* context, ListCallback done) = 0;
	virtual void remove(const QString& key, QObject* context, StatusCallback done) = 0;
	virtual void clear(QObject* context, StatusCallback done) = 0;
};

} // namespace Backup::Api
