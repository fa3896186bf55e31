// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/DocumentIdentity.hpp"

#include <utils/Result.hpp>

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

namespace Backup::Api {

enum class BackupErrorKind : unsigned char {
	None,
	NotFound,
	StoreUnavailable,
	CorruptEntry,
	IdentityCollision
};

using BackupStatus = Utils::CodedResult<BackupErrorKind>;

struct BACKUP_EXPORT BackupHints final {
	QString encoding;
	QString lineEnding;

	bool isEmpty() const noexcept { return encoding.isEmpty() && lineEnding.isEmpty(); }
};

// What the tracker hands to the store: one document's content at one point
// of its edit history.
struct BACKUP_EXPORT BackupSnapshot final {
	DocumentIdentity identity;
	QString content;
	BackupHints hints;
	quint64 version = 0;
};

struct BACKUP_EXPORT BackupEntryMeta final {
	BackupHints hints;
	quint64 version = 0;
	QDateTime savedAt;
	qint64 originalSize = -1;
	QDateTime originalModified;
};

// One row of list(). identity is invalid when the recorded identity text
// could not be parsed; identityText keeps the raw value for diagnostics.
struct BACKUP_EXPORT BackupEntryInfo final {
	QString key;
	QString identityText;
	DocumentIdentity identity;
};

using BackupEntryList = QVector<BackupEntryInfo>;

struct BACKUP_EXPORT BackupEntry final {
	QString key;
	DocumentIdentity identity;
	QString content;
	BackupEntryMeta meta;
};

enum class TrackedState : unsigned char {
	Untracked,
	Clean,
	Dirty,
	PendingWrite,
	BackedUp
};

struct BACKUP_EXPORT RestoreResult final {
	QVector<DocumentIdentity> opened;
	QVector<DocumentIdentity> attached;
	QStringList skippedKeys;
	bool storeAvailable = true;

	QVector<DocumentIdentity> restored() const
	{
		QVector<DocumentIdentity> all = opened;
		all += attached;
		return all;
	}

	int count() const noexcept { return static_cast<int>(opened.size() + attached.size()); }
	bool isEmpty() const noexcept { return count() == 0; }
};

BACKUP_EXPORT QString errorKindName(BackupErrorKind kind);
BACKUP_EXPORT QString trackedStateName(TrackedState state);

} // namespace Backup::Api

Q_DECLARE_METATYPE(Backup::Api::BackupErrorKind)
Q_DECLARE_METATYPE(Backup::Api::TrackedState)
Q_DECLARE_METATYPE(Backup::Api::RestoreResult)
