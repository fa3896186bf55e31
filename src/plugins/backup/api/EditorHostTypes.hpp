// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/BackupTypes.hpp"
#include "backup/api/DocumentIdentity.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace Backup::Api {

struct BACKUP_EXPORT DocumentHandle final {
	QString id;
	DocumentIdentity identity;

	bool isValid() const noexcept {
		return !id.trimmed().isEmpty() && identity.isValid();
	}

	explicit operator bool () const noexcept { return isValid(); }
};

// Asks the host for a new editor. contentSeed replaces whatever the host
// would otherwise load; for file-backed editors the disk is not read.
struct BACKUP_EXPORT OpenDocumentRequest final {
	DocumentIdentity identity;
	QString editorTypeId;
	QString contentSeed;
	BackupHints hints;
	bool forceDirty = true;
	bool activate = false;
};

struct BACKUP_EXPORT DocumentSnapshot final {
	QString content;
	BackupHints hints;
	quint64 versionId = 0;
	bool valid = false;
};

} // namespace Backup::Api

Q_DECLARE_METATYPE(Backup::Api::DocumentHandle)
