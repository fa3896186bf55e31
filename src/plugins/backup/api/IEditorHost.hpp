// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/EditorHostTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QVector>

namespace Backup::Api {

// The editor side of the backup subsystem: owns documents, their text models
// and their editors. Everything here runs on the UI thread.
class BACKUP_EXPORT IEditorHost : public QObject {
	Q_OBJECT

public:
	using QObject::QObject;
	~IEditorHost() override = default;

	virtual Utils::Result openDocument(const OpenDocumentRequest& request, DocumentHandle& outHandle) = 0;

	// Invalid handle when no open document has this identity.
	virtual DocumentHandle documentFor(const DocumentIdentity& identity) const = 0;
	virtual QVector<DocumentHandle> openDocuments() const = 0;

	virtual bool isDirty(const DocumentHandle& handle) const = 0;
	virtual DocumentSnapshot snapshot(const DocumentHandle& handle) const = 0;

	// Replaces the content of an already open document with recovered text
	// and marks it dirty.
	virtual Utils::Result attachBackup(const DocumentHandle& handle,
									   const QString& content,
									   const BackupHints& hints) = 0;

signals:
	void documentOpened(const Backup::Api::DocumentHandle& handle);
	void dirtyStateChanged(const Backup::Api::DocumentHandle& handle, bool dirty);
	void contentChanged(const Backup::Api::DocumentHandle& handle);
	void documentClosed(const Backup::Api::DocumentHandle& handle);
};

} // namespace Backup::Api
