// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"
#include "backup/api/DocumentIdentity.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Backup {

// Maps document identities and workspace roots to fixed-length storage keys
// (40 lowercase hex digits). Stateless apart from the file-path case policy,
// which must be the same for every component sharing one backup area.
class BACKUP_EXPORT IdentityHasher final {
public:
	static constexpr int kKeyLength = 40;

	explicit IdentityHasher(Qt::CaseSensitivity fileCase = Utils::PathUtils::platformPathCase()) noexcept
		: m_fileCase(fileCase)
	{}

	Qt::CaseSensitivity fileCase() const noexcept { return m_fileCase; }

	QString canonicalForm(const Api::DocumentIdentity& identity) const;
	QString keyFor(const Api::DocumentIdentity& identity) const;
	QString workspaceKey(const QString& workspaceRoot) const;

	bool sameDocument(const Api::DocumentIdentity& a, const Api::DocumentIdentity& b) const;

	static bool isValidKey(QStringView key);

private:
	static QString digest(const QString& text);

	Qt::CaseSensitivity m_fileCase = Qt::CaseSensitive;
};

} // namespace Backup
