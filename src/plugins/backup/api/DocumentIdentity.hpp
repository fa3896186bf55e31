// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>

namespace Backup::Api {

enum class DocumentKind : unsigned char {
	Untitled,
	FileBacked,
	Virtual
};

// Logical address of an open document: a scheme plus a path, with optional
// authority, query and fragment for virtual schemes. File paths are absolute,
// kept with forward slashes and without "."/".." segments; case is preserved
// for display and only folded in canonicalForm(). Queries are kept in their
// percent-encoded form and compared verbatim.
class BACKUP_EXPORT DocumentIdentity final {
public:
	DocumentIdentity() = default;

	static DocumentIdentity fromLocalFile(const QString& path);
	static DocumentIdentity untitled(const QString& name);
	static DocumentIdentity fromUrl(const QUrl& url);

	// Parses the output of toString(). Returns an invalid identity on failure.
	static DocumentIdentity parse(const QString& text);

	bool isValid() const noexcept { return !m_scheme.isEmpty() && !m_path.isEmpty(); }
	explicit operator bool() const noexcept { return isValid(); }

	DocumentKind kind() const noexcept { return m_kind; }
	const QString& scheme() const noexcept { return m_scheme; }
	const QString& authority() const noexcept { return m_authority; }
	const QString& path() const noexcept { return m_path; }
	const QString& query() const noexcept { return m_query; }
	const QString& fragment() const noexcept { return m_fragment; }

	QString localFilePath() const;
	QString displayName() const;

	QUrl toUrl() const;
	QString toString() const;

	// Scheme-aware normalized spelling. Two identities are the same document
	// iff their canonical forms match.
	QString canonicalForm(Qt::CaseSensitivity fileCase = Utils::PathUtils::platformPathCase()) const;

	friend bool operator==(const DocumentIdentity& a, const DocumentIdentity& b)
	{
		return a.canonicalForm() == b.canonicalForm();
	}

	friend bool operator!=(const DocumentIdentity& a, const DocumentIdentity& b)
	{
		return !(a == b);
	}

private:
	static DocumentKind kindForScheme(const QString& scheme);

	QString m_scheme;
	QString m_authority;
	QString m_path;
	QString m_query;
	QString m_fragment;
	DocumentKind m_kind = DocumentKind::Virtual;
};

BACKUP_EXPORT size_t qHash(const DocumentIdentity& identity, size_t seed = 0) noexcept;

} // namespace Backup::Api

Q_DECLARE_METATYPE(Backup::Api::DocumentIdentity)
Q_DECLARE_METATYPE(Backup::Api::DocumentKind)
