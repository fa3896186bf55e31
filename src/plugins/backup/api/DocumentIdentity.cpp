// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/api/DocumentIdentity.hpp"

#include "backup/Constants.hpp"

#include <QtCore/QDir>
#include <QtCore/QHashFunctions>

namespace Backup::Api {

namespace {

// Usable from static initializers in other translation units.
QString fileScheme()
{
    return QString::fromLatin1(Constants::kSchemeFile);
}

QString untitledScheme()
{
    return QString::fromLatin1(Constants::kSchemeUntitled);
}

QString cleanLocalPath(const QString& path)
{
    QString s = path;
    s.replace(u'\\', u'/');
    if (s.isEmpty())
        return {};

    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        return {};

    // Identities travel as file:/// URLs, which cannot carry a relative path.
    if (!cleaned.startsWith(u'/') && !Utils::PathUtils::hasDriveLetter(cleaned))
        cleaned = QDir::cleanPath(QDir::current().absoluteFilePath(cleaned));

    while (cleaned.size() > 1 && cleaned.endsWith(u'/') && !cleaned.endsWith(u":/"))
        cleaned.chop(1);
    return cleaned;
}

} // namespace

DocumentKind DocumentIdentity::kindForScheme(const QString& scheme)
{
    if (scheme == fileScheme())
        return DocumentKind::FileBacked;
    if (scheme == untitledScheme())
        return DocumentKind::Untitled;
    return DocumentKind::Virtual;
}

DocumentIdentity DocumentIdentity::fromLocalFile(const QString& path)
{
    DocumentIdentity identity;
    identity.m_path = cleanLocalPath(path);
    if (identity.m_path.isEmpty())
        return {};

    identity.m_scheme = fileScheme();
    identity.m_kind = DocumentKind::FileBacked;
    return identity;
}

DocumentIdentity DocumentIdentity::untitled(const QString& name)
{
    if (name.isEmpty())
        return {};

    DocumentIdentity identity;
    identity.m_scheme = untitledScheme();
    identity.m_path = name;
    identity.m_kind = DocumentKind::Untitled;
    return identity;
}

DocumentIdentity DocumentIdentity::fromUrl(const QUrl& url)
{
    if (!url.isValid())
        return {};

    const QString scheme = url.scheme().toLower();
    if (scheme.isEmpty())
        return {};

    const DocumentKind kind = kindForScheme(scheme);
    if (kind == DocumentKind::FileBacked) {
        QString path = url.path(QUrl::FullyDecoded);
        if (Utils::PathUtils::hasDriveLetter(path) && path.startsWith(u'/'))
            path.remove(0, 1);

        const QString host = url.host(QUrl::FullyDecoded);
        if (!host.isEmpty())
            path = QStringLiteral("//%1%2").arg(host, path);
        return fromLocalFile(path);
    }

    if (kind == DocumentKind::Untitled)
        return untitled(url.path(QUrl::FullyDecoded));

    DocumentIdentity identity;
    identity.m_scheme = scheme;
    identity.m_authority = url.authority(QUrl::FullyDecoded);
    identity.m_path = url.path(QUrl::FullyDecoded);
    identity.m_query = url.query(QUrl::FullyEncoded);
    identity.m_fragment = url.fragment(QUrl::FullyDecoded);
    identity.m_kind = DocumentKind::Virtual;
    if (identity.m_path.isEmpty())
        return {};
    return identity;
}

DocumentIdentity DocumentIdentity::parse(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return {};

    const QUrl url(trimmed, QUrl::StrictMode);
    if (!url.isValid() || url.scheme().isEmpty())
        return {};
    return fromUrl(url);
}

QString DocumentIdentity::localFilePath() const
{
    if (m_kind != DocumentKind::FileBacked)
        return {};
    return m_path;
}

QString DocumentIdentity::displayName() const
{
    if (m_kind == DocumentKind::Untitled)
        return m_path;

    const QString name = Utils::PathUtils::basename(m_path);
    return name.isEmpty() ? m_path : name;
}

QUrl DocumentIdentity::toUrl() const
{
    if (!isValid())
        return {};

    QUrl url;
    url.setScheme(m_scheme);

    switch (m_kind) {
    case DocumentKind::FileBacked: {
        QString path = m_path;
        if (!path.startsWith(u'/'))
            path.prepend(u'/');
        url.setHost(QString());
        url.setPath(path, QUrl::DecodedMode);
        break;
    }
    case DocumentKind::Untitled:
        url.setPath(m_path, QUrl::DecodedMode);
        break;
    case DocumentKind::Virtual: {
        QString path = m_path;
        if (!m_authority.isEmpty()) {
            url.setAuthority(m_authority, QUrl::DecodedMode);
            if (!path.startsWith(u'/'))
                path.prepend(u'/');
        }
        url.setPath(path, QUrl::DecodedMode);
        if (!m_query.isEmpty())
            url.setQuery(m_query, QUrl::StrictMode);
        if (!m_fragment.isEmpty())
            url.setFragment(m_fragment, QUrl::DecodedMode);
        break;
    }
    }

    return url;
}

QString DocumentIdentity::toString() const
{
    if (!isValid())
        return {};
    return toUrl().toString(QUrl::FullyEncoded);
}

QString DocumentIdentity::canonicalForm(Qt::CaseSensitivity fileCase) const
{
    if (!isValid())
        return {};

    switch (m_kind) {
    case DocumentKind::FileBacked:
        return m_scheme + QStringLiteral(":") + Utils::PathUtils::canonicalFilePath(m_path, fileCase);
    case DocumentKind::Untitled:
        return m_scheme + QStringLiteral(":") + m_path;
    case DocumentKind::Virtual:
        break;
    }

    QString form = m_scheme + QStringLiteral("://") + m_authority + m_path;
    if (!m_query.isEmpty())
        form += QStringLiteral("?") + m_query;
    if (!m_fragment.isEmpty())
        form += QStringLiteral("#") + m_fragment;
    return form;
}

size_t qHash(const DocumentIdentity& identity, size_t seed) noexcept
{
    return qHash(identity.canonicalForm(), seed);
}

} // namespace Backup::Api
