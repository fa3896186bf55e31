// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/identity/IdentityHasher.hpp"

#include "backup/Constants.hpp"

#include <QtCore/QCryptographicHash>

namespace Backup {

QString IdentityHasher::digest(const QString& text)
{
    const QByteArray hash = QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Sha1).toHex();
    return QString::fromLatin1(hash);
}

QString IdentityHasher::canonicalForm(const Api::DocumentIdentity& identity) const
{
    return identity.canonicalForm(m_fileCase);
}

QString IdentityHasher::keyFor(const Api::DocumentIdentity& identity) const
{
    if (!identity.isValid())
        return {};
    return digest(canonicalForm(identity));
}

QString IdentityHasher::workspaceKey(const QString& workspaceRoot) const
{
    const Api::DocumentIdentity root = Api::DocumentIdentity::fromLocalFile(workspaceRoot);
    if (!root.isValid())
        return QString::fromLatin1(Constants::kNoWorkspaceKey);
    return digest(canonicalForm(root));
}

bool IdentityHasher::sameDocument(const Api::DocumentIdentity& a, const Api::DocumentIdentity& b) const
{
    if (!a.isValid() || !b.isValid())
        return false;
    return canonicalForm(a) == canonicalForm(b);
}

bool IdentityHasher::isValidKey(QStringView key)
{
    if (key.size() != kKeyLength)
        return false;

    for (const QChar c : key) {
        const bool digit = c >= u'0' && c <= u'9';
        const bool hex = c >= u'a' && c <= u'f';
        if (!digit && !hex)
            return false;
    }
    return true;
}

} // namespace Backup
