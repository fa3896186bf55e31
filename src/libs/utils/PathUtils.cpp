// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>

namespace Utils::PathUtils {

namespace {

// Index of the drive letter in "c:/..." or "/c:/..." (URL path form), or -1.
qsizetype driveLetterIndex(QStringView path)
{
    if (path.size() >= 2 && path.at(0).isLetter() && path.at(1) == u':')
        return 0;
    if (path.size() >= 3 && path.at(0) == u'/' && path.at(1).isLetter() && path.at(2) == u':')
        return 1;
    return -1;
}

} // namespace

QString normalizePath(QStringView path)
{
    QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        cleaned.clear();
    return cleaned;
}

QString basename(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    const qsizetype slash = cleaned.lastIndexOf('/');
    if (slash < 0)
        return cleaned;
    if (slash == cleaned.size() - 1)
        return {};
    return cleaned.mid(slash + 1);
}

Qt::CaseSensitivity platformPathCase()
{
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

bool hasDriveLetter(QStringView path)
{
    return driveLetterIndex(path) >= 0;
}

QString canonicalFilePath(QStringView path, Qt::CaseSensitivity cs)
{
    QString s = path.toString();
    s.replace(u'\\', u'/');
    if (s.isEmpty())
        return {};

    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        return {};

    // cleanPath keeps the separator after a bare drive ("c:/"), drop it for
    // everything but the file system root.
    while (cleaned.size() > 1 && cleaned.endsWith(u'/') && !cleaned.endsWith(u":/"))
        cleaned.chop(1);

    const qsizetype drive = driveLetterIndex(cleaned);
    if (drive >= 0)
        cleaned[drive] = cleaned.at(drive).toLower();

    if (cs == Qt::CaseInsensitive)
        cleaned = cleaned.toLower();

    return cleaned;
}

} // namespace Utils::PathUtils
