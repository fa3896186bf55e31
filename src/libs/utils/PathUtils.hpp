#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/Qt>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

UTILS_EXPORT QString normalizePath(QStringView path);
UTILS_EXPORT QString basename(QStringView path);

// Case sensitivity of local file paths on the host platform.
UTILS_EXPORT Qt::CaseSensitivity platformPathCase();

// Canonical spelling of a local file path: forward slashes only, no empty,
// "." or ".." segments, no trailing separator, lower-case drive letter and,
// for case-insensitive file systems, the whole path folded to lower case.
UTILS_EXPORT QString canonicalFilePath(QStringView path, Qt::CaseSensitivity cs = platformPathCase());

UTILS_EXPORT bool hasDriveLetter(QStringView path);

} // namespace Utils::PathUtils
