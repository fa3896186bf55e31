// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::AtomicFileUtils {

// Writes through a temporary file that replaces `path` on commit. A crash
// mid-write leaves either the old content or no file, never a partial one.
// Missing parent directories are created.
UTILS_EXPORT Result writeBytesAtomic(const QString& path, const QByteArray& bytes);

UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// maxBytes == 0 disables the size limit.
UTILS_EXPORT Result readBytes(const QString& path, QByteArray& out, qint64 maxBytes = 0);

// Reads up to and including the first '\n', without loading the rest of the
// file. Stops after maxBytes when no newline comes first.
UTILS_EXPORT Result readFirstLine(const QString& path, QByteArray& out, qint64 maxBytes);

UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr);

UTILS_EXPORT Result removeFile(const QString& path);

UTILS_EXPORT Result ensureDirectory(const QString& path);

} // namespace Utils::AtomicFileUtils
