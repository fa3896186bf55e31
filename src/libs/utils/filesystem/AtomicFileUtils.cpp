// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/AtomicFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

#include <algorithm>

Q_LOGGING_CATEGORY(utilslog, "lifeboat.utils")

namespace Utils::AtomicFileUtils {

Result ensureDirectory(const QString& path)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Directory path is empty."));

    const QFileInfo info(cleanedPath);
    if (info.exists() && !info.isDir())
        return Result::failure(QStringLiteral("Path exists and is not a directory: %1").arg(cleanedPath));

    QDir dir(cleanedPath);
    if (dir.exists())
        return Result::success();

    if (!dir.mkpath(QStringLiteral(".")))
        return Result::failure(QStringLiteral("Failed to create directory: %1").arg(cleanedPath));
    return Result::success();
}

Result writeBytesAtomic(const QString& path, const QByteArray& bytes)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Output path is empty."));

    const Result dirResult = ensureDirectory(QFileInfo(cleanedPath).absolutePath());
    if (!dirResult)
        return dirResult;

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result::failure(QStringLiteral("Failed to open file for writing: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    if (file.write(bytes) != bytes.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        qCWarning(utilslog).noquote() << QStringLiteral("Atomic write aborted: %1 (%2)").arg(cleanedPath, error);
        return Result::failure(QStringLiteral("Failed to write file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit()) {
        qCWarning(utilslog).noquote() << QStringLiteral("Atomic commit failed: %1 (%2)")
                                             .arg(cleanedPath, file.errorString());
        return Result::failure(QStringLiteral("Failed to commit file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }
    return Result::success();
}

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QJsonDocument doc(object);
    return writeBytesAtomic(path, doc.toJson(format));
}

Result readBytes(const QString& path, QByteArray& out, qint64 maxBytes)
{
    out.clear();

    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Input path is empty."));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result::failure(QStringLiteral("Failed to open file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    if (maxBytes > 0 && file.size() > maxBytes) {
        return Result::failure(
            QStringLiteral("File exceeds supported size (%1 bytes): %2").arg(maxBytes).arg(cleanedPath));
    }

    out = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        out.clear();
        return Result::failure(QStringLiteral("Failed to read file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }
    return Result::success();
}

Result readFirstLine(const QString& path, QByteArray& out, qint64 maxBytes)
{
    out.clear();

    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Input path is empty."));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result::failure(QStringLiteral("Failed to open file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    out = file.readLine(std::max<qint64>(maxBytes, 0));
    if (file.error() != QFileDevice::NoError) {
        out.clear();
        return Result::failure(QStringLiteral("Failed to read file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }
    return Result::success();
}

QJsonObject readObject(const QString& path, QString* error)
{
    QByteArray bytes;
    const Result readResult = readBytes(path, bytes);
    if (!readResult) {
        if (error)
            *error = readResult.message();
        return {};
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QStringLiteral("Failed to parse JSON file: %1 (%2)")
                         .arg(path.trimmed(), parseError.errorString());
        }
        return {};
    }

    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("JSON document is not an object: %1").arg(path.trimmed());
        return {};
    }

    if (error)
        error->clear();
    return doc.object();
}

Result removeFile(const QString& path)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Path is empty."));

    QFile file(cleanedPath);
    if (!file.exists())
        return Result::success();

    if (!file.remove()) {
        return Result::failure(QStringLiteral("Failed to remove file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }
    return Result::success();
}

} // namespace Utils::AtomicFileUtils
