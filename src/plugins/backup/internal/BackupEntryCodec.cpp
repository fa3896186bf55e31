// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/internal/BackupEntryCodec.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>

namespace Backup::Internal::BackupEntryCodec {

namespace {

const QString kFormatKey = QStringLiteral("format");
const QString kEncodingKey = QStringLiteral("encoding");
const QString kLineEndingKey = QStringLiteral("eol");
const QString kVersionKey = QStringLiteral("version");
const QString kSavedAtKey = QStringLiteral("savedAt");
const QString kOriginalSizeKey = QStringLiteral("originalSize");
const QString kOriginalModifiedKey = QStringLiteral("originalModified");

constexpr int kFormatVersion = 1;

QJsonObject metaToJson(const Api::BackupEntryMeta& meta)
{
    QJsonObject object;
    object.insert(kFormatKey, kFormatVersion);
    if (!meta.hints.encoding.isEmpty())
        object.insert(kEncodingKey, meta.hints.encoding);
    if (!meta.hints.lineEnding.isEmpty())
        object.insert(kLineEndingKey, meta.hints.lineEnding);
    // JSON numbers are doubles; keep the ordinal exact as a string.
    object.insert(kVersionKey, QString::number(meta.version));
    if (meta.savedAt.isValid())
        object.insert(kSavedAtKey, meta.savedAt.toUTC().toString(Qt::ISODateWithMs));
    if (meta.originalSize >= 0)
        object.insert(kOriginalSizeKey, QString::number(meta.originalSize));
    if (meta.originalModified.isValid())
        object.insert(kOriginalModifiedKey, meta.originalModified.toUTC().toString(Qt::ISODateWithMs));
    return object;
}

bool metaFromJson(const QJsonObject& object, Api::BackupEntryMeta& out, QString& error)
{
    const int format = object.value(kFormatKey).toInt(0);
    if (format != kFormatVersion) {
        error = QStringLiteral("unsupported entry format %1").arg(format);
        return false;
    }

    out.hints.encoding = object.value(kEncodingKey).toString();
    out.hints.lineEnding = object.value(kLineEndingKey).toString();

    bool versionOk = false;
    out.version = object.value(kVersionKey).toString().toULongLong(&versionOk);
    if (!versionOk) {
        error = QStringLiteral("entry version is missing or malformed");
        return false;
    }

    out.savedAt = QDateTime::fromString(object.value(kSavedAtKey).toString(), Qt::ISODateWithMs);

    bool sizeOk = false;
    const qint64 size = object.value(kOriginalSizeKey).toString().toLongLong(&sizeOk);
    out.originalSize = sizeOk ? size : -1;
    out.originalModified =
        QDateTime::fromString(object.value(kOriginalModifiedKey).toString(), Qt::ISODateWithMs);
    return true;
}

Decoded decodeHeaderLine(const QByteArray& line)
{
    Decoded decoded;

    const qsizetype space = line.indexOf(' ');
    if (space <= 0) {
        decoded.error = QStringLiteral("entry header has no metadata separator");
        return decoded;
    }

    decoded.identityText = QString::fromUtf8(line.left(space));

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(line.mid(space + 1), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        decoded.error = QStringLiteral("entry metadata is not a JSON object");
        return decoded;
    }

    if (!metaFromJson(doc.object(), decoded.meta, decoded.error))
        return decoded;

    decoded.ok = true;
    return decoded;
}

} // namespace

QByteArray encode(const QString& identityText, const Api::BackupEntryMeta& meta, const QString& content)
{
    QByteArray bytes = identityText.toUtf8();
    bytes.append(' ');
    bytes.append(QJsonDocument(metaToJson(meta)).toJson(QJsonDocument::Compact));
    bytes.append('\n');
    bytes.append(content.toUtf8());
    return bytes;
}

Decoded decodeHeader(const QByteArray& bytes)
{
    const qsizetype newline = bytes.indexOf('\n');
    if (newline < 0) {
        Decoded decoded;
        decoded.error = QStringLiteral("entry header is not terminated");
        return decoded;
    }
    return decodeHeaderLine(bytes.left(newline));
}

Decoded decode(const QByteArray& bytes)
{
    Decoded decoded = decodeHeader(bytes);
    if (!decoded.ok)
        return decoded;

    const qsizetype newline = bytes.indexOf('\n');
    decoded.content = QString::fromUtf8(bytes.mid(newline + 1));
    return decoded;
}

} // namespace Backup::Internal::BackupEntryCodec
