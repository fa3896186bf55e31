// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/api/BackupTypes.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace Backup::Internal::BackupEntryCodec {

// On-disk entry layout:
//
//   <identity url> <compact JSON metadata>\n
//   <UTF-8 content>
//
// The identity is written fully percent-encoded so it never contains a space
// or a newline.

struct Decoded final {
    bool ok = false;
    QString error;
    QString identityText;
    Api::BackupEntryMeta meta;
    QString content;
};

QByteArray encode(const QString& identityText, const Api::BackupEntryMeta& meta, const QString& content);

Decoded decode(const QByteArray& bytes);

// Parses only the header line; content stays empty.
Decoded decodeHeader(const QByteArray& bytes);

} // namespace Backup::Internal::BackupEntryCodec
