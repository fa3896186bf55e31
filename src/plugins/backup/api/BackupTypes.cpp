// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/api/BackupTypes.hpp"

namespace Backup::Api {

QString errorKindName(BackupErrorKind kind)
{
    switch (kind) {
    case BackupErrorKind::None:
        return QStringLiteral("None");
    case BackupErrorKind::NotFound:
        return QStringLiteral("NotFound");
    case BackupErrorKind::StoreUnavailable:
        return QStringLiteral("StoreUnavailable");
    case BackupErrorKind::CorruptEntry:
        return QStringLiteral("CorruptEntry");
    case BackupErrorKind::IdentityCollision:
        return QStringLiteral("IdentityCollision");
    }
    return QStringLiteral("Unknown");
}

QString trackedStateName(TrackedState state)
{
    switch (state) {
    case TrackedState::Untracked:
        return QStringLiteral("Untracked");
    case TrackedState::Clean:
        return QStringLiteral("Clean");
    case TrackedState::Dirty:
        return QStringLiteral("Dirty");
    case TrackedState::PendingWrite:
        return QStringLiteral("PendingWrite");
    case TrackedState::BackedUp:
        return QStringLiteral("BackedUp");
    }
    return QStringLiteral("Unknown");
}

} // namespace Backup::Api
