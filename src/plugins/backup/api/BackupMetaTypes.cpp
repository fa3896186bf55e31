// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/api/BackupMetaTypes.hpp"

#include "backup/api/BackupTypes.hpp"
#include "backup/api/DocumentIdentity.hpp"
#include "backup/api/EditorHostTypes.hpp"

#include <QtCore/QMetaType>

namespace Backup {

void registerBackupMetaTypes()
{
    qRegisterMetaType<Api::DocumentIdentity>("Backup::Api::DocumentIdentity");
    qRegisterMetaType<Api::DocumentKind>("Backup::Api::DocumentKind");
    qRegisterMetaType<Api::DocumentHandle>("Backup::Api::DocumentHandle");
    qRegisterMetaType<Api::BackupErrorKind>("Backup::Api::BackupErrorKind");
    qRegisterMetaType<Api::TrackedState>("Backup::Api::TrackedState");
    qRegisterMetaType<Api::RestoreResult>("Backup::Api::RestoreResult");
}

} // namespace Backup
