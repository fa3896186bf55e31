// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "backup/BackupGlobal.hpp"

namespace Backup {

BACKUP_EXPORT void registerBackupMetaTypes();

} // namespace Backup
