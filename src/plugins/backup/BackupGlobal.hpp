// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(BACKUP_BUILD_SHARED) && (BACKUP_BUILD_SHARED == 1)
#	if defined(BACKUP_LIBRARY)
#		define BACKUP_EXPORT Q_DECL_EXPORT
#	else
#		define BACKUP_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define BACKUP_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(backuplog)
