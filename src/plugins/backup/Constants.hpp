// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

namespace Backup::Constants {

constexpr inline char kSchemeFile[] = "file";
constexpr inline char kSchemeUntitled[] = "untitled";

constexpr inline char kEditorTypeUntitled[] = "lifeboat.editor.untitled";
constexpr inline char kEditorTypeFile[] = "lifeboat.editor.file";
constexpr inline char kEditorTypeVirtual[] = "lifeboat.editor.virtual";

constexpr inline char kNoWorkspaceKey[] = "no-workspace";
constexpr inline char kWorkspacesFileName[] = "workspaces.json";
constexpr inline char kIndexFileName[] = "index.json";
constexpr inline char kEntriesDirName[] = "entries";

constexpr inline int kIndexFormatVersion = 1;

constexpr inline int kDefaultDebounceMs = 1000;
constexpr inline int kDefaultMaxDelayMs = 10000;
constexpr inline int kDefaultRetryDelayMs = 1000;
constexpr inline int kDefaultMaxRetryDelayMs = 30000;

constexpr inline int kMinDebounceMs = 0;
constexpr inline int kMaxDebounceMs = 60 * 1000;
constexpr inline int kMaxRetryDelayCeilingMs = 10 * 60 * 1000;

// Entries larger than this are refused on read to keep a damaged file from
// exhausting memory during restore.
constexpr inline qint64 kMaxEntryBytes = 256ll * 1024 * 1024;

} // namespace Backup::Constants
