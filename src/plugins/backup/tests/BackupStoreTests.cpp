// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/internal/BackupStoreImpl.hpp"

#include "BackupTestSupport.hpp"

#include <utils/filesystem/AtomicFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>

#include <gtest/gtest.h>

#include <memory>

using namespace Backup::Tests;
using Backup::IdentityHasher;
using Backup::Api::BackupErrorKind;
using Backup::Api::BackupSnapshot;
using Backup::Api::DocumentIdentity;
using Backup::Internal::BackupStoreImpl;

namespace {

class BackupStoreTests : public ::testing::Test {
protected:
	void SetUp() override
	{
		ensureCoreApp();
		ASSERT_TRUE(m_home.isValid());
		m_store = std::make_unique<BackupStoreImpl>(m_home.path(), QStringLiteral("/work/project"),
													IdentityHasher(Qt::CaseSensitive));
	}

	BackupStoreImpl& store() { return *m_store; }

	QTemporaryDir m_home;
	std::unique_ptr<BackupStoreImpl> m_store;
};

const DocumentIdentity kUntitled = DocumentIdentity::untitled(QStringLiteral("untitled-1"));
const DocumentIdentity kFile = DocumentIdentity::fromLocalFile(QStringLiteral("/work/project/Foo.txt"));

} // namespace

TEST_F(BackupStoreTests, PutThenGetReturnsContent)
{
	BackupSnapshot snapshot;
	snapshot.identity = kFile;
	snapshot.content = QStringLiteral("fooFile\nsecond line");
	snapshot.hints.lineEnding = QStringLiteral("lf");
	snapshot.version = 3;
	ASSERT_TRUE(putSync(store(), snapshot));

	const auto [status, entry] = getSync(store(), store().keyFor(kFile));
	ASSERT_TRUE(status) << status.message().toStdString();
	EXPECT_EQ(entry.key, store().keyFor(kFile));
	EXPECT_EQ(entry.identity, kFile);
	EXPECT_EQ(entry.content, snapshot.content);
	EXPECT_EQ(entry.meta.hints.lineEnding, QStringLiteral("lf"));
	EXPECT_EQ(entry.meta.version, 3u);
	EXPECT_TRUE(entry.meta.savedAt.isValid());
}

TEST_F(BackupStoreTests, RelativeFileIdentityReadsBack)
{
	const DocumentIdentity relative = DocumentIdentity::fromLocalFile(QStringLiteral("Foo"));
	ASSERT_TRUE(putSync(store(), relative, QStringLiteral("fooFile")));

	const auto [status, entry] = getSync(store(), store().keyFor(relative));
	ASSERT_TRUE(status) << status.message().toStdString();
	EXPECT_EQ(entry.identity, relative);
	EXPECT_EQ(entry.content, QStringLiteral("fooFile"));
}

TEST_F(BackupStoreTests, VirtualQueriesGetDistinctEntries)
{
	const DocumentIdentity head = DocumentIdentity::parse(QStringLiteral("git:/src/a.cpp?ref=HEAD"));
	const DocumentIdentity previous = DocumentIdentity::parse(QStringLiteral("git:/src/a.cpp?ref=HEAD~1"));
	ASSERT_NE(store().keyFor(head), store().keyFor(previous));

	ASSERT_TRUE(putSync(store(), head, QStringLiteral("head text")));
	ASSERT_TRUE(putSync(store(), previous, QStringLiteral("previous text")));
	EXPECT_EQ(listSync(store()).second.size(), 2);

	const auto [headStatus, headEntry] = getSync(store(), store().keyFor(head));
	ASSERT_TRUE(headStatus) << headStatus.message().toStdString();
	EXPECT_EQ(headEntry.identity, head);
	EXPECT_EQ(headEntry.content, QStringLiteral("head text"));

	const auto [previousStatus, previousEntry] = getSync(store(), store().keyFor(previous));
	ASSERT_TRUE(previousStatus) << previousStatus.message().toStdString();
	EXPECT_EQ(previousEntry.identity, previous);
	EXPECT_EQ(previousEntry.content, QStringLiteral("previous text"));
}

TEST_F(BackupStoreTests, OversizedPutFailsInsteadOfWritingAnUnreadableEntry)
{
	store().setMaxEntryBytes(1024);
	EXPECT_EQ(store().maxEntryBytes(), 1024);

	const Backup::Api::BackupStatus status = putSync(store(), kUntitled, QString(4096, u'x'));
	EXPECT_TRUE(status.is(BackupErrorKind::StoreUnavailable));
	EXPECT_FALSE(QFileInfo::exists(store().entryPath(store().keyFor(kUntitled))));
	EXPECT_TRUE(listSync(store()).second.isEmpty());

	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("small")));
	EXPECT_EQ(getSync(store(), store().keyFor(kUntitled)).second.content, QStringLiteral("small"));
}

TEST_F(BackupStoreTests, PutIsAnUpsert)
{
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("one")));
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("two")));

	const auto [listStatus, entries] = listSync(store());
	ASSERT_TRUE(listStatus);
	ASSERT_EQ(entries.size(), 1);
	EXPECT_EQ(entries.front().identity, kUntitled);

	EXPECT_EQ(getSync(store(), store().keyFor(kUntitled)).second.content, QStringLiteral("two"));
}

TEST_F(BackupStoreTests, LayoutIsScopedToTheWorkspace)
{
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("x")));

	const QString workspaceDir = QDir(m_home.path()).filePath(store().workspaceKey());
	EXPECT_EQ(store().workspaceDir(), workspaceDir);
	EXPECT_TRUE(QFileInfo::exists(QDir(workspaceDir).filePath(QStringLiteral("index.json"))));
	EXPECT_TRUE(QFileInfo::exists(store().entryPath(store().keyFor(kUntitled))));

	BackupStoreImpl other(m_home.path(), QStringLiteral("/work/other"), IdentityHasher(Qt::CaseSensitive));
	const auto [status, entries] = listSync(other);
	ASSERT_TRUE(status);
	EXPECT_TRUE(entries.isEmpty());
}

TEST_F(BackupStoreTests, MissingEntryIsNotFound)
{
	const auto [status, entry] = getSync(store(), store().keyFor(kFile));
	EXPECT_TRUE(status.is(BackupErrorKind::NotFound));

	EXPECT_TRUE(getSync(store(), QStringLiteral("../../etc/passwd")).first.is(BackupErrorKind::NotFound));
}

TEST_F(BackupStoreTests, RemoveIsIdempotent)
{
	ASSERT_TRUE(putSync(store(), kFile, QStringLiteral("fooFile")));
	const QString key = store().keyFor(kFile);

	EXPECT_TRUE(removeSync(store(), key));
	EXPECT_TRUE(removeSync(store(), key));
	EXPECT_TRUE(getSync(store(), key).first.is(BackupErrorKind::NotFound));
	EXPECT_TRUE(listSync(store()).second.isEmpty());
}

TEST_F(BackupStoreTests, ClearDeletesEveryEntryOfTheWorkspace)
{
	ASSERT_TRUE(putSync(store(), kFile, QStringLiteral("a")));
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("b")));

	EXPECT_TRUE(clearSync(store()));
	EXPECT_FALSE(QFileInfo::exists(store().workspaceDir()));
	EXPECT_TRUE(listSync(store()).second.isEmpty());

	// The store stays usable after a clear.
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("c")));
	EXPECT_EQ(listSync(store()).second.size(), 1);
}

TEST_F(BackupStoreTests, ListIsStableAcrossCalls)
{
	for (int i = 0; i < 20; ++i)
		ASSERT_TRUE(putSync(store(), DocumentIdentity::untitled(QStringLiteral("untitled-%1").arg(i)), QString::number(i)));

	const auto first = listSync(store()).second;
	const auto second = listSync(store()).second;
	ASSERT_EQ(first.size(), 20);
	ASSERT_EQ(second.size(), 20);
	for (int i = 0; i < first.size(); ++i)
		EXPECT_EQ(first.at(i).key, second.at(i).key);
}

TEST_F(BackupStoreTests, LostIndexIsRebuiltFromEntryHeaders)
{
	ASSERT_TRUE(putSync(store(), kFile, QStringLiteral("fooFile")));
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("x")));
	ASSERT_TRUE(store().waitForIdle());

	const QString indexPath = QDir(store().workspaceDir()).filePath(QStringLiteral("index.json"));
	ASSERT_TRUE(QFile::remove(indexPath));

	BackupStoreImpl reopened(m_home.path(), QStringLiteral("/work/project"), IdentityHasher(Qt::CaseSensitive));
	const auto [status, entries] = listSync(reopened);
	ASSERT_TRUE(status);
	ASSERT_EQ(entries.size(), 2);
	for (const auto& info : entries)
		EXPECT_TRUE(info.identity == kFile || info.identity == kUntitled);

	ASSERT_TRUE(reopened.waitForIdle());
	EXPECT_TRUE(QFileInfo::exists(indexPath));
}

TEST_F(BackupStoreTests, LargeUnindexedEntryIsRecoveredFromItsHeader)
{
	const QString content(512 * 1024, u'z');
	ASSERT_TRUE(putSync(store(), kFile, content));
	ASSERT_TRUE(store().waitForIdle());
	ASSERT_TRUE(QFile::remove(QDir(store().workspaceDir()).filePath(QStringLiteral("index.json"))));

	BackupStoreImpl reopened(m_home.path(), QStringLiteral("/work/project"), IdentityHasher(Qt::CaseSensitive));
	const auto [status, entries] = listSync(reopened);
	ASSERT_TRUE(status);
	ASSERT_EQ(entries.size(), 1);
	EXPECT_EQ(entries.front().identity, kFile);
	EXPECT_EQ(getSync(reopened, reopened.keyFor(kFile)).second.content, content);
}

TEST_F(BackupStoreTests, StaleIndexLinesArePruned)
{
	ASSERT_TRUE(putSync(store(), kFile, QStringLiteral("fooFile")));
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("x")));
	ASSERT_TRUE(store().waitForIdle());

	// Simulates a crash between deleting the entry and rewriting the index.
	ASSERT_TRUE(QFile::remove(store().entryPath(store().keyFor(kFile))));

	BackupStoreImpl reopened(m_home.path(), QStringLiteral("/work/project"), IdentityHasher(Qt::CaseSensitive));
	const auto [status, entries] = listSync(reopened);
	ASSERT_TRUE(status);
	ASSERT_EQ(entries.size(), 1);
	EXPECT_EQ(entries.front().identity, kUntitled);
	ASSERT_TRUE(reopened.waitForIdle());

	QString error;
	const QJsonObject index = Utils::AtomicFileUtils::readObject(
		QDir(reopened.workspaceDir()).filePath(QStringLiteral("index.json")), &error);
	ASSERT_TRUE(error.isEmpty());
	EXPECT_EQ(index.value(QStringLiteral("entries")).toObject().size(), 1);
}

TEST_F(BackupStoreTests, CorruptEntryIsReportedAndListed)
{
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("good")));
	const QString badKey = QString(40, u'b');
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(store().entryPath(badKey), QByteArray("garbage")));

	const auto [status, entry] = getSync(store(), badKey);
	EXPECT_TRUE(status.is(BackupErrorKind::CorruptEntry));

	const auto [listStatus, entries] = listSync(store());
	ASSERT_TRUE(listStatus);
	ASSERT_EQ(entries.size(), 2);
	int invalid = 0;
	for (const auto& info : entries) {
		if (!info.identity.isValid()) {
			++invalid;
			EXPECT_EQ(info.key, badKey);
		}
	}
	EXPECT_EQ(invalid, 1);
}

TEST_F(BackupStoreTests, EntryUnderTheWrongKeyIsCorrupt)
{
	ASSERT_TRUE(putSync(store(), kUntitled, QStringLiteral("good")));
	const QString wrongKey = QString(40, u'c');
	ASSERT_TRUE(QFile::copy(store().entryPath(store().keyFor(kUntitled)), store().entryPath(wrongKey)));

	EXPECT_TRUE(getSync(store(), wrongKey).first.is(BackupErrorKind::CorruptEntry));
}

TEST_F(BackupStoreTests, FileBackedEntriesRecordTheOriginal)
{
	QTemporaryDir work;
	ASSERT_TRUE(work.isValid());
	const QString path = QDir(work.path()).filePath(QStringLiteral("Bar.txt"));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(path, QByteArray("on disk")));

	const DocumentIdentity identity = DocumentIdentity::fromLocalFile(path);
	ASSERT_TRUE(putSync(store(), identity, QStringLiteral("barFile")));

	const auto [status, entry] = getSync(store(), store().keyFor(identity));
	ASSERT_TRUE(status);
	EXPECT_EQ(entry.meta.originalSize, 7);
	EXPECT_TRUE(entry.meta.originalModified.isValid());
}

TEST_F(BackupStoreTests, UnusableHomeReportsStoreUnavailable)
{
	const QString blocker = QDir(m_home.path()).filePath(QStringLiteral("blocker"));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(blocker, QByteArray("not a directory")));

	BackupStoreImpl broken(blocker, QStringLiteral("/work/project"), IdentityHasher(Qt::CaseSensitive));
	EXPECT_TRUE(putSync(broken, kUntitled, QStringLiteral("x")).is(BackupErrorKind::StoreUnavailable));
	EXPECT_TRUE(removeSync(broken, broken.keyFor(kUntitled)));
}

TEST_F(BackupStoreTests, UnlistableAreaReportsStoreUnavailable)
{
	const QString entriesPath = QDir(store().workspaceDir()).filePath(QStringLiteral("entries"));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(entriesPath, QByteArray("not a directory")));

	EXPECT_TRUE(listSync(store()).first.is(BackupErrorKind::StoreUnavailable));
}

TEST_F(BackupStoreTests, CompletionIsDroppedForDestroyedContext)
{
	int calls = 0;
	auto context = std::make_unique<QObject>();
	store().put(BackupSnapshot{kUntitled, QStringLiteral("x"), {}, 1}, context.get(),
				[&calls](const Backup::Api::BackupStatus&, const QString&) { ++calls; });
	context.reset();

	ASSERT_TRUE(store().waitForIdle());
	QCoreApplication::processEvents();
	EXPECT_EQ(calls, 0);
	EXPECT_TRUE(hasEntry(store(), kUntitled));
}
