// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "backup/Constants.hpp"
#include "backup/internal/BackupRestorer.hpp"
#include "backup/internal/BackupStoreImpl.hpp"

#include "BackupTestSupport.hpp"
#include "InMemoryEditorHost.hpp"

#include <utils/filesystem/AtomicFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>

#include <gtest/gtest.h>

#include <memory>

using namespace Backup::Tests;
using Backup::IdentityHasher;
using Backup::Api::DocumentHandle;
using Backup::Api::DocumentIdentity;
using Backup::Api::DocumentKind;
using Backup::Api::RestoreResult;
using Backup::Internal::BackupRestorer;
using Backup::Internal::BackupStoreImpl;

namespace {

class BackupRestorerTests : public ::testing::Test {
protected:
	void SetUp() override
	{
		ensureCoreApp();
		ASSERT_TRUE(m_home.isValid());
		m_store = std::make_unique<BackupStoreImpl>(m_home.path(), QStringLiteral("/work/project"),
													IdentityHasher(Qt::CaseSensitive));
	}

	RestoreResult runRestorer(Backup::Api::IBackupStore& store)
	{
		BackupRestorer restorer(&m_host, &store);
		QSignalSpy finished(&restorer, &BackupRestorer::finished);
		restorer.run();
		EXPECT_TRUE(restorer.isRunning());
		EXPECT_TRUE(finished.wait(kWaitMs));
		EXPECT_FALSE(restorer.isRunning());
		return restorer.lastResult();
	}

	QTemporaryDir m_home;
	InMemoryEditorHost m_host;
	std::unique_ptr<BackupStoreImpl> m_store;
};

const DocumentIdentity kUntitled1 = DocumentIdentity::untitled(QStringLiteral("untitled-1"));
const DocumentIdentity kUntitled2 = DocumentIdentity::untitled(QStringLiteral("untitled-2"));
const DocumentIdentity kFoo = DocumentIdentity::fromLocalFile(QStringLiteral("/work/project/Foo"));
const DocumentIdentity kBar = DocumentIdentity::fromLocalFile(QStringLiteral("/work/project/Bar"));

} // namespace

TEST_F(BackupRestorerTests, ReopensEveryBackupAsDirtyDocument)
{
	ASSERT_TRUE(putSync(*m_store, kUntitled1, QStringLiteral("untitled-1")));
	ASSERT_TRUE(putSync(*m_store, kUntitled2, QStringLiteral("untitled-2")));
	ASSERT_TRUE(putSync(*m_store, kFoo, QStringLiteral("fooFile")));
	ASSERT_TRUE(putSync(*m_store, kBar, QStringLiteral("barFile")));

	const RestoreResult result = runRestorer(*m_store);
	EXPECT_TRUE(result.storeAvailable);
	EXPECT_EQ(result.opened.size(), 4);
	EXPECT_TRUE(result.attached.isEmpty());
	EXPECT_TRUE(result.skippedKeys.isEmpty());
	EXPECT_EQ(m_host.documentCount(), 4);

	const QVector<QPair<DocumentIdentity, QString>> expected = {
		{kUntitled1, QStringLiteral("untitled-1")},
		{kUntitled2, QStringLiteral("untitled-2")},
		{kFoo, QStringLiteral("fooFile")},
		{kBar, QStringLiteral("barFile")},
	};
	for (const auto& [identity, content] : expected) {
		const InMemoryEditorHost::Document* doc = m_host.documentByIdentity(identity);
		ASSERT_NE(doc, nullptr) << identity.toString().toStdString();
		EXPECT_TRUE(doc->dirty);
		EXPECT_EQ(doc->content, content);
		EXPECT_TRUE(result.restored().contains(identity));
	}
}

TEST_F(BackupRestorerTests, EditorTypeFollowsTheIdentityKind)
{
	const DocumentIdentity virtualDoc = DocumentIdentity::parse(QStringLiteral("mem://scratch/notes"));
	ASSERT_TRUE(putSync(*m_store, kUntitled1, QStringLiteral("u")));
	ASSERT_TRUE(putSync(*m_store, kFoo, QStringLiteral("f")));
	ASSERT_TRUE(putSync(*m_store, virtualDoc, QStringLiteral("v")));

	runRestorer(*m_store);

	EXPECT_EQ(m_host.documentByIdentity(kUntitled1)->editorTypeId,
			  QString::fromLatin1(Backup::Constants::kEditorTypeUntitled));
	EXPECT_EQ(m_host.documentByIdentity(kFoo)->editorTypeId, QString::fromLatin1(Backup::Constants::kEditorTypeFile));
	EXPECT_EQ(m_host.documentByIdentity(virtualDoc)->editorTypeId,
			  QString::fromLatin1(Backup::Constants::kEditorTypeVirtual));
	EXPECT_EQ(BackupRestorer::editorTypeFor(DocumentKind::FileBacked),
			  QString::fromLatin1(Backup::Constants::kEditorTypeFile));
}

TEST_F(BackupRestorerTests, AlreadyOpenDocumentIsAttachedNotDuplicated)
{
	const DocumentHandle open = m_host.openClean(kFoo, QStringLiteral("content on disk"));
	ASSERT_TRUE(putSync(*m_store, kFoo, QStringLiteral("fooFile")));
	ASSERT_TRUE(putSync(*m_store, kBar, QStringLiteral("barFile")));

	const RestoreResult result = runRestorer(*m_store);
	EXPECT_EQ(result.attached.size(), 1);
	EXPECT_EQ(result.opened.size(), 1);
	EXPECT_EQ(result.count(), 2);

	EXPECT_EQ(m_host.openCount(kFoo), 1);
	EXPECT_EQ(m_host.openRequests(), 1);
	EXPECT_EQ(m_host.attachCalls(), 1);
	EXPECT_TRUE(m_host.isDirty(open));
	EXPECT_EQ(m_host.snapshot(open).content, QStringLiteral("fooFile"));
}

TEST_F(BackupRestorerTests, CorruptEntryIsSkippedAndOthersRestored)
{
	ASSERT_TRUE(putSync(*m_store, kUntitled1, QStringLiteral("untitled-1")));
	ASSERT_TRUE(putSync(*m_store, kFoo, QStringLiteral("fooFile")));

	const QString corruptKey = QString(40, u'0');
	const QString unparsableKey = QString(40, u'1');
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(m_store->entryPath(corruptKey), QByteArray("\x01\x02junk")));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(
		m_store->entryPath(unparsableKey), QByteArray("::: {\"format\":1,\"version\":\"1\"}\ncontent")));

	const RestoreResult result = runRestorer(*m_store);
	EXPECT_TRUE(result.storeAvailable);
	EXPECT_EQ(result.opened.size(), 2);
	EXPECT_EQ(result.skippedKeys.size(), 2);
	EXPECT_TRUE(result.skippedKeys.contains(corruptKey));
	EXPECT_TRUE(result.skippedKeys.contains(unparsableKey));
	EXPECT_EQ(m_host.documentCount(), 2);
}

TEST_F(BackupRestorerTests, FailedOpenIsSkipped)
{
	ASSERT_TRUE(putSync(*m_store, kUntitled1, QStringLiteral("untitled-1")));
	m_host.setFailOpens(true);

	const RestoreResult result = runRestorer(*m_store);
	EXPECT_TRUE(result.isEmpty());
	EXPECT_EQ(result.skippedKeys, QStringList{m_store->keyFor(kUntitled1)});
}

TEST_F(BackupRestorerTests, RestorerNeverDeletesEntries)
{
	ASSERT_TRUE(putSync(*m_store, kUntitled1, QStringLiteral("untitled-1")));
	ASSERT_TRUE(putSync(*m_store, kBar, QStringLiteral("barFile")));

	runRestorer(*m_store);
	EXPECT_EQ(listSync(*m_store).second.size(), 2);

	// Running again attaches to the documents opened by the first run.
	const RestoreResult second = runRestorer(*m_store);
	EXPECT_EQ(second.attached.size(), 2);
	EXPECT_TRUE(second.opened.isEmpty());
	EXPECT_EQ(m_host.documentCount(), 2);
}

TEST_F(BackupRestorerTests, EmptyStoreFinishesWithEmptyResult)
{
	const RestoreResult result = runRestorer(*m_store);
	EXPECT_TRUE(result.storeAvailable);
	EXPECT_TRUE(result.isEmpty());
	EXPECT_TRUE(result.skippedKeys.isEmpty());
}

TEST_F(BackupRestorerTests, UnavailableStoreNotifiesOnce)
{
	FaultyBackupStore faulty(m_store.get());
	faulty.setFailList(true);

	BackupRestorer restorer(&m_host, &faulty);
	QSignalSpy unavailable(&restorer, &BackupRestorer::storeUnavailable);
	QSignalSpy finished(&restorer, &BackupRestorer::finished);
	restorer.run();

	ASSERT_TRUE(finished.wait(kWaitMs));
	EXPECT_EQ(unavailable.count(), 1);
	EXPECT_FALSE(restorer.lastResult().storeAvailable);
	EXPECT_TRUE(restorer.lastResult().isEmpty());
	EXPECT_EQ(m_host.documentCount(), 0);
}

TEST_F(BackupRestorerTests, BackupWinsOverChangedOriginal)
{
	QTemporaryDir work;
	ASSERT_TRUE(work.isValid());
	const QString path = QDir(work.path()).filePath(QStringLiteral("Foo.txt"));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(path, QByteArray("v1")));

	const DocumentIdentity identity = DocumentIdentity::fromLocalFile(path);
	ASSERT_TRUE(putSync(*m_store, identity, QStringLiteral("unsaved edit")));
	ASSERT_TRUE(Utils::AtomicFileUtils::writeBytesAtomic(path, QByteArray("changed elsewhere")));

	const RestoreResult result = runRestorer(*m_store);
	ASSERT_EQ(result.opened.size(), 1);
	EXPECT_EQ(m_host.documentByIdentity(identity)->content, QStringLiteral("unsaved edit"));
}

TEST_F(BackupRestorerTests, RelativeAndQueryIdentitiesSurviveTheRoundTrip)
{
	const DocumentIdentity relative = DocumentIdentity::fromLocalFile(QStringLiteral("Foo"));
	const DocumentIdentity head = DocumentIdentity::parse(QStringLiteral("git:/src/a.cpp?ref=HEAD"));
	const DocumentIdentity previous = DocumentIdentity::parse(QStringLiteral("git:/src/a.cpp?ref=HEAD~1"));
	ASSERT_TRUE(putSync(*m_store, relative, QStringLiteral("fooFile")));
	ASSERT_TRUE(putSync(*m_store, head, QStringLiteral("head text")));
	ASSERT_TRUE(putSync(*m_store, previous, QStringLiteral("previous text")));

	const RestoreResult result = runRestorer(*m_store);
	EXPECT_TRUE(result.skippedKeys.isEmpty());
	EXPECT_EQ(result.opened.size(), 3);
	EXPECT_EQ(m_host.documentByIdentity(relative)->content, QStringLiteral("fooFile"));
	EXPECT_EQ(m_host.documentByIdentity(head)->content, QStringLiteral("head text"));
	EXPECT_EQ(m_host.documentByIdentity(previous)->content, QStringLiteral("previous text"));
}
