// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QEventLoop>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>

#include "backup/api/BackupMetaTypes.hpp"
#include "backup/internal/BackupStoreImpl.hpp"
#include "backup/state/BackupSettings.hpp"
#include "backup/state/BackupWorkspaceRegistry.hpp"

#include <cstdlib>
#include <functional>

using Backup::Api::BackupEntry;
using Backup::Api::BackupEntryList;
using Backup::Api::BackupStatus;
using Backup::Internal::BackupStoreImpl;

static constexpr char noWorkspaceArgC[] = "-";

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static QString workspaceRootArg(const QString& arg)
{
	return arg == QLatin1String(noWorkspaceArgC) ? QString() : arg;
}

// Runs one store call to completion on a private event loop.
static void waitFor(const std::function<void(QObject* context, const std::function<void()>& finish)>& call)
{
	QObject context;
	QEventLoop loop;
	bool done = false;
	call(&context, [&] {
		done = true;
		loop.quit();
	});
	if (!done)
		loop.exec();
}

static int listWorkspaces(const QString& home)
{
	const Backup::BackupWorkspaceRegistry registry(home);
	QTextStream out(stdout);
	for (const auto& record : registry.workspaces())
		out << record.key << '\t' << (record.root.isEmpty() ? QStringLiteral("(no workspace)") : record.root) << '\n';
	return EXIT_SUCCESS;
}

static int listEntries(BackupStoreImpl& store)
{
	BackupStatus status;
	BackupEntryList entries;
	waitFor([&](QObject* context, const std::function<void()>& finish) {
		store.list(context, [&, finish](const BackupStatus& s, const BackupEntryList& e) {
			status = s;
			entries = e;
			finish();
		});
	});

	if (!status) {
		printErrorsAndFail(QStringLiteral("Cannot list backups."), status.errors);
		return EXIT_FAILURE;
	}

	QTextStream out(stdout);
	for (const auto& info : entries) {
		out << info.key << '\t'
			<< (info.identity.isValid() ? info.identity.toString() : QStringLiteral("(corrupt)")) << '\n';
	}
	return EXIT_SUCCESS;
}

static int showEntry(BackupStoreImpl& store, const QString& key)
{
	BackupStatus status;
	BackupEntry entry;
	waitFor([&](QObject* context, const std::function<void()>& finish) {
		store.get(key, context, [&, finish](const BackupStatus& s, const BackupEntry& e) {
			status = s;
			entry = e;
			finish();
		});
	});

	if (!status) {
		printErrorsAndFail(QStringLiteral("Cannot read backup %1 (%2).")
							   .arg(key, Backup::Api::errorKindName(status.code)),
						   status.errors);
		return EXIT_FAILURE;
	}

	QTextStream out(stdout);
	out << entry.content;
	return EXIT_SUCCESS;
}

static int discardWorkspace(BackupStoreImpl& store, const QString& home)
{
	BackupStatus status;
	waitFor([&](QObject* context, const std::function<void()>& finish) {
		store.clear(context, [&, finish](const BackupStatus& s) {
			status = s;
			finish();
		});
	});

	if (!status) {
		printErrorsAndFail(QStringLiteral("Cannot discard backups."), status.errors);
		return EXIT_FAILURE;
	}

	Backup::BackupWorkspaceRegistry registry(home);
	const Utils::Result unregistered = registry.unregisterWorkspace(store.workspaceRoot());
	if (!unregistered) {
		printErrorsAndFail(QStringLiteral("Backups discarded, but the registry was not updated."),
						   unregistered.errors);
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("Lifeboat"));
	Backup::registerBackupMetaTypes();

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Inspect and discard unsaved-document backups."));
	parser.addHelpOption();

	const QCommandLineOption homeOption(QStringList{QStringLiteral("home")},
										QStringLiteral("Backup home directory."),
										QStringLiteral("dir"));
	parser.addOption(homeOption);
	parser.addPositionalArgument(QStringLiteral("command"),
								 QStringLiteral("workspaces | list <root> | show <root> <key> | discard <root>. "
												"Use \"-\" as <root> for documents opened without a workspace."));
	parser.process(app);

	QString home = parser.value(homeOption);
	if (home.isEmpty())
		home = Backup::BackupSettings::loadFromFile().homeDir;

	const QStringList args = parser.positionalArguments();
	if (args.isEmpty()) {
		printErrorsAndFail(QStringLiteral("No command given."), {parser.helpText()});
		return EXIT_FAILURE;
	}

	const QString command = args.front();
	if (command == QLatin1String("workspaces") && args.size() == 1)
		return listWorkspaces(home);

	if (args.size() < 2) {
		printErrorsAndFail(QStringLiteral("Command \"%1\" needs a workspace root.").arg(command), {});
		return EXIT_FAILURE;
	}

	BackupStoreImpl store(home, workspaceRootArg(args.at(1)));

	if (command == QLatin1String("list") && args.size() == 2)
		return listEntries(store);
	if (command == QLatin1String("show") && args.size() == 3)
		return showEntry(store, args.at(2));
	if (command == QLatin1String("discard") && args.size() == 2)
		return discardWorkspace(store, home);

	printErrorsAndFail(QStringLiteral("Unknown command or wrong arguments: %1").arg(args.join(u' ')), {});
	return EXIT_FAILURE;
}
