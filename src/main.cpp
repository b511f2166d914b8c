/*
 * SS-SSH: Super simple SSH client
 *
 * Copyright (c) 2025 The ss-ssh authors
 *
 * Licensed under the MIT License
 * https://opensource.org/licenses/MIT
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>

#include <cstdio>

#include "ClientApp.h"
#include "ConsoleUi.h"
#include "Logger.h"
#include "ProfileStore.h"
#include "SshClient.h"
#include "TerminalIo.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Create QCoreApplication and set metadata for QSettings / QStandardPaths
// - Parse --config, --log-file, --log-level (persisted in QSettings)
// - Install logging before anything else logs
// - Create or unlock the encrypted profile store with the master password
// - Run the console front end inside the Qt event loop

static void printError(const QString& message)
{
    std::fprintf(stderr, "%s\n", message.toUtf8().constData());
    std::fflush(stderr);
}

// First run: ask twice until both entries agree.
// Returns false if stdin closed.
static bool initializeStore(ProfileStore& store)
{
    TerminalIo::writeOut("No profile store found. Choose a master password.\n");

    for (;;) {
        QString password;
        QString confirm;
        if (!TerminalIo::promptLine("Master password: ", true, &password))
            return false;
        if (!TerminalIo::promptLine("Confirm master password: ", true, &confirm))
            return false;

        ClientError err;
        if (store.initialize(password, confirm, &err))
            return true;

        printError(err.message);
        if (err.kind == ErrorKind::StoreIoFailure)
            return false;
    }
}

// Asks until the verifier decrypts. Store file errors are fatal.
static bool unlockStore(ProfileStore& store)
{
    for (;;) {
        QString password;
        if (!TerminalIo::promptLine("Master password: ", true, &password))
            return false;

        ClientError err;
        if (store.unlock(password, &err))
            return true;

        if (err.kind != ErrorKind::MasterMismatch) {
            printError(err.message);
            return false;
        }
        printError("Wrong master password");
    }
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Stable names: QSettings keys and QStandardPaths resolve from these, e.g.
    //   ~/.config/ss-ssh/ss-ssh.conf
    //   ~/.local/share/ss-ssh/ss-ssh/logs/ss-ssh.log
    QCoreApplication::setOrganizationName("ss-ssh");
    QCoreApplication::setApplicationName("ss-ssh");
    QCoreApplication::setApplicationVersion("0.9.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("SSH connection manager with encrypted profiles, SFTP transfers and terminals");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOpt("config", "Profile store file.", "path");
    const QCommandLineOption logFileOpt("log-file", "Log file (remembered).", "path");
    const QCommandLineOption logLevelOpt("log-level", "0 = errors only, 1 = normal, 2 = debug (remembered).", "level");
    parser.addOption(configOpt);
    parser.addOption(logFileOpt);
    parser.addOption(logLevelOpt);
    parser.process(app);

    QSettings s;

    if (parser.isSet(logLevelOpt)) {
        bool ok = false;
        const int level = parser.value(logLevelOpt).toInt(&ok);
        if (!ok || level < 0 || level > 2) {
            printError("--log-level must be 0, 1 or 2");
            return 2;
        }
        s.setValue("log/level", level);
    }
    if (parser.isSet(logFileOpt))
        s.setValue("log/file", parser.value(logFileOpt));

    // Logging: level + optional file override must be applied before install().
    Logger::setLogLevel(s.value("log/level", 1).toInt());
    Logger::setLogFilePathOverride(s.value("log/file").toString());
    Logger::install("ss-ssh");

    if (!TerminalIo::isTerminal(0)) {
        printError("ss-ssh needs an interactive terminal");
        return 1;
    }

    const QString storePath = parser.isSet(configOpt) ? parser.value(configOpt)
                                                      : ProfileStore::defaultPath();

    QSharedPointer<SshBackend> backend(new LibsshBackend());
    ClientApp client(storePath, backend);

    const bool ready = client.store().exists() ? unlockStore(client.store())
                                               : initializeStore(client.store());
    if (!ready)
        return 1;

    qInfo().noquote() << QString("Store unlocked: %1 (%2 profiles)")
                             .arg(client.store().path())
                             .arg(client.store().count());

    ConsoleUi ui(client, backend);
    QObject::connect(&ui, &ConsoleUi::quitRequested, &app, &QCoreApplication::quit);

    if (!ui.start()) {
        printError("Cannot switch the terminal to raw mode");
        return 1;
    }

    const int rc = app.exec();

    ui.shutdown();
    client.waitForWorkers();
    qInfo() << "Exiting";
    return rc;
}
