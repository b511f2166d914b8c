#pragma once

#include <QFuture>
#include <QList>
#include <QSharedPointer>
#include <QString>

#include "Channel.h"
#include "ClientError.h"
#include "DirBrowser.h"
#include "RemoteSession.h"
#include "SshProfile.h"

/*
    RemoteBrowser
    -------------
    SFTP browser. Every listing runs on a pool thread that dials its own
    session and answers on a one-shot channel; poll() picks the answer up
    on the next tick. A listing that arrives after the user moved on is
    dropped.

    While loading, entries() is empty and isLoading() is true. A failed
    listing leaves the error text in error().
*/
class RemoteBrowser : public DirBrowser
{
public:
    explicit RemoteBrowser(QSharedPointer<SshBackend> backend);
    ~RemoteBrowser() override;

    RemoteBrowser(const RemoteBrowser&) = delete;
    RemoteBrowser& operator=(const RemoteBrowser&) = delete;

    // last_remote_dir, else /home/<user>, else "/"
    static QString resolveStart(const SshProfile& profile);

    // Starts listing `dir`. If that fails the worker tries the remote home
    // directory, then "/" once.
    void open(const SshProfile& profile, const QString& dir, bool onlyDirs);

    void reload();
    void setShowHidden(bool show);

    // Backspace. No-op at "/".
    void ascend();

    // Enter. In only-dirs mode the directory is checked with
    // hasSubdirectories() on `session` (the open session) first.
    EnterOutcome enterSelected(RemoteSession* session, ClientError* err = nullptr);

    bool isLoading() const { return m_loading; }
    const QString& error() const { return m_error; }
    const SshProfile& profile() const { return m_profile; }

    // Returns true when a listing (or its failure) was applied.
    bool poll();

    void waitForWorkers();

private:
    struct Listing {
        quint64           generation = 0;
        bool              ok = false;
        QString           cwd;
        QVector<DirEntry> entries;
        QString           error;
    };

    void fetch(const QString& dir, bool withFallback);

    QSharedPointer<SshBackend> m_backend;
    SshProfile                 m_profile;

    bool                       m_loading = false;
    QString                    m_error;

    quint64                    m_generation = 0;
    OneShotPtr<Listing>        m_pending;
    QList<QFuture<void>>       m_workers;
};
