// SshClient.h
//
// Purpose:
//   libssh implementation of RemoteSession:
//     - TCP connect (5 s timeout per address) + handshake + auth
//     - SFTP readdir/stat/mkdir/open for the browsers and transfers
//     - `pwd` over an exec channel (remote home)
//     - PTY shell channel for the embedded terminal
//
// Threading:
//   One SshClient is used by one thread at a time. Transfers and remote
//   listings dial their own client through LibsshBackend.

#pragma once

#include <QString>
#include <QtGlobal>

#include <memory>

#include "RemoteSession.h"
#include "SshProfile.h"

// Forward-declare libssh types to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;
struct sftp_session_struct;
using sftp_session = sftp_session_struct*;

class SshClient : public RemoteSession
{
public:
    static constexpr int kTimeoutSeconds = 5;
    static constexpr int kSshPort = 22;

    SshClient() = default;
    ~SshClient() override;

    SshClient(const SshClient&) = delete;
    SshClient& operator=(const SshClient&) = delete;

    // Resolve, connect, handshake and authenticate by the profile's auth.
    // Any failure is a DialFailure.
    bool connectProfile(const SshProfile& profile, ClientError* err = nullptr);

    // Close/free current libssh session (safe to call multiple times).
    void disconnect();

    bool isConnected() const { return m_session != nullptr; }

    // RemoteSession
    bool forEachEntry(const QString& dir, const EntryVisitor& visit, ClientError* err) override;
    bool statPath(const QString& path, RemoteStat* out, ClientError* err) override;
    bool makeDir(const QString& path, bool* alreadyExists, ClientError* err) override;
    std::unique_ptr<RemoteFile> openForRead(const QString& path, ClientError* err) override;
    std::unique_ptr<RemoteFile> openForWrite(const QString& path, ClientError* err) override;
    bool homeDir(QString* out, ClientError* err) override;
    std::unique_ptr<ShellChannel> openShell(int cols, int rows, ClientError* err) override;

private:
    // Opens the SFTP subsystem on first use.
    bool ensureSftp(ClientError* err);
    QString sftpError(const QString& what, const QString& path) const;

    ssh_session  m_session = nullptr;
    sftp_session m_sftp    = nullptr;
    QString      m_label;   // user@host, for logs
};

// Dials a fresh SshClient per call.
class LibsshBackend : public SshBackend
{
public:
    std::unique_ptr<RemoteSession> dial(const SshProfile& profile, ClientError* err) override;
};
