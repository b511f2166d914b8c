#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include <functional>
#include <memory>

#include "ClientError.h"
#include "SshProfile.h"

// Metadata of one remote path as reported by SFTP.
// For readdir results `isLink` means the entry itself is a symlink; its
// `isDir`/`size` then describe the link, not the target.
struct RemoteStat
{
    QString name;
    quint64 size   = 0;
    bool    isDir  = false;
    bool    isLink = false;
};

// Open remote file handle. read() returns 0 at EOF, -1 on error.
class RemoteFile
{
public:
    virtual ~RemoteFile() = default;

    virtual qint64 read(char* buf, qint64 maxLen, ClientError* err) = 0;
    virtual bool   writeAll(const char* buf, qint64 len, ClientError* err) = 0;
};

// Interactive PTY shell channel. Bytes in both directions are raw.
class ShellChannel
{
public:
    virtual ~ShellChannel() = default;

    // Non-blocking: returns immediately with whatever is buffered.
    virtual bool readAvailable(QByteArray* out, ClientError* err) = 0;
    virtual bool write(const QByteArray& data, ClientError* err) = 0;
    virtual bool atEnd() const = 0;

    // -1 when unknown
    virtual int  exitStatus() const = 0;
    virtual void close() = 0;
};

/*
 * RemoteSession
 * -------------
 * One authenticated SSH connection with its SFTP subsystem.
 *
 * Not thread-safe: a session is used by exactly one thread at a time.
 * Workers dial their own session instead of borrowing one.
 */
class RemoteSession
{
public:
    virtual ~RemoteSession() = default;

    // Return false from the visitor to stop early.
    using EntryVisitor = std::function<bool(const RemoteStat&)>;

    // readdir; "." and ".." are never reported.
    virtual bool forEachEntry(const QString& dir, const EntryVisitor& visit, ClientError* err) = 0;

    // stat (follows symlinks)
    virtual bool statPath(const QString& path, RemoteStat* out, ClientError* err) = 0;

    // mkdir 0755. An existing directory is reported through `alreadyExists`.
    virtual bool makeDir(const QString& path, bool* alreadyExists, ClientError* err) = 0;

    virtual std::unique_ptr<RemoteFile> openForRead(const QString& path, ClientError* err) = 0;

    // truncate | create | write, mode 0644
    virtual std::unique_ptr<RemoteFile> openForWrite(const QString& path, ClientError* err) = 0;

    // Output of `pwd` in a fresh exec channel, trimmed.
    virtual bool homeDir(QString* out, ClientError* err) = 0;

    // PTY "xterm-256color" of the given size, then shell.
    virtual std::unique_ptr<ShellChannel> openShell(int cols, int rows, ClientError* err) = 0;
};

/*
 * SshBackend
 * ----------
 * Factory for sessions. The real backend talks libssh; tests substitute
 * one that serves a local directory tree.
 *
 * dial() is called from worker threads; implementations must be safe for
 * concurrent use.
 */
class SshBackend
{
public:
    virtual ~SshBackend() = default;

    virtual std::unique_ptr<RemoteSession> dial(const SshProfile& profile, ClientError* err) = 0;
};
