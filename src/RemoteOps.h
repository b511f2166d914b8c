#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include "Channel.h"
#include "ClientError.h"
#include "RemoteSession.h"

// Browser entry. `path` is absolute.
struct DirEntry
{
    QString name;
    QString path;
    bool    isDir = false;

    bool operator==(const DirEntry& o) const
    {
        return name == o.name && path == o.path && isDir == o.isDir;
    }
};

// Message on a transfer's progress channel. Done is always the last one.
struct TransferUpdate
{
    enum class Kind { Progress, Done };

    Kind        kind  = Kind::Progress;
    quint64     bytes = 0;     // Progress
    bool        ok    = false; // Done
    ClientError error;         // Done, when !ok

    static TransferUpdate progress(quint64 n)
    {
        TransferUpdate u;
        u.kind = Kind::Progress;
        u.bytes = n;
        return u;
    }

    static TransferUpdate done(bool ok, const ClientError& error = ClientError())
    {
        TransferUpdate u;
        u.kind = Kind::Done;
        u.ok = ok;
        u.error = error;
        return u;
    }
};

using ProgressChannel = Channel<TransferUpdate>;
using ProgressPtr     = ChannelPtr<TransferUpdate>;

namespace RemoteOps {

static constexpr int kChunkBytes    = 8 * 1024;
static constexpr int kMaxWalkDepth  = 64;

quint64 saturatingAdd(quint64 a, quint64 b);

// Trim one trailing '/' from base, then base + "/" + name ("/" + name for root).
QString joinRemote(const QString& base, const QString& name);

// "/x/y/" -> "/x", "/x" -> "/", "/" -> "/", "x" -> "/"
QString parentRemoteDir(const QString& path);

// Last path component after trimming trailing slashes.
QString remoteBaseName(const QString& path);

// Leading "~/" becomes the home directory.
QString expandTilde(const QString& path);

// Sorted by lowercased name; "." and ".." never appear.
bool listRemoteDir(RemoteSession& session,
                   const QString& dir,
                   bool onlyDirs,
                   bool showHidden,
                   QVector<DirEntry>* out,
                   ClientError* err = nullptr);

// Stops at the first directory found.
bool hasSubdirectories(RemoteSession& session,
                       const QString& dir,
                       bool* out,
                       ClientError* err = nullptr);

// File: stat size. Directory: recursive sum of file sizes (saturating).
bool remoteSize(RemoteSession& session,
                const QString& path,
                bool isDir,
                quint64* out,
                ClientError* err = nullptr);

bool localSize(const QString& path,
               bool isDir,
               quint64* out,
               ClientError* err = nullptr);

bool listLocalDir(const QString& dir,
                  bool onlyDirs,
                  bool showHidden,
                  QVector<DirEntry>* out,
                  ClientError* err = nullptr);

// Copies `localSource` into `remoteTargetDir/<basename>`.
// Sends Progress(n) after every chunk write and checks `cancel` before
// every file and every chunk. Does not send Done.
bool uploadPath(RemoteSession& session,
                const QString& localSource,
                const QString& remoteTargetDir,
                bool isDir,
                const ProgressPtr& progress,
                const CancelPtr& cancel,
                ClientError* err = nullptr);

// Copies `remoteSource` into `localTargetDir/<basename>`, creating local
// directories as needed. Same progress / cancel contract as uploadPath().
bool downloadPath(RemoteSession& session,
                  const QString& remoteSource,
                  const QString& localTargetDir,
                  bool isDir,
                  const ProgressPtr& progress,
                  const CancelPtr& cancel,
                  ClientError* err = nullptr);

} // namespace RemoteOps
