// RemoteOps.cpp
//
// Listing, sizing and recursive copy on top of a RemoteSession.
//
// Everything here is synchronous and runs on whichever thread owns the
// session (a worker for transfers, listings and remote size).
//
// Traversal rules:
//   - depth-first, children in case-insensitive name order
//   - symlinks are followed; nesting deeper than kMaxWalkDepth fails
//   - the first failure aborts the walk; partial output is left in place

#include "RemoteOps.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

#include <algorithm>
#include <limits>

namespace RemoteOps {

namespace {

template <typename T>
void sortByLowerName(QVector<T>& v)
{
    std::stable_sort(v.begin(), v.end(), [](const T& a, const T& b) {
        return a.name.toLower() < b.name.toLower();
    });
}

bool cancelled(const CancelPtr& cancel, ClientError* err)
{
    if (cancel && cancel->isSet())
        return !failWith(err, ErrorKind::Cancelled, "Transfer cancelled");
    return false;
}

bool depthExceeded(int depth, ErrorKind kind, const QString& path, ClientError* err)
{
    if (depth <= kMaxWalkDepth)
        return false;
    return !failWith(err, kind,
                     QString("Directory nesting deeper than %1 levels at %2 (symlink loop?)")
                         .arg(kMaxWalkDepth)
                         .arg(path));
}

// readdir + resolve symlinks + sort
bool readRemoteEntries(RemoteSession& session, const QString& dir,
                       QVector<RemoteStat>* out, ClientError* err)
{
    QVector<RemoteStat> entries;
    const bool ok = session.forEachEntry(dir, [&entries](const RemoteStat& st) {
        entries.push_back(st);
        return true;
    }, err);
    if (!ok)
        return false;

    for (RemoteStat& st : entries) {
        if (!st.isLink)
            continue;
        RemoteStat target;
        if (session.statPath(joinRemote(dir, st.name), &target, nullptr)) {
            st.isDir = target.isDir;
            st.size = target.size;
        }
        // Dangling links stay as plain entries; opening them fails later.
    }

    sortByLowerName(entries);
    *out = entries;
    return true;
}

quint64 remoteTreeSize(RemoteSession& session, const QString& dir, int depth,
                       bool* ok, ClientError* err)
{
    if (depthExceeded(depth, ErrorKind::SftpFailure, dir, err)) {
        *ok = false;
        return 0;
    }

    QVector<RemoteStat> entries;
    if (!readRemoteEntries(session, dir, &entries, err)) {
        *ok = false;
        return 0;
    }

    quint64 total = 0;
    for (const RemoteStat& st : entries) {
        if (st.isDir) {
            const quint64 sub = remoteTreeSize(session, joinRemote(dir, st.name), depth + 1, ok, err);
            if (!*ok)
                return 0;
            total = saturatingAdd(total, sub);
        } else {
            total = saturatingAdd(total, st.size);
        }
    }
    return total;
}

quint64 localTreeSize(const QString& dir, int depth, bool* ok, ClientError* err)
{
    if (depthExceeded(depth, ErrorKind::LocalIoFailure, dir, err)) {
        *ok = false;
        return 0;
    }

    QVector<DirEntry> entries;
    if (!listLocalDir(dir, false, true, &entries, err)) {
        *ok = false;
        return 0;
    }

    quint64 total = 0;
    for (const DirEntry& e : entries) {
        if (e.isDir) {
            const quint64 sub = localTreeSize(e.path, depth + 1, ok, err);
            if (!*ok)
                return 0;
            total = saturatingAdd(total, sub);
        } else {
            const qint64 sz = QFileInfo(e.path).size();
            total = saturatingAdd(total, sz > 0 ? static_cast<quint64>(sz) : 0);
        }
    }
    return total;
}

// ------------------------------------------------------------
// Upload
// ------------------------------------------------------------
bool uploadFile(RemoteSession& session, const QString& localPath, const QString& remotePath,
                const ProgressPtr& progress, const CancelPtr& cancel, ClientError* err)
{
    if (cancelled(cancel, err))
        return false;

    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly))
        return failWith(err, ErrorKind::LocalIoFailure,
                        QString("Cannot open local file '%1': %2").arg(localPath, in.errorString()));

    std::unique_ptr<RemoteFile> out = session.openForWrite(remotePath, err);
    if (!out)
        return false;

    QByteArray buf(kChunkBytes, Qt::Uninitialized);
    while (true) {
        if (cancelled(cancel, err))
            return false;

        const qint64 n = in.read(buf.data(), buf.size());
        if (n < 0)
            return failWith(err, ErrorKind::LocalIoFailure,
                            QString("Read failed on '%1': %2").arg(localPath, in.errorString()));
        if (n == 0)
            break;

        if (!out->writeAll(buf.constData(), n, err))
            return false;

        if (progress)
            progress->send(TransferUpdate::progress(static_cast<quint64>(n)));
    }
    return true;
}

bool uploadDir(RemoteSession& session, const QString& localDir, const QString& remoteDir, int depth,
               const ProgressPtr& progress, const CancelPtr& cancel, ClientError* err)
{
    if (depthExceeded(depth, ErrorKind::LocalIoFailure, localDir, err))
        return false;
    if (cancelled(cancel, err))
        return false;

    bool existed = false;
    if (!session.makeDir(remoteDir, &existed, err))
        return false;

    QVector<DirEntry> children;
    if (!listLocalDir(localDir, false, true, &children, err))
        return false;

    for (const DirEntry& child : children) {
        const QString remoteChild = joinRemote(remoteDir, child.name);
        const bool ok = child.isDir
            ? uploadDir(session, child.path, remoteChild, depth + 1, progress, cancel, err)
            : uploadFile(session, child.path, remoteChild, progress, cancel, err);
        if (!ok)
            return false;
    }
    return true;
}

// ------------------------------------------------------------
// Download
// ------------------------------------------------------------
bool downloadFile(RemoteSession& session, const QString& remotePath, const QString& localPath,
                  const ProgressPtr& progress, const CancelPtr& cancel, ClientError* err)
{
    if (cancelled(cancel, err))
        return false;

    std::unique_ptr<RemoteFile> in = session.openForRead(remotePath, err);
    if (!in)
        return false;

    QFile out(localPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return failWith(err, ErrorKind::LocalIoFailure,
                        QString("Cannot create local file '%1': %2").arg(localPath, out.errorString()));

    QByteArray buf(kChunkBytes, Qt::Uninitialized);
    while (true) {
        if (cancelled(cancel, err))
            return false;

        const qint64 n = in->read(buf.data(), buf.size(), err);
        if (n < 0)
            return false;
        if (n == 0)
            break;

        if (out.write(buf.constData(), n) != n)
            return failWith(err, ErrorKind::LocalIoFailure,
                            QString("Write failed on '%1': %2").arg(localPath, out.errorString()));

        if (progress)
            progress->send(TransferUpdate::progress(static_cast<quint64>(n)));
    }

    if (!out.flush())
        return failWith(err, ErrorKind::LocalIoFailure,
                        QString("Write failed on '%1': %2").arg(localPath, out.errorString()));
    return true;
}

bool downloadDir(RemoteSession& session, const QString& remoteDir, const QString& localDir, int depth,
                 const ProgressPtr& progress, const CancelPtr& cancel, ClientError* err)
{
    if (depthExceeded(depth, ErrorKind::SftpFailure, remoteDir, err))
        return false;
    if (cancelled(cancel, err))
        return false;

    if (!QDir().mkpath(localDir))
        return failWith(err, ErrorKind::LocalIoFailure,
                        QString("Cannot create local directory '%1'").arg(localDir));

    QVector<RemoteStat> children;
    if (!readRemoteEntries(session, remoteDir, &children, err))
        return false;

    for (const RemoteStat& child : children) {
        const QString remoteChild = joinRemote(remoteDir, child.name);
        const QString localChild = QDir(localDir).filePath(child.name);
        const bool ok = child.isDir
            ? downloadDir(session, remoteChild, localChild, depth + 1, progress, cancel, err)
            : downloadFile(session, remoteChild, localChild, progress, cancel, err);
        if (!ok)
            return false;
    }
    return true;
}

} // namespace

// ------------------------------------------------------------
// Path helpers
// ------------------------------------------------------------
quint64 saturatingAdd(quint64 a, quint64 b)
{
    const quint64 maxv = std::numeric_limits<quint64>::max();
    return (b > maxv - a) ? maxv : a + b;
}

QString joinRemote(const QString& base, const QString& name)
{
    if (base == "/")
        return "/" + name;
    QString b = base;
    if (b.endsWith('/'))
        b.chop(1);
    return b + "/" + name;
}

QString parentRemoteDir(const QString& path)
{
    QString p = path;
    while (p.endsWith('/'))
        p.chop(1);

    const int slash = p.lastIndexOf('/');
    if (slash < 0)
        return "/";
    const QString base = p.left(slash);
    return base.isEmpty() ? QStringLiteral("/") : base;
}

QString remoteBaseName(const QString& path)
{
    QString p = path;
    while (p.endsWith('/'))
        p.chop(1);
    return p.mid(p.lastIndexOf('/') + 1);
}

QString expandTilde(const QString& path)
{
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

// ------------------------------------------------------------
// Listing / sizing
// ------------------------------------------------------------
bool listRemoteDir(RemoteSession& session,
                   const QString& dir,
                   bool onlyDirs,
                   bool showHidden,
                   QVector<DirEntry>* out,
                   ClientError* err)
{
    clearError(err);

    QVector<RemoteStat> raw;
    if (!readRemoteEntries(session, dir, &raw, err))
        return false;

    QVector<DirEntry> entries;
    for (const RemoteStat& st : raw) {
        if (!showHidden && st.name.startsWith('.'))
            continue;
        if (onlyDirs && !st.isDir)
            continue;
        DirEntry e;
        e.name = st.name;
        e.path = joinRemote(dir, st.name);
        e.isDir = st.isDir;
        entries.push_back(e);
    }

    *out = entries;
    return true;
}

bool hasSubdirectories(RemoteSession& session, const QString& dir, bool* out, ClientError* err)
{
    clearError(err);

    bool found = false;
    QVector<QString> links;
    const bool ok = session.forEachEntry(dir, [&found, &links](const RemoteStat& st) {
        if (st.isLink) {
            links.push_back(st.name);
            return true;
        }
        if (st.isDir) {
            found = true;
            return false;
        }
        return true;
    }, err);
    if (!ok)
        return false;

    for (int i = 0; !found && i < links.size(); ++i) {
        RemoteStat target;
        if (session.statPath(joinRemote(dir, links[i]), &target, nullptr) && target.isDir)
            found = true;
    }

    *out = found;
    return true;
}

bool remoteSize(RemoteSession& session, const QString& path, bool isDir,
                quint64* out, ClientError* err)
{
    clearError(err);

    if (!isDir) {
        RemoteStat st;
        if (!session.statPath(path, &st, err))
            return false;
        *out = st.size;
        return true;
    }

    bool ok = true;
    const quint64 total = remoteTreeSize(session, path, 0, &ok, err);
    if (!ok)
        return false;
    *out = total;
    return true;
}

bool localSize(const QString& path, bool isDir, quint64* out, ClientError* err)
{
    clearError(err);

    if (path.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing source");

    if (!isDir) {
        QFileInfo fi(path);
        if (!fi.exists())
            return failWith(err, ErrorKind::LocalIoFailure,
                            QString("Cannot stat '%1'").arg(path));
        *out = static_cast<quint64>(qMax<qint64>(0, fi.size()));
        return true;
    }

    bool ok = true;
    const quint64 total = localTreeSize(path, 0, &ok, err);
    if (!ok)
        return false;
    *out = total;
    return true;
}

bool listLocalDir(const QString& dir, bool onlyDirs, bool showHidden,
                  QVector<DirEntry>* out, ClientError* err)
{
    clearError(err);

    QFileInfo di(dir);
    if (!di.isDir() || !di.isReadable())
        return failWith(err, ErrorKind::LocalIoFailure,
                        QString("Cannot read directory '%1'").arg(dir));

    const QFileInfoList infos = QDir(dir).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::NoSort);

    QVector<DirEntry> entries;
    entries.reserve(infos.size());
    for (const QFileInfo& fi : infos) {
        const QString name = fi.fileName();
        if (!showHidden && name.startsWith('.'))
            continue;
        if (onlyDirs && !fi.isDir())
            continue;
        DirEntry e;
        e.name = name;
        e.path = fi.absoluteFilePath();
        e.isDir = fi.isDir();
        entries.push_back(e);
    }

    sortByLowerName(entries);
    *out = entries;
    return true;
}

// ------------------------------------------------------------
// Transfers
// ------------------------------------------------------------
bool uploadPath(RemoteSession& session,
                const QString& localSource,
                const QString& remoteTargetDir,
                bool isDir,
                const ProgressPtr& progress,
                const CancelPtr& cancel,
                ClientError* err)
{
    clearError(err);

    const QString name = QFileInfo(QDir::cleanPath(localSource)).fileName();
    if (name.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing source filename");

    const QString remoteBase = joinRemote(remoteTargetDir, name);
    qDebug().noquote() << QString("Upload %1 -> %2").arg(localSource, remoteBase);

    return isDir
        ? uploadDir(session, localSource, remoteBase, 0, progress, cancel, err)
        : uploadFile(session, localSource, remoteBase, progress, cancel, err);
}

bool downloadPath(RemoteSession& session,
                  const QString& remoteSource,
                  const QString& localTargetDir,
                  bool isDir,
                  const ProgressPtr& progress,
                  const CancelPtr& cancel,
                  ClientError* err)
{
    clearError(err);

    const QString name = remoteBaseName(remoteSource);
    if (name.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing source filename");

    const QString localBase = QDir(localTargetDir).filePath(name);
    qDebug().noquote() << QString("Download %1 -> %2").arg(remoteSource, localBase);

    return isDir
        ? downloadDir(session, remoteSource, localBase, 0, progress, cancel, err)
        : downloadFile(session, remoteSource, localBase, progress, cancel, err);
}

} // namespace RemoteOps
