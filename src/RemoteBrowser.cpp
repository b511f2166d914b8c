#include "RemoteBrowser.h"

#include <QDebug>
#include <QtConcurrent/QtConcurrent>

#include "RemoteOps.h"

RemoteBrowser::RemoteBrowser(QSharedPointer<SshBackend> backend)
    : m_backend(std::move(backend))
{
}

RemoteBrowser::~RemoteBrowser()
{
    waitForWorkers();
}

void RemoteBrowser::waitForWorkers()
{
    for (QFuture<void>& f : m_workers)
        f.waitForFinished();
    m_workers.clear();
}

QString RemoteBrowser::resolveStart(const SshProfile& profile)
{
    if (!profile.lastRemoteDir.trimmed().isEmpty())
        return profile.lastRemoteDir.trimmed();
    if (!profile.user.trimmed().isEmpty())
        return "/home/" + profile.user.trimmed();
    return "/";
}

void RemoteBrowser::open(const SshProfile& profile, const QString& dir, bool onlyDirs)
{
    m_profile = profile;
    m_onlyDirs = onlyDirs;
    fetch(dir.isEmpty() ? resolveStart(profile) : dir, true);
}

void RemoteBrowser::reload()
{
    fetch(m_cwd, false);
}

void RemoteBrowser::setShowHidden(bool show)
{
    m_showHidden = show;
    reload();
}

void RemoteBrowser::ascend()
{
    if (m_cwd == "/")
        return;
    fetch(RemoteOps::parentRemoteDir(m_cwd), false);
}

EnterOutcome RemoteBrowser::enterSelected(RemoteSession* session, ClientError* err)
{
    clearError(err);

    const DirEntry* entry = selected();
    if (!entry)
        return EnterOutcome::Nothing;
    if (!entry->isDir)
        return EnterOutcome::NotDirectory;

    const QString path = entry->path;

    if (m_onlyDirs) {
        if (!session) {
            failWith(err, ErrorKind::InvalidState, "Selected connection is not connected");
            return EnterOutcome::Nothing;
        }
        bool hasSubdirs = false;
        if (!RemoteOps::hasSubdirectories(*session, path, &hasSubdirs, err))
            return EnterOutcome::Nothing;
        if (!hasSubdirs)
            return EnterOutcome::NoSubfolders;
    }

    fetch(path, false);
    return EnterOutcome::Descended;
}

// -----------------------------------------------------------------------------
// Worker
// -----------------------------------------------------------------------------
void RemoteBrowser::fetch(const QString& dir, bool withFallback)
{
    const quint64 generation = ++m_generation;

    setListing(dir, QVector<DirEntry>());
    m_loading = true;
    m_error.clear();

    OneShotPtr<Listing> result(new OneShot<Listing>());
    m_pending = result;

    QSharedPointer<SshBackend> backend = m_backend;
    const SshProfile profile = m_profile;
    const bool onlyDirs = m_onlyDirs;
    const bool showHidden = m_showHidden;

    for (int i = m_workers.size() - 1; i >= 0; --i) {
        if (m_workers.at(i).isFinished())
            m_workers.removeAt(i);
    }
    m_workers.append(QtConcurrent::run([backend, profile, dir, onlyDirs, showHidden, withFallback, generation, result]() {
        Listing r;
        r.generation = generation;
        r.cwd = dir;

        ClientError err;
        std::unique_ptr<RemoteSession> session = backend->dial(profile, &err);
        if (!session) {
            r.error = err.message;
            result->send(r);
            return;
        }

        r.ok = RemoteOps::listRemoteDir(*session, dir, onlyDirs, showHidden, &r.entries, &err);

        if (!r.ok && withFallback) {
            QString home;
            if (session->homeDir(&home, nullptr) && home != dir &&
                RemoteOps::listRemoteDir(*session, home, onlyDirs, showHidden, &r.entries, nullptr)) {
                r.ok = true;
                r.cwd = home;
            } else if (dir != "/" &&
                       RemoteOps::listRemoteDir(*session, "/", onlyDirs, showHidden, &r.entries, nullptr)) {
                r.ok = true;
                r.cwd = "/";
            }
        }

        if (!r.ok)
            r.error = err.message;
        result->send(r);
    }));
}

bool RemoteBrowser::poll()
{
    if (!m_pending)
        return false;

    Listing r;
    if (!m_pending->tryTake(&r))
        return false;
    m_pending.reset();

    if (r.generation != m_generation)
        return false;

    m_loading = false;
    if (r.ok) {
        if (r.cwd != m_cwd)
            qInfo().noquote() << QString("[SFTP] %1 unavailable, showing %2").arg(m_cwd, r.cwd);
        setListing(r.cwd, r.entries);
        m_error.clear();
    } else {
        qWarning().noquote() << QString("[SFTP] listing %1 failed: %2").arg(m_cwd, r.error);
        m_error = r.error;
    }
    return true;
}
