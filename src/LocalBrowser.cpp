#include "LocalBrowser.h"

#include <QDir>
#include <QFileInfo>

QString LocalBrowser::resolveStart(const QString& enteredPath, const QString& lastLocalDir)
{
    if (!enteredPath.trimmed().isEmpty()) {
        const QFileInfo fi(RemoteOps::expandTilde(enteredPath.trimmed()));
        if (fi.isDir())
            return fi.absoluteFilePath();
        const QFileInfo parent(fi.absolutePath());
        if (parent.isDir())
            return parent.absoluteFilePath();
    }

    if (!lastLocalDir.isEmpty() && QFileInfo(lastLocalDir).isDir())
        return lastLocalDir;

    const QString home = QDir::homePath();
    if (QFileInfo(home).isDir())
        return home;

    return QDir::currentPath();
}

bool LocalBrowser::open(const QString& dir, bool onlyDirs, ClientError* err)
{
    m_onlyDirs = onlyDirs;

    QVector<DirEntry> entries;
    if (!RemoteOps::listLocalDir(dir, m_onlyDirs, m_showHidden, &entries, err))
        return false;

    setListing(QDir::cleanPath(QFileInfo(dir).absoluteFilePath()), entries);
    return true;
}

bool LocalBrowser::reload(ClientError* err)
{
    const int keep = m_selected;
    if (!open(m_cwd, m_onlyDirs, err))
        return false;
    m_selected = qBound(0, keep, qMax(0, m_entries.size() - 1));
    return true;
}

void LocalBrowser::setShowHidden(bool show, ClientError* err)
{
    m_showHidden = show;
    reload(err);
}

bool LocalBrowser::ascend(ClientError* err)
{
    QDir dir(m_cwd);
    if (!dir.cdUp())
        return true;   // already at the root
    return open(dir.absolutePath(), m_onlyDirs, err);
}

EnterOutcome LocalBrowser::enterSelected(ClientError* err)
{
    const DirEntry* entry = selected();
    if (!entry)
        return EnterOutcome::Nothing;
    if (!entry->isDir)
        return EnterOutcome::NotDirectory;

    const DirEntry target = *entry;

    if (m_onlyDirs) {
        QVector<DirEntry> subdirs;
        if (!RemoteOps::listLocalDir(target.path, true, true, &subdirs, err))
            return EnterOutcome::Nothing;
        if (subdirs.isEmpty())
            return EnterOutcome::NoSubfolders;
    }

    if (!open(target.path, m_onlyDirs, err))
        return EnterOutcome::Nothing;
    return EnterOutcome::Descended;
}
