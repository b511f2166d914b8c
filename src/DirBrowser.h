#pragma once

#include <QString>
#include <QVector>

#include "RemoteOps.h"

// Result of Enter on the highlighted entry.
enum class EnterOutcome {
    Descended,     // cwd changed (remote: listing requested)
    NoSubfolders,  // only-dirs mode and the directory has no subdirectories
    NotDirectory,  // highlighted entry is a file, caller decides
    Nothing        // empty listing
};

/*
    Cursor state shared by the local and the remote browser:
    current directory, sorted entries, highlighted index and the filters.
*/
class DirBrowser
{
public:
    virtual ~DirBrowser() = default;

    const QString& cwd() const { return m_cwd; }
    const QVector<DirEntry>& entries() const { return m_entries; }
    int selectedIndex() const { return m_selected; }

    // nullptr when the listing is empty
    const DirEntry* selected() const
    {
        if (m_selected < 0 || m_selected >= m_entries.size())
            return nullptr;
        return &m_entries[m_selected];
    }

    bool onlyDirs() const { return m_onlyDirs; }
    bool showHidden() const { return m_showHidden; }

    void moveUp()
    {
        if (m_selected > 0)
            --m_selected;
    }

    void moveDown()
    {
        if (m_selected + 1 < m_entries.size())
            ++m_selected;
    }

protected:
    void setListing(const QString& cwd, const QVector<DirEntry>& entries)
    {
        m_cwd = cwd;
        m_entries = entries;
        m_selected = 0;
    }

    QString           m_cwd;
    QVector<DirEntry> m_entries;
    int               m_selected   = 0;
    bool              m_onlyDirs   = false;
    bool              m_showHidden = false;
};
