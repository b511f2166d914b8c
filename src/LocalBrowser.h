#pragma once

#include <QString>

#include "ClientError.h"
#include "DirBrowser.h"

/*
    LocalBrowser
    ------------
    Synchronous browser over the local filesystem (QDir).
*/
class LocalBrowser : public DirBrowser
{
public:
    // Preference: the entered path itself if it is a directory, else its
    // parent; the last remembered local directory; home; working directory.
    static QString resolveStart(const QString& enteredPath, const QString& lastLocalDir);

    bool open(const QString& dir, bool onlyDirs, ClientError* err = nullptr);
    bool reload(ClientError* err = nullptr);
    void setShowHidden(bool show, ClientError* err = nullptr);

    // Backspace
    bool ascend(ClientError* err = nullptr);

    // Enter
    EnterOutcome enterSelected(ClientError* err = nullptr);
};
