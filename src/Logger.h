#pragma once
#include <QDateTime>
#include <QString>
#include <QStringList>

namespace Logger {
    // Prunes the log file, opens it for append and installs the Qt message handler.
    void install(const QString& appName);

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    QString logFilePath();

    void setLogFilePathOverride(const QString& absoluteFilePath);  // empty => use default
    QString logDirPath();  // convenience: parent directory of current log file

    // "MM-DD HH:MM:SS | message"
    QString formatLine(const QDateTime& when, const QString& message);

    // Drops lines older than 7 days (year assumed to be `now`'s year) and
    // unparsable lines, keeps the newest 10 000, removes the file when empty.
    // Returns the number of lines kept.
    int pruneLogFile(const QString& path, const QDateTime& now = QDateTime::currentDateTime());

    // Newest formatted lines, oldest first (at most 100).
    QStringList recentLines();
    QString lastLine();
}
