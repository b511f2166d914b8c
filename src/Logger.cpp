// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QQueue>
#include <QSaveFile>
#include <QDebug>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort

// =====================================================
// Constants
// =====================================================

static const char* kTimestampFormat = "MM-dd HH:mm:ss";
static const char* kSeparator       = " | ";
static constexpr int kRetentionDays = 7;
static constexpr int kMaxEntries    = 10000;
static constexpr int kMaxInMemory   = 100;

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*          g_file  = nullptr;   // Open log file handle
static QMutex          g_mutex;             // Guards concurrent writes + ring buffer
static QString         g_path;              // Absolute path to log file
static QAtomicInt      g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QString         g_pathOverride;
static QQueue<QString> g_recent;            // Newest kMaxInMemory lines

// Prevent recursion if something inside handler triggers Qt logging again
static thread_local bool g_inHandler = false;

// =====================================================
// Filtering by runtime logging level
// =====================================================
//
// 0 = Errors only: WARN/ERROR/FATAL
// 1 = Normal:      INFO/WARN/ERROR/FATAL
// 2 = Debug:       DEBUG/INFO/WARN/ERROR/FATAL
//
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();

    if (lvl <= 0)
        return (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg);

    if (lvl == 1)
        return (type == QtInfoMsg || type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg);

    return true;
}

// =====================================================
// Message normalization (one record = one physical line)
// =====================================================
static QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');

    s.replace('\n', ' ');
    s.replace('\t', ' ');

    return s.simplified();
}

static void rememberLine(const QString& line)
{
    g_recent.enqueue(line);
    while (g_recent.size() > kMaxInMemory)
        g_recent.dequeue();
}

static void openLogFile(const QString& path)
{
    if (g_file) {
        if (g_file->isOpen()) g_file->close();
        delete g_file;
        g_file = nullptr;
    }

    g_file = new QFile(path);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: failed to open log file: %s\n",
                     path.toUtf8().constData());
        std::fflush(stderr);
    }
}

// =====================================================
// Qt message handler
// =====================================================
static void handler(QtMsgType type,
                    const QMessageLogContext& /*ctx*/,
                    const QString& msg)
{
    if (!allowMessage(type)) {
        if (type == QtFatalMsg) abort(); // never suppress fatal
        return;
    }

    if (g_inHandler) {
        if (type == QtFatalMsg) abort();
        return;
    }
    g_inHandler = true;

    {
        QMutexLocker lock(&g_mutex);

        const QString line = Logger::formatLine(QDateTime::currentDateTime(), normalizeMessage(msg));
        rememberLine(line);

        if (!g_file || !g_file->isOpen()) {
            std::fprintf(stderr, "%s\n", line.toUtf8().constData());
            std::fflush(stderr);
        } else {
            QTextStream out(g_file);
            out.setCodec("UTF-8");
            out << line << "\n";
            out.flush();
        }

        if (type == QtFatalMsg)
            abort();
    }

    g_inHandler = false;
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

QString formatLine(const QDateTime& when, const QString& message)
{
    return when.toString(kTimestampFormat) + kSeparator + message;
}

int pruneLogFile(const QString& path, const QDateTime& now)
{
    QFile in(path);
    if (!in.open(QIODevice::ReadOnly | QIODevice::Text))
        return 0;
    const QString content = QString::fromUtf8(in.readAll());
    in.close();

    const QDateTime cutoff = now.addDays(-kRetentionDays);
    const QString year = QString::number(now.date().year());

    QStringList kept;
    const QStringList lines = content.split('\n', Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const int sep = line.indexOf(kSeparator);
        if (sep <= 0)
            continue;

        const QDateTime ts = QDateTime::fromString(year + "-" + line.left(sep),
                                                   "yyyy-MM-dd HH:mm:ss");
        if (!ts.isValid())
            continue;
        if (ts >= cutoff)
            kept << line;
    }

    if (kept.size() > kMaxEntries)
        kept = kept.mid(kept.size() - kMaxEntries);

    if (kept.isEmpty()) {
        QFile::remove(path);
        return 0;
    }

    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly)) {
        std::fprintf(stderr, "Logger: failed to rewrite log file: %s\n",
                     path.toUtf8().constData());
        return kept.size();
    }
    out.write((kept.join('\n') + '\n').toUtf8());
    if (!out.commit()) {
        std::fprintf(stderr, "Logger: failed to rewrite log file: %s\n",
                     path.toUtf8().constData());
    }
    return kept.size();
}

void install(const QString& appName)
{
    const QString defaultDir =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/logs";

    const QString defaultPath = defaultDir + "/" + appName + ".log";

    const QString chosenPath =
        (!g_pathOverride.trimmed().isEmpty())
            ? QDir::cleanPath(g_pathOverride.trimmed())
            : defaultPath;

    g_path = chosenPath;

    QDir().mkpath(QFileInfo(g_path).absolutePath());
    pruneLogFile(g_path);

    {
        QMutexLocker lock(&g_mutex);
        openLogFile(g_path);
    }

    qInstallMessageHandler(handler);
    qDebug().noquote() << QString("Logger initialized: %1").arg(g_path);
}

QString logFilePath()
{
    return g_path;
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);

    g_pathOverride = QDir::cleanPath(absoluteFilePath.trimmed());
    if (absoluteFilePath.trimmed().isEmpty())
        g_pathOverride.clear();

    // If cleared, just keep current log open; next install() will use default.
    if (g_pathOverride.isEmpty() || !g_file)
        return;

    QDir().mkpath(QFileInfo(g_pathOverride).absolutePath());
    openLogFile(g_pathOverride);
    if (g_file->isOpen())
        g_path = g_pathOverride;
}

// 0=Errors only, 1=Normal, 2=Debug
void setLogLevel(int level)
{
    if (level < 0) level = 0;
    if (level > 2) level = 2;
    g_level.storeRelease(level);
}

int logLevel()
{
    return g_level.loadAcquire();
}

QStringList recentLines()
{
    QMutexLocker lock(&g_mutex);
    return QStringList(g_recent.begin(), g_recent.end());
}

QString lastLine()
{
    QMutexLocker lock(&g_mutex);
    return g_recent.isEmpty() ? QString("No logs yet") : g_recent.last();
}

} // namespace Logger

QString Logger::logDirPath()
{
    const QString p = logFilePath().trimmed();
    if (p.isEmpty()) return QString();
    return QFileInfo(p).absolutePath();
}
