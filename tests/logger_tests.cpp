// Logger tests: line format, retention pruning and the in-memory tail.
#include "Logger.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QTemporaryDir>

namespace {

const QDateTime kNow(QDate(2026, 6, 15), QTime(12, 0, 0));

QString stamp(int daysAgo, const QString &msg) {
    return Logger::formatLine(kNow.addDays(-daysAgo), msg);
}

void test_format_line(TestContext &t) {
    const QDateTime when(QDate(2026, 3, 4), QTime(5, 6, 7));
    t.check(Logger::formatLine(when, "hello") == "03-04 05:06:07 | hello",
            "log line format should be 'MM-DD HH:MM:SS | message'");
}

void test_prune_drops_old_and_unparsable(TestContext &t, const QString &dir) {
    const QString path = dir + "/prune.log";
    const QStringList lines = {
        stamp(30, "a month ago"),
        "not a log line",
        stamp(8, "eight days ago"),
        stamp(6, "six days ago"),
        "13-45 99:99:99 | bad timestamp",
        stamp(0, "today"),
    };
    writeFile(path, (lines.join('\n') + '\n').toUtf8());

    const int kept = Logger::pruneLogFile(path, kNow);
    t.check(kept == 2, QString("two lines should survive, got %1").arg(kept));

    const QString content = QString::fromUtf8(readFile(path));
    t.checkContains(content, "six days ago", "a six day old line is kept");
    t.checkContains(content, "today", "today's line is kept");
    t.check(!content.contains("eight days ago"), "an eight day old line is dropped");
    t.check(!content.contains("not a log line"), "an unparsable line is dropped");
    t.check(!content.contains("bad timestamp"), "an invalid timestamp is dropped");
}

void test_prune_caps_entries(TestContext &t, const QString &dir) {
    const QString path = dir + "/cap.log";
    QStringList lines;
    for (int i = 0; i < 10005; ++i)
        lines << Logger::formatLine(kNow.addSecs(-10005 + i), QString("entry %1").arg(i));
    writeFile(path, (lines.join('\n') + '\n').toUtf8());

    t.check(Logger::pruneLogFile(path, kNow) == 10000, "the newest 10 000 lines are kept");

    const QStringList after = QString::fromUtf8(readFile(path)).split('\n', Qt::SkipEmptyParts);
    t.check(after.size() == 10000, "file should hold 10 000 lines");
    t.check(!after.isEmpty() && after.first().endsWith("| entry 5"), "the oldest lines are dropped first");
    t.check(!after.isEmpty() && after.last().endsWith("| entry 10004"), "the newest line is kept");
}

void test_prune_removes_empty_file(TestContext &t, const QString &dir) {
    const QString path = dir + "/stale.log";
    writeFile(path, (stamp(20, "old") + '\n').toUtf8());

    t.check(Logger::pruneLogFile(path, kNow) == 0, "nothing should survive");
    t.check(!QFileInfo::exists(path), "a log with nothing left is removed");
    t.check(Logger::pruneLogFile(dir + "/missing.log", kNow) == 0, "a missing file prunes to zero");
}

void test_install_and_levels(TestContext &t, const QString &dir) {
    const QString path = dir + "/run/ss-ssh.log";
    Logger::setLogLevel(1);
    Logger::setLogFilePathOverride(path);
    Logger::install("ss-ssh");

    t.check(Logger::logFilePath() == path, "the override path should be used");
    t.check(Logger::logDirPath() == dir + "/run", "log dir is the parent of the file");

    qInfo() << "first info line";
    qDebug() << "hidden debug line";
    t.checkContains(Logger::lastLine(), "first info line", "info is logged at level 1");

    Logger::setLogLevel(0);
    qInfo() << "suppressed info line";
    qWarning() << "warning line";
    t.check(Logger::logLevel() == 0, "level 0 should stick");

    Logger::setLogLevel(7);
    t.check(Logger::logLevel() == 2, "levels are clamped to 2");

    const QStringList recent = Logger::recentLines();
    t.check(recent.size() <= 100, "the in-memory tail holds at most 100 lines");
    t.checkContains(recent.join('\n'), "warning line", "warnings reach the tail");

    const QString content = QString::fromUtf8(readFile(path));
    t.checkContains(content, "first info line", "info reaches the file");
    t.checkContains(content, "warning line", "warnings reach the file");
    t.check(!content.contains("hidden debug line"), "debug is filtered at level 1");
    t.check(!content.contains("suppressed info line"), "info is filtered at level 0");

    for (int i = 0; i < 150; ++i)
        qWarning() << "burst" << i;
    const QStringList tail = Logger::recentLines();
    t.check(tail.size() == 100, "the tail is trimmed to 100 lines");
    t.checkContains(tail.last(), "burst 149", "the tail ends with the newest line");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;

    QTemporaryDir tmp;
    t.check(tmp.isValid(), "temporary directory should be available");

    test_format_line(t);
    test_prune_drops_old_and_unparsable(t, tmp.path());
    test_prune_caps_entries(t, tmp.path());
    test_prune_removes_empty_file(t, tmp.path());
    test_install_and_levels(t, tmp.path());

    return t.finish("logger_tests");
}
