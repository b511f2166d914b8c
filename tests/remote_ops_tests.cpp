// RemoteOps tests: path helpers, listing, sizing, recursive copy with
// progress accounting and cooperative cancellation.
#include "RemoteOps.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrent>

#include <limits>

namespace {

SshProfile mockProfile() {
    return makePasswordProfile("tester", "mock.host", "pw");
}

std::unique_ptr<RemoteSession> dialOrFail(TestContext &t, MockSshBackend &backend) {
    ClientError err;
    std::unique_ptr<RemoteSession> s = backend.dial(mockProfile(), &err);
    t.check(s != nullptr, "mock dial should succeed: " + err.message);
    return s;
}

// Sums every Progress message; counts Done messages separately.
struct Drained {
    quint64 bytes = 0;
    int progressMessages = 0;
    int doneMessages = 0;
};

Drained drain(const ProgressPtr &ch) {
    Drained d;
    for (const TransferUpdate &u : ch->drain()) {
        if (u.kind == TransferUpdate::Kind::Progress) {
            d.bytes += u.bytes;
            ++d.progressMessages;
        } else {
            ++d.doneMessages;
        }
    }
    return d;
}

void test_path_helpers(TestContext &t) {
    using namespace RemoteOps;

    t.check(parentRemoteDir("/x/y/") == "/x", "parent of /x/y/ is /x");
    t.check(parentRemoteDir("/x") == "/", "parent of /x is /");
    t.check(parentRemoteDir("/") == "/", "parent of / is /");
    t.check(parentRemoteDir("x") == "/", "parent of a bare name is /");

    t.check(joinRemote("/", "a") == "/a", "join at root");
    t.check(joinRemote("/srv/", "a") == "/srv/a", "join trims one trailing slash");
    t.check(joinRemote("/srv", "a") == "/srv/a", "join without trailing slash");

    t.check(remoteBaseName("/srv/www/") == "www", "basename ignores trailing slashes");
    t.check(remoteBaseName("file.txt") == "file.txt", "basename of a bare name");

    t.check(expandTilde("~/keys") == QDir::homePath() + "/keys", "~/ expands to home");
    t.check(expandTilde("/abs/~/x") == "/abs/~/x", "only a leading ~/ expands");

    const quint64 maxv = std::numeric_limits<quint64>::max();
    t.check(saturatingAdd(maxv - 1, 5) == maxv, "saturatingAdd clamps at the maximum");
    t.check(saturatingAdd(2, 3) == 5, "saturatingAdd adds small values");
}

void test_listing(TestContext &t, MockSshBackend &backend) {
    writeFile(backend.localPath("/list/zeta.txt"), "z");
    writeFile(backend.localPath("/list/Alpha.txt"), "a");
    writeFile(backend.localPath("/list/.hidden"), "h");
    QDir().mkpath(backend.localPath("/list/beta"));
    QFile::link(backend.localPath("/list/beta"), backend.localPath("/list/gamma"));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    QVector<DirEntry> entries;
    ClientError err;
    t.check(RemoteOps::listRemoteDir(*s, "/list", false, false, &entries, &err),
            "listing should succeed: " + err.message);

    QStringList names;
    for (const DirEntry &e : entries)
        names << e.name;
    t.check(names == QStringList({"Alpha.txt", "beta", "gamma", "zeta.txt"}),
            "entries should be sorted case-insensitively without hidden files, got " +
                names.join(","));

    for (const DirEntry &e : entries) {
        if (e.name == "gamma")
            t.check(e.isDir, "a symlink to a directory should list as a directory");
        if (e.name == "Alpha.txt")
            t.check(e.path == "/list/Alpha.txt", "entry path should be absolute");
    }

    t.check(RemoteOps::listRemoteDir(*s, "/list", true, true, &entries, &err),
            "directory-only listing should succeed");
    names.clear();
    for (const DirEntry &e : entries)
        names << e.name;
    t.check(names == QStringList({"beta", "gamma"}), "only directories should remain");

    backend.failListing("/list");
    std::unique_ptr<RemoteSession> denied = dialOrFail(t, backend);
    if (denied) {
        t.check(!RemoteOps::listRemoteDir(*denied, "/list", false, false, &entries, &err),
                "listing a denied directory should fail");
        t.check(err.kind == ErrorKind::SftpFailure, "denied listing should be SftpFailure");
    }
}

void test_has_subdirectories(TestContext &t, MockSshBackend &backend) {
    writeFile(backend.localPath("/sub/flat/a.txt"), "a");
    QDir().mkpath(backend.localPath("/sub/nested/inner"));
    QDir().mkpath(backend.localPath("/sub/linked"));
    QFile::link(backend.localPath("/sub/nested"), backend.localPath("/sub/linked/to-nested"));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    bool has = true;
    t.check(RemoteOps::hasSubdirectories(*s, "/sub/flat", &has), "flat check should succeed");
    t.check(!has, "a directory with only files has no subdirectories");

    t.check(RemoteOps::hasSubdirectories(*s, "/sub/nested", &has), "nested check should succeed");
    t.check(has, "a directory with a child directory has subdirectories");

    t.check(RemoteOps::hasSubdirectories(*s, "/sub/linked", &has), "linked check should succeed");
    t.check(has, "a symlink to a directory counts as a subdirectory");
}

void test_sizes(TestContext &t, MockSshBackend &backend, const QString &localRoot) {
    writeFile(backend.localPath("/sized/a.bin"), QByteArray(1000, 'a'));
    writeFile(backend.localPath("/sized/deep/b.bin"), QByteArray(24, 'b'));
    writeFile(backend.localPath("/sized/deep/er/c.bin"), QByteArray(0, 'c'));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    quint64 bytes = 0;
    t.check(RemoteOps::remoteSize(*s, "/sized", true, &bytes), "remote tree size should succeed");
    t.check(bytes == 1024, "remote tree size should sum every file");

    t.check(RemoteOps::remoteSize(*s, "/sized/a.bin", false, &bytes), "remote file size should succeed");
    t.check(bytes == 1000, "remote file size should come from stat");

    writeFile(localRoot + "/tree/x.bin", QByteArray(300, 'x'));
    writeFile(localRoot + "/tree/y/z.bin", QByteArray(700, 'z'));
    t.check(RemoteOps::localSize(localRoot + "/tree", true, &bytes), "local tree size should succeed");
    t.check(bytes == 1000, "local tree size should sum every file");

    ClientError err;
    t.check(!RemoteOps::localSize("", false, &bytes, &err), "an empty local path should fail");
    t.check(err.kind == ErrorKind::InvalidState, "empty local path should be InvalidState");
}

void test_depth_cap(TestContext &t, MockSshBackend &backend) {
    QString rel = "/deep";
    for (int i = 0; i < RemoteOps::kMaxWalkDepth + 6; ++i)
        rel += "/d";
    QDir().mkpath(backend.localPath(rel));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    quint64 bytes = 0;
    ClientError err;
    t.check(!RemoteOps::remoteSize(*s, "/deep", true, &bytes, &err),
            "walking deeper than the nesting cap should fail");
    t.check(err.kind == ErrorKind::SftpFailure, "depth cap should be SftpFailure");
    t.checkContains(err.message, "deeper than", "depth cap message");

    // A self-referencing link must terminate one way or another.
    QDir().mkpath(backend.localPath("/loop"));
    QFile::link(backend.localPath("/loop"), backend.localPath("/loop/self"));
    err = ClientError();
    const bool ok = RemoteOps::remoteSize(*s, "/loop", true, &bytes, &err);
    t.check(ok || err.kind == ErrorKind::SftpFailure,
            "a symlink loop should end in success or SftpFailure");
}

// 3 MiB file: cumulative progress equals the file size exactly.
void test_upload_progress_accounting(TestContext &t, MockSshBackend &backend,
                                     const QString &localRoot) {
    const int size = 3 * 1024 * 1024;
    const QByteArray data = patternBytes(size, 3);
    const QString src = localRoot + "/big/payload.bin";
    writeFile(src, data);
    QDir().mkpath(backend.localPath("/incoming"));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    ProgressPtr progress(new ProgressChannel());
    CancelPtr cancel(new CancelSignal());
    ClientError err;
    t.check(RemoteOps::uploadPath(*s, src, "/incoming", false, progress, cancel, &err),
            "upload should succeed: " + err.message);

    const Drained d = drain(progress);
    t.check(d.bytes == static_cast<quint64>(size), "progress should sum to the file size");
    t.check(d.progressMessages == size / RemoteOps::kChunkBytes,
            "one progress message per 8 KiB chunk");
    t.check(d.doneMessages == 0, "uploadPath itself never sends Done");
    t.check(readFile(backend.localPath("/incoming/payload.bin")) == data,
            "uploaded bytes should match the source");
}

void test_directory_roundtrip(TestContext &t, MockSshBackend &backend,
                              const QString &localRoot) {
    const QString src = localRoot + "/project";
    writeFile(src + "/README", "hello");
    writeFile(src + "/src/main.c", patternBytes(20000, 1));
    writeFile(src + "/src/empty.txt", QByteArray());
    QDir().mkpath(src + "/assets/none");
    QDir().mkpath(backend.localPath("/up"));

    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    ProgressPtr progress(new ProgressChannel());
    ClientError err;
    t.check(RemoteOps::uploadPath(*s, src, "/up", true, progress, CancelPtr(), &err),
            "directory upload should succeed: " + err.message);
    t.check(drain(progress).bytes == 20005, "directory upload progress should sum all files");

    t.check(readFile(backend.localPath("/up/project/src/main.c")) == patternBytes(20000, 1),
            "nested file should be uploaded");
    t.check(QFileInfo(backend.localPath("/up/project/src/empty.txt")).exists(),
            "zero-byte file should be created");
    t.check(QFileInfo(backend.localPath("/up/project/assets/none")).isDir(),
            "empty directory should be created");

    // Second upload into an existing tree should not fail on mkdir.
    t.check(RemoteOps::uploadPath(*s, src, "/up", true, ProgressPtr(), CancelPtr(), &err),
            "re-upload into an existing tree should succeed");

    const QString dest = localRoot + "/downloads";
    QDir().mkpath(dest);
    ProgressPtr back(new ProgressChannel());
    t.check(RemoteOps::downloadPath(*s, "/up/project", dest, true, back, CancelPtr(), &err),
            "directory download should succeed: " + err.message);
    t.check(drain(back).bytes == 20005, "directory download progress should sum all files");
    t.check(readFile(dest + "/project/README") == "hello", "downloaded file content");
    t.check(QFileInfo(dest + "/project/assets/none").isDir(),
            "download should recreate empty directories");
}

void test_download_missing_source(TestContext &t, MockSshBackend &backend,
                                  const QString &localRoot) {
    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    ClientError err;
    t.check(!RemoteOps::downloadPath(*s, "/nope.bin", localRoot, false, ProgressPtr(),
                                     CancelPtr(), &err),
            "downloading a missing file should fail");
    t.check(err.kind == ErrorKind::SftpFailure, "missing remote file should be SftpFailure");
}

// 100 small files, cancel once ten have been written.
void test_cancel_mid_tree(TestContext &t, MockSshBackend &backend, const QString &localRoot) {
    const QString src = localRoot + "/many";
    const QByteArray body(100, 'm');
    for (int i = 0; i < 100; ++i)
        writeFile(QString("%1/f%2.txt").arg(src).arg(i, 3, 10, QChar('0')), body);
    QDir().mkpath(backend.localPath("/cancel"));

    backend.setChunkDelayMs(50);
    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    backend.setChunkDelayMs(0);
    if (!s)
        return;

    ProgressPtr progress(new ProgressChannel());
    CancelPtr cancel(new CancelSignal());
    ClientError err;
    RemoteSession *session = s.get();

    QFuture<bool> job = QtConcurrent::run([session, src, progress, cancel, &err]() {
        return RemoteOps::uploadPath(*session, src, "/cancel", true, progress, cancel, &err);
    });

    int seen = 0;
    const bool reached = waitUntil([&seen]() { return seen >= 10; },
                                   [&seen, &progress]() {
                                       TransferUpdate u;
                                       while (progress->tryReceive(&u))
                                           ++seen;
                                   });
    cancel->send(true);
    job.waitForFinished();

    t.check(reached, "ten files should be written before cancelling");
    t.check(!job.result(), "cancelled upload should fail");
    t.check(err.kind == ErrorKind::Cancelled, "cancelled upload should be Cancelled");

    int complete = 0;
    int torn = 0;
    const QFileInfoList written = QDir(backend.localPath("/cancel/many")).entryInfoList(QDir::Files);
    for (const QFileInfo &fi : written) {
        if (fi.size() == body.size())
            ++complete;
        else
            ++torn;
    }
    t.check(complete >= 10 && complete <= 11,
            QString("10 or 11 files should be complete, got %1").arg(complete));
    t.check(torn <= 1, QString("at most one file may be created but empty, got %1").arg(torn));
}

void test_cancel_before_start(TestContext &t, MockSshBackend &backend, const QString &localRoot) {
    writeFile(localRoot + "/early.bin", QByteArray(10, 'e'));
    std::unique_ptr<RemoteSession> s = dialOrFail(t, backend);
    if (!s)
        return;

    ProgressPtr progress(new ProgressChannel());
    CancelPtr cancel(new CancelSignal());
    cancel->send(true);

    ClientError err;
    t.check(!RemoteOps::uploadPath(*s, localRoot + "/early.bin", "/", false, progress, cancel, &err),
            "an already-cancelled upload should fail");
    t.check(err.kind == ErrorKind::Cancelled, "early cancel should be Cancelled");
    t.check(progress->pending() == 0, "no progress after cancellation");
    t.check(!QFileInfo(backend.localPath("/early.bin")).exists(),
            "no remote file should be created after cancellation");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;

    QTemporaryDir remoteDir;
    QTemporaryDir localDir;
    t.check(remoteDir.isValid() && localDir.isValid(), "temporary directories should be available");

    MockSshBackend backend(remoteDir.path());

    test_path_helpers(t);
    test_listing(t, backend);
    test_has_subdirectories(t, backend);
    test_sizes(t, backend, localDir.path());
    test_depth_cap(t, backend);
    test_upload_progress_accounting(t, backend, localDir.path());
    test_directory_roundtrip(t, backend, localDir.path());
    test_download_missing_source(t, backend, localDir.path());
    test_cancel_mid_tree(t, backend, localDir.path());
    test_cancel_before_start(t, backend, localDir.path());

    return t.finish("remote_ops_tests");
}
