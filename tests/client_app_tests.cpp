// ClientApp tests: connection bookkeeping, profile editing messages, the
// not-connected notice and full upload/download flows through the pickers.
#include "ClientApp.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QDir>
#include <QTemporaryDir>

namespace {

ProfileDraft aliceDraft() {
    ProfileDraft d;
    d.name = "box";
    d.user = "alice";
    d.host = "box.local";
    d.password = "pw";
    return d;
}

bool tickUntil(ClientApp &app, const std::function<bool()> &done) {
    return waitUntil(done, [&app]() { app.tick(); });
}

void test_connect_bookkeeping(TestContext &t, ClientApp &app, MockSshBackend &backend) {
    QString feedback;

    ProfileDraft incomplete = aliceDraft();
    incomplete.user.clear();
    t.check(!app.saveDraft(incomplete, -1, &feedback), "an incomplete draft is rejected");
    t.check(feedback == "Missing fields: User is required", "missing field feedback");

    backend.setDialFailure("boom");
    t.check(!app.saveDraft(aliceDraft(), -1, &feedback), "a new profile that fails to dial is not saved");
    t.check(feedback == "Connection failed: boom", "dial failure feedback");
    t.check(app.store().count() == 0, "nothing is saved after a failed first connect");

    QString message;
    t.check(!app.testDraft(aliceDraft(), &message), "test connection fails while dialing fails");
    t.check(message == "Connection failed: boom", "test failure message");
    backend.setDialFailure(QString());

    t.check(app.testDraft(aliceDraft(), &message), "test connection succeeds");
    t.check(message == "Connection OK (not saved)", "test success message");
    t.check(app.store().count() == 0, "testing never saves");

    t.check(app.saveDraft(aliceDraft(), -1, &feedback), "a new profile connects and saves");
    t.check(app.store().count() == 1, "the profile is saved");
    t.check(app.status() == "Connected to box", "status names the connection");

    const SshProfile *p = app.selectedProfile();
    t.check(p && app.isConnected(*p), "the saved profile is connected and selected");
    t.check(p && p->history.size() == 1 && p->history[0].state == HistoryState::Success,
            "one Success entry is recorded");

    t.check(app.connectSelected(), "connecting again is accepted");
    t.check(app.status() == "Already connected to box", "a second connect is a no-op");
    t.check(app.openConnections().size() == 1, "still one open connection");

    t.check(app.disconnectSelected(), "disconnect succeeds");
    t.check(!app.disconnectSelected(), "disconnecting twice fails");
    t.check(app.status() == "Selected connection is not connected", "not connected status");

    backend.setDialFailure("Authentication failed");
    t.check(!app.connectSelected(), "connect fails while dialing fails");
    p = app.selectedProfile();
    t.check(p && p->history.size() == 2 && p->history[1].state == HistoryState::Failure,
            "a saved profile records the Failure");
    t.check(p && app.lastErrorFor(*p) == "Authentication failed", "the last error is kept");
    t.check(app.status() == "Connection failed: Authentication failed", "failure status");
    backend.setDialFailure(QString());
}

void test_notice_flow(TestContext &t, ClientApp &app) {
    t.check(!app.selectedConnectedProfile(), "nothing is connected at this point");

    app.requestTerminal();
    t.check(app.hasNotice() && app.notice().title == "Not connected", "not connected notice");
    t.check(app.noticeAction() == NoticeAction::ConnectTerminal, "the notice remembers the action");
    app.dismissNotice();
    t.check(!app.hasNotice() && !app.takeTerminalRequest(), "Esc only closes the notice");

    app.requestTerminal();
    app.acceptNotice();
    t.check(app.selectedConnectedProfile() != nullptr, "Enter connects first");
    t.check(app.takeTerminalRequest(), "then requests the terminal");
    t.check(!app.takeTerminalRequest(), "a terminal request is taken once");

    const SshProfile *p = app.selectedProfile();
    t.check(p && app.lastErrorFor(*p).isEmpty(), "a successful connect clears the last error");

    app.requestTerminal();
    t.check(!app.hasNotice() && app.takeTerminalRequest(), "connected profiles open directly");

    app.disconnectSelected();
    app.requestDownload();
    app.connectFromNotice();
    t.check(!app.hasNotice() && app.selectedConnectedProfile(), "c on the notice connects only");
    t.check(!app.transfer().isActive(), "c on the notice does not start a transfer");

    t.check(app.headerMode() == HeaderMode::Help, "the header starts on help");
    app.cycleHeader();
    t.check(app.headerMode() == HeaderMode::Logs, "v shows logs");
    app.cycleHeader();
    t.check(app.headerMode() == HeaderMode::Off, "v hides the header");
    app.cycleHeader();
    t.check(app.headerMode() == HeaderMode::Help, "v cycles back to help");
}

void test_upload_flow(TestContext &t, ClientApp &app, MockSshBackend &backend,
                      const QString &localRoot) {
    const QByteArray payload = patternBytes(50000, 5);
    writeFile(localRoot + "/payload.txt", payload);
    QDir().mkpath(localRoot + "/dl");
    QDir().mkpath(backend.localPath("/home/alice/inbox"));
    t.check(app.store().rememberLocalDir(localRoot), "remember the local start directory");

    app.disconnectSelected();
    app.requestUpload();
    t.check(app.noticeAction() == NoticeAction::ConnectUpload, "upload asks to connect first");
    app.acceptNotice();

    t.check(app.transfer().isActive(), "accepting the notice starts the upload");
    t.check(app.picker() == PickerKind::Local, "the local source picker opens");
    t.check(app.localBrowser().cwd() == localRoot, "it opens in the remembered directory");

    // Picking "dl" with s would select a directory; move to the file instead.
    app.pickerDown();
    const DirEntry *sel = app.localBrowser().selected();
    t.check(sel && sel->name == "payload.txt", "cursor is on the payload");
    app.pickerEnter();
    t.check(app.transfer().state()->step == TransferStep::PickTarget, "a file is taken as the source");
    t.check(app.picker() == PickerKind::Remote, "the remote target picker opens");

    t.check(tickUntil(app, [&app]() { return !app.remoteBrowser().isLoading(); }),
            "the remote listing arrives");
    t.check(app.remoteBrowser().cwd() == "/home/alice", "the remote picker starts at the home directory");

    app.pickerBack();
    t.check(app.picker() == PickerKind::Local &&
                app.transfer().state()->step == TransferStep::PickSource,
            "b returns to the source picker");
    app.pickerDown();
    app.pickerEnter();
    tickUntil(app, [&app]() { return !app.remoteBrowser().isLoading(); });

    app.pickerEnter();
    t.check(app.hasNotice() && app.notice().title == "No subfolders",
            "a folder without subfolders cannot be entered in the target picker");
    app.dismissNotice();

    app.pickerSelectDir();
    t.check(app.picker() == PickerKind::None, "s selects the target and closes the picker");
    t.check(app.transfer().state()->step == TransferStep::Confirm, "the confirm step follows");
    t.check(app.transfer().state()->targetRemote == "/home/alice/inbox", "the target is inbox");

    app.confirmTransfer();
    t.check(app.transfer().isTransferring(), "Enter starts the transfer");
    t.check(tickUntil(app, [&app]() { return app.hasNotice(); }), "the transfer finishes");
    t.check(app.notice().title == "Transfer complete", "success notice");
    t.check(app.status() == "Transfer finished successfully", "the status mirrors the notice");
    app.dismissNotice();

    t.check(readFile(backend.localPath("/home/alice/inbox/payload.txt")) == payload,
            "the uploaded file matches");
    const SshProfile *p = app.selectedProfile();
    t.check(p && p->lastRemoteDir == "/home/alice/inbox", "the remote target is remembered");
}

void test_download_flow(TestContext &t, ClientApp &app, const QString &localRoot) {
    app.requestDownload();
    t.check(!app.hasNotice(), "a connected profile starts the download directly");
    t.check(app.picker() == PickerKind::Remote, "the remote source picker opens");
    t.check(tickUntil(app, [&app]() { return !app.remoteBrowser().isLoading(); }),
            "the remote listing arrives");
    t.check(app.remoteBrowser().cwd() == "/home/alice/inbox", "it opens at the remembered directory");

    app.pickerEnter();
    t.check(app.picker() == PickerKind::Local, "picking a file opens the local target picker");
    t.check(app.localBrowser().onlyDirs(), "the target picker lists directories only");

    app.pickerSelectDir();
    t.check(app.transfer().state() && app.transfer().state()->step == TransferStep::Confirm,
            "s selects dl as the target");

    app.confirmBack();
    t.check(app.picker() == PickerKind::Local &&
                app.transfer().state()->step == TransferStep::PickTarget,
            "b on the confirm modal returns to the target picker");
    t.check(app.localBrowser().cwd() == localRoot + "/dl", "the picker reopens at the chosen target");
    app.pickerAscend();
    app.pickerSelectDir();

    app.confirmTransfer();
    t.check(tickUntil(app, [&app]() { return app.hasNotice(); }), "the download finishes");
    t.check(app.notice().title == "Transfer complete", "download success notice");
    app.dismissNotice();

    t.check(readFile(localRoot + "/dl/payload.txt") == patternBytes(50000, 5),
            "the downloaded file matches");

    app.requestUpload();
    t.check(app.transfer().isActive(), "another transfer can start");
    app.pickerEscape();
    t.check(!app.transfer().isActive() && app.picker() == PickerKind::None, "Esc abandons it");
    t.check(app.status() == "Cancelled", "cancel status");
}

void test_edit_delete_master(TestContext &t, ClientApp &app) {
    QString feedback;
    ProfileDraft edited = aliceDraft();
    edited.name = "renamed";
    t.check(app.saveDraft(edited, 0, &feedback), "editing succeeds");
    t.check(app.status() == "Connection updated", "edit status");
    t.check(app.store().at(0)->name == "renamed", "the edit is stored");
    t.check(app.store().at(0)->lastRemoteDir == "/home/alice/inbox", "editing keeps the remote dir");

    t.check(!app.changeMaster("wrong", "n", "n"), "a wrong master is rejected");
    t.check(app.status() == "Master password not changed: Current master password incorrect",
            "master mismatch status");
    t.check(app.changeMaster("m", "n", "n"), "the master changes");
    t.check(app.status() == "Master password updated", "master updated status");

    t.check(app.deleteAt(0), "delete succeeds");
    t.check(app.status() == "Connection removed", "delete status");
    t.check(app.store().count() == 0 && !app.selectedProfile(), "no profiles remain");
    t.check(!app.deleteAt(0), "deleting with nothing left fails");

    app.requestUpload();
    app.acceptNotice();
    t.check(!app.transfer().isActive(), "without a profile nothing starts");
}

// History is shown newest first, kHistoryPageSize entries per page.
void test_history_paging(TestContext &t, const QString &storePath,
                         const QSharedPointer<MockSshBackend> &backend) {
    ClientApp app(storePath, backend);
    t.check(app.store().initialize("m", "m"), "the paging store initializes");
    t.check(app.historyPageCount() == 1 && app.historyRange() == qMakePair(0, 0),
            "no profile means one empty page");

    QString feedback;
    app.saveDraft(aliceDraft(), -1, &feedback);
    for (int i = 0; i < 16; ++i) {
        app.disconnectSelected();
        app.connectSelected();
    }
    const SshProfile *p = app.selectedProfile();
    t.check(p && p->history.size() == 17, "seventeen connects are recorded");

    t.check(app.historyPageCount() == 3, "17 entries fill three pages");
    t.check(app.historyPage() == 0 && app.historyRange() == qMakePair(0, 8), "paging starts at the newest page");
    app.historyPagePrevious();
    t.check(app.historyPage() == 0, "there is nothing before the first page");

    app.historyPageNext();
    t.check(app.historyRange() == qMakePair(8, 16), "the second page holds the next eight");
    app.historyPageNext();
    app.historyPageNext();
    t.check(app.historyPage() == 2 && app.historyRange() == qMakePair(16, 17),
            "paging stops at the last, partial page");
    app.historyPagePrevious();
    t.check(app.historyPage() == 1, "Left goes back one page");

    ProfileDraft bob = aliceDraft();
    bob.name = "other";
    bob.user = "bob";
    t.check(app.saveDraft(bob, -1, &feedback) && app.store().count() == 2, "a second profile is saved");
    t.check(app.selectedProfile() && app.selectedProfile()->user == "bob", "the new profile is selected");
    t.check(app.historyPage() == 0 && app.historyPageCount() == 1, "a short history has a single page");

    if (app.selectedIndex() > 0)
        app.selectPrevious();
    else
        app.selectNext();
    t.check(app.selectedProfile() && app.selectedProfile()->user == "alice", "moving selects alice again");
    t.check(app.historyPage() == 0, "moving the selection resets the page");

    app.waitForWorkers();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication qapp(argc, argv);
    TestContext t;

    QTemporaryDir storeDir;
    QTemporaryDir remoteDir;
    QTemporaryDir localDir;
    t.check(storeDir.isValid() && remoteDir.isValid() && localDir.isValid(),
            "temporary directories should be available");

    const QString localRoot = QDir(localDir.path()).canonicalPath();
    QSharedPointer<MockSshBackend> backend(new MockSshBackend(remoteDir.path()));
    backend->setHomeDir("/home/alice");

    {
        ClientApp app(storeDir.path() + "/config.json", backend);
        t.check(app.store().initialize("m", "m"), "the store initializes");
        t.check(app.status() == "Ready", "the status starts as Ready");

        test_connect_bookkeeping(t, app, *backend);
        test_notice_flow(t, app);
        test_upload_flow(t, app, *backend, localRoot);
        test_download_flow(t, app, localRoot);
        test_edit_delete_master(t, app);

        app.waitForWorkers();
    }

    test_history_paging(t, storeDir.path() + "/paging.json", backend);

    return t.finish("client_app_tests");
}
