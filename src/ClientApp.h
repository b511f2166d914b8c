#pragma once

#include <QDateTime>
#include <QHash>
#include <QPair>
#include <QSharedPointer>
#include <QString>

#include <memory>
#include <vector>

#include "ClientError.h"
#include "LocalBrowser.h"
#include "ProfileStore.h"
#include "RemoteBrowser.h"
#include "RemoteSession.h"
#include "SshProfile.h"
#include "TransferEngine.h"

// Header panel above the profile list, cycled with `v`.
enum class HeaderMode {
    Help,
    Logs,
    Off
};

// Which browser currently owns the keyboard during a transfer.
enum class PickerKind {
    None,
    Local,
    Remote
};

// What to do after the "Not connected" notice is accepted.
enum class NoticeAction {
    None,
    ConnectTerminal,
    ConnectUpload,
    ConnectDownload
};

struct OpenConnection {
    SshProfile                     profile;
    std::unique_ptr<RemoteSession> session;
    QDateTime                      connectedAt;
};

/*
    ClientApp
    ---------
    The whole client state in one place, driven from the console thread:
    profile store, open connections, transfer engine, both browsers,
    status line, notice and header mode.

    Front ends call the command methods and tick() every 150 ms; nothing
    here blocks on a worker.
*/
class ClientApp
{
public:
    ClientApp(const QString& storePath, QSharedPointer<SshBackend> backend);
    ~ClientApp();

    ClientApp(const ClientApp&) = delete;
    ClientApp& operator=(const ClientApp&) = delete;

    ProfileStore& store() { return m_store; }
    const ProfileStore& store() const { return m_store; }

    // ---- selection ----
    int selectedIndex() const { return m_selected; }
    const SshProfile* selectedProfile() const;
    void selectPrevious();
    void selectNext();
    void selectKey(const QString& key);

    // ---- history paging (newest entry first) ----
    static constexpr int kHistoryPageSize = 8;
    int historyPage() const;         // zero-based, clamped to the last page
    int historyPageCount() const;    // at least 1
    void historyPagePrevious();
    void historyPageNext();
    // Half-open [first, second) range into the newest-first history.
    QPair<int, int> historyRange() const;

    // ---- connections ----
    bool isConnected(const SshProfile& p) const;
    const SshProfile* selectedConnectedProfile() const;
    RemoteSession* sessionFor(const SshProfile& p);
    const std::vector<OpenConnection>& openConnections() const { return m_open; }
    QString lastErrorFor(const SshProfile& p) const;

    bool connectSelected(ClientError* err = nullptr);
    bool disconnectSelected();

    // Dials, appends one Success (or, for a saved profile, Failure) entry
    // and keeps the session. New profiles are saved only on success.
    bool connectProfile(const SshProfile& p, ClientError* err = nullptr);

    // ---- profile editing ----
    // editIndex < 0: connect and save a new profile.
    // Otherwise replace that profile without connecting.
    // `feedback` receives the line shown under the form on failure.
    bool saveDraft(const ProfileDraft& draft, int editIndex, QString* feedback);

    // "Connection OK (not saved)" / "Connection failed: ..." / "Missing fields: ..."
    bool testDraft(const ProfileDraft& draft, QString* message);

    bool deleteAt(int index, ClientError* err = nullptr);
    bool changeMaster(const QString& current, const QString& next, const QString& confirm,
                      ClientError* err = nullptr);

    // ---- status / notice / header ----
    const QString& status() const { return m_status; }
    void setStatus(const QString& status);

    bool hasNotice() const { return m_hasNotice; }
    const Notice& notice() const { return m_notice; }
    NoticeAction noticeAction() const { return m_noticeAction; }
    void showNotice(const QString& title, const QString& message,
                    NoticeAction action = NoticeAction::None);

    // Enter: runs the pending action (connect first). Esc: just closes.
    void acceptNotice();
    void dismissNotice();
    // `c` on a notice: close it and connect the selected profile.
    void connectFromNotice();

    // Set by acceptNotice() for the front end, which owns terminals.
    bool takeTerminalRequest();

    HeaderMode headerMode() const { return m_header; }
    void cycleHeader();

    // ---- transfers ----
    TransferEngine& transfer() { return m_engine; }
    const TransferEngine& transfer() const { return m_engine; }
    PickerKind picker() const { return m_picker; }
    const LocalBrowser& localBrowser() const { return m_local; }
    const RemoteBrowser& remoteBrowser() const { return m_remote; }

    // Require the selected profile to be connected.
    void requestUpload();
    void requestDownload();
    void requestTerminal();

    void pickerUp();
    void pickerDown();
    void pickerAscend();       // Backspace
    void pickerEnter();        // Enter
    void pickerSelectDir();    // s
    void pickerBack();         // b
    void pickerEscape();       // Esc
    void pickerToggleHidden(); // .

    void confirmTransfer();    // Enter / y on the confirm modal
    void confirmBack();        // b on the confirm modal
    void confirmEscape();      // Esc: abort before start, cancel while running
    void hideTransfer();       // Enter while running

    // Drains worker channels. Returns true if anything visible changed.
    bool tick();

    // Blocks until pool workers return. Shutdown and tests.
    void waitForWorkers();

private:
    void startUpload();
    void startDownload();
    void openLocalPicker(const QString& dir, bool onlyDirs);
    void openRemotePicker(const QString& dir, bool onlyDirs);
    void recordConnectError(const SshProfile& p, const QString& message);
    void rememberLocalDir(const QString& dir);
    void rememberRemoteDir(const QString& dir);
    void reportEngineError(const ClientError& err);
    void clampSelection();

    ProfileStore               m_store;
    QSharedPointer<SshBackend> m_backend;
    std::vector<OpenConnection> m_open;
    QHash<QString, QString>    m_lastError;   // profileKey -> message
    int                        m_selected = 0;
    int                        m_historyPage = 0;

    TransferEngine             m_engine;
    SshProfile                 m_transferProfile;
    PickerKind                 m_picker = PickerKind::None;
    LocalBrowser               m_local;
    RemoteBrowser              m_remote;

    QString                    m_status;
    bool                       m_hasNotice = false;
    Notice                     m_notice;
    NoticeAction               m_noticeAction = NoticeAction::None;
    bool                       m_terminalRequested = false;
    HeaderMode                 m_header = HeaderMode::Help;
};
