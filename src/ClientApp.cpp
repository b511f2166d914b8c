// ClientApp.cpp
//
// Command handlers behind the console key bindings. Every handler leaves
// a status line; failures that need attention raise a notice instead.

#include "ClientApp.h"

#include <QDebug>
#include <QFileInfo>

#include "RemoteOps.h"

static const char* kStatusReady      = "Ready";
static const char* kStatusCancelled  = "Cancelled";
static const char* kNotConnected     = "Selected connection is not connected";
static const char* kNoticeNotConnectedTitle   = "Not connected";
static const char* kNoticeNotConnectedMessage = "Please connect to the host machine first.";
static const char* kNoticeNoSubfoldersTitle   = "No subfolders";
static const char* kNoticeNoSubfoldersMessage =
    "This folder has no subfolders. To select it as the target, press S.";

ClientApp::ClientApp(const QString& storePath, QSharedPointer<SshBackend> backend)
    : m_store(storePath)
    , m_backend(backend)
    , m_engine(backend)
    , m_remote(backend)
    , m_status(kStatusReady)
{
}

ClientApp::~ClientApp()
{
    // Shells and transfers own their sessions; only ours are closed here.
    m_open.clear();
}

void ClientApp::waitForWorkers()
{
    m_engine.waitForWorkers();
    m_remote.waitForWorkers();
}

// =============================================================================
// Selection
// =============================================================================
const SshProfile* ClientApp::selectedProfile() const
{
    return m_store.at(m_selected);
}

void ClientApp::selectPrevious()
{
    if (m_selected > 0) {
        --m_selected;
        m_historyPage = 0;
    }
}

void ClientApp::selectNext()
{
    if (m_selected + 1 < m_store.count()) {
        ++m_selected;
        m_historyPage = 0;
    }
}

void ClientApp::selectKey(const QString& key)
{
    const int idx = m_store.indexOfKey(key);
    if (idx >= 0)
        m_selected = idx;
    clampSelection();
}

int ClientApp::historyPageCount() const
{
    const SshProfile* p = selectedProfile();
    const int len = p ? p->history.size() : 0;
    return len == 0 ? 1 : (len - 1) / kHistoryPageSize + 1;
}

int ClientApp::historyPage() const
{
    return qMin(m_historyPage, historyPageCount() - 1);
}

void ClientApp::historyPagePrevious()
{
    m_historyPage = historyPage();
    if (m_historyPage > 0)
        --m_historyPage;
}

void ClientApp::historyPageNext()
{
    m_historyPage = historyPage();
    if (m_historyPage + 1 < historyPageCount())
        ++m_historyPage;
}

QPair<int, int> ClientApp::historyRange() const
{
    const SshProfile* p = selectedProfile();
    const int len = p ? p->history.size() : 0;
    const int start = historyPage() * kHistoryPageSize;
    return qMakePair(qMin(start, len), qMin(start + kHistoryPageSize, len));
}

void ClientApp::clampSelection()
{
    if (m_selected >= m_store.count())
        m_selected = qMax(0, m_store.count() - 1);
}

// =============================================================================
// Connections
// =============================================================================
bool ClientApp::isConnected(const SshProfile& p) const
{
    for (const OpenConnection& c : m_open)
        if (sameIdentity(c.profile, p))
            return true;
    return false;
}

const SshProfile* ClientApp::selectedConnectedProfile() const
{
    const SshProfile* p = selectedProfile();
    if (p && isConnected(*p))
        return p;
    return nullptr;
}

RemoteSession* ClientApp::sessionFor(const SshProfile& p)
{
    for (OpenConnection& c : m_open)
        if (sameIdentity(c.profile, p))
            return c.session.get();
    return nullptr;
}

QString ClientApp::lastErrorFor(const SshProfile& p) const
{
    return m_lastError.value(profileKey(p));
}

bool ClientApp::connectSelected(ClientError* err)
{
    const SshProfile* p = selectedProfile();
    if (!p) {
        setStatus("No saved connection selected");
        return failWith(err, ErrorKind::InvalidState, "No saved connection selected");
    }
    const SshProfile copy = *p;
    return connectProfile(copy, err);
}

bool ClientApp::disconnectSelected()
{
    const SshProfile* p = selectedProfile();
    if (!p) {
        setStatus("No saved connection selected");
        return false;
    }

    for (auto it = m_open.begin(); it != m_open.end(); ++it) {
        if (sameIdentity(it->profile, *p)) {
            m_open.erase(it);
            setStatus("Disconnected");
            return true;
        }
    }

    setStatus(kNotConnected);
    return false;
}

bool ClientApp::connectProfile(const SshProfile& p, ClientError* err)
{
    clearError(err);

    if (isConnected(p)) {
        setStatus(QString("Already connected to %1").arg(p.label()));
        return true;
    }

    setStatus(QString("Connecting to %1...").arg(p.label()));

    ClientError dialErr;
    std::unique_ptr<RemoteSession> session = m_backend->dial(p, &dialErr);
    if (!session) {
        recordConnectError(p, dialErr.message);
        setStatus(QString("Connection failed: %1").arg(dialErr.message));
        if (err) *err = dialErr;
        return false;
    }

    // A draft for a saved identity keeps that profile's history.
    SshProfile updated = p;
    const int idx = m_store.indexOfIdentity(p);
    if (idx >= 0 && updated.history.isEmpty()) {
        updated.history = m_store.at(idx)->history;
        if (updated.lastRemoteDir.isEmpty())
            updated.lastRemoteDir = m_store.at(idx)->lastRemoteDir;
    }

    HistoryEntry e;
    e.ts = nowEpochSeconds();
    e.state = HistoryState::Success;
    updated.history.push_back(e);

    const QString key = profileKey(updated);

    OpenConnection conn;
    conn.profile = updated;
    conn.session = std::move(session);
    conn.connectedAt = QDateTime::currentDateTime();
    m_open.push_back(std::move(conn));

    ClientError saveErr;
    const bool saved = m_store.upsert(updated, &saveErr);
    selectKey(key);
    m_lastError.remove(key);

    if (!saved) {
        setStatus(QString("Connected, but saving failed: %1").arg(saveErr.message));
        if (err) *err = saveErr;
        return true;
    }

    setStatus(QString("Connected to %1").arg(updated.label()));
    return true;
}

void ClientApp::recordConnectError(const SshProfile& p, const QString& message)
{
    const QString key = profileKey(p);
    m_lastError.insert(key, message);

    if (m_store.indexOfIdentity(p) < 0)
        return;

    ClientError err;
    if (!m_store.appendHistory(p, HistoryState::Failure, 0, &err))
        setStatus(QString("Failed to save history: %1").arg(err.message));
    selectKey(key);
}

// =============================================================================
// Profile editing
// =============================================================================
bool ClientApp::saveDraft(const ProfileDraft& draft, int editIndex, QString* feedback)
{
    SshProfile p;
    ClientError err;
    if (!buildProfile(draft, &p, &err)) {
        if (feedback) *feedback = QString("Missing fields: %1").arg(err.message);
        return false;
    }

    if (editIndex >= 0) {
        if (!m_store.editAt(editIndex, p, &err)) {
            if (feedback) *feedback = err.message;
            return false;
        }
        selectKey(profileKey(p));
        setStatus("Connection updated");
        return true;
    }

    if (!connectProfile(p, &err)) {
        if (feedback) *feedback = QString("Connection failed: %1").arg(err.message);
        return false;
    }
    return true;
}

bool ClientApp::testDraft(const ProfileDraft& draft, QString* message)
{
    SshProfile p;
    ClientError err;
    if (!buildProfile(draft, &p, &err)) {
        *message = QString("Missing fields: %1").arg(err.message);
        return false;
    }

    std::unique_ptr<RemoteSession> session = m_backend->dial(p, &err);
    if (!session) {
        *message = QString("Connection failed: %1").arg(err.message);
        qWarning().noquote() << QString("Test connection %1 failed: %2").arg(p.label(), err.message);
        return false;
    }

    *message = QStringLiteral("Connection OK (not saved)");
    qInfo().noquote() << QString("Test connection %1 OK").arg(p.label());
    return true;
}

bool ClientApp::deleteAt(int index, ClientError* err)
{
    const SshProfile* p = m_store.at(index);
    if (!p)
        return failWith(err, ErrorKind::InvalidState, "No saved connection selected");

    const QString key = profileKey(*p);
    if (!m_store.removeAt(index, err)) {
        setStatus(QString("Failed to save: %1").arg(err ? err->message : QString()));
        return false;
    }

    m_lastError.remove(key);
    if (m_selected >= m_store.count() && m_selected > 0)
        --m_selected;
    setStatus("Connection removed");
    return true;
}

bool ClientApp::changeMaster(const QString& current, const QString& next, const QString& confirm,
                             ClientError* err)
{
    ClientError local;
    if (!m_store.changeMaster(current, next, confirm, &local)) {
        setStatus(QString("Master password not changed: %1").arg(local.message));
        if (err) *err = local;
        return false;
    }
    setStatus("Master password updated");
    return true;
}

// =============================================================================
// Status / notice / header
// =============================================================================
void ClientApp::setStatus(const QString& status)
{
    if (status == m_status)
        return;
    m_status = status;
    qInfo().noquote() << status;
}

void ClientApp::showNotice(const QString& title, const QString& message, NoticeAction action)
{
    m_notice.title = title;
    m_notice.message = message;
    m_noticeAction = action;
    m_hasNotice = true;
}

void ClientApp::dismissNotice()
{
    m_hasNotice = false;
    m_noticeAction = NoticeAction::None;
}

void ClientApp::acceptNotice()
{
    const NoticeAction action = m_noticeAction;
    dismissNotice();

    if (action == NoticeAction::None)
        return;
    if (!connectSelected())
        return;

    switch (action) {
        case NoticeAction::ConnectTerminal: m_terminalRequested = true; break;
        case NoticeAction::ConnectUpload:   startUpload(); break;
        case NoticeAction::ConnectDownload: startDownload(); break;
        case NoticeAction::None:            break;
    }
}

void ClientApp::connectFromNotice()
{
    dismissNotice();
    connectSelected();
}

bool ClientApp::takeTerminalRequest()
{
    const bool r = m_terminalRequested;
    m_terminalRequested = false;
    return r;
}

void ClientApp::cycleHeader()
{
    switch (m_header) {
        case HeaderMode::Help: m_header = HeaderMode::Logs; break;
        case HeaderMode::Logs: m_header = HeaderMode::Off;  break;
        case HeaderMode::Off:  m_header = HeaderMode::Help; break;
    }
}

// =============================================================================
// Transfer flow
// =============================================================================
void ClientApp::requestUpload()
{
    if (selectedConnectedProfile())
        startUpload();
    else
        showNotice(kNoticeNotConnectedTitle, kNoticeNotConnectedMessage, NoticeAction::ConnectUpload);
}

void ClientApp::requestDownload()
{
    if (selectedConnectedProfile())
        startDownload();
    else
        showNotice(kNoticeNotConnectedTitle, kNoticeNotConnectedMessage, NoticeAction::ConnectDownload);
}

void ClientApp::requestTerminal()
{
    if (selectedConnectedProfile())
        m_terminalRequested = true;
    else
        showNotice(kNoticeNotConnectedTitle, kNoticeNotConnectedMessage, NoticeAction::ConnectTerminal);
}

void ClientApp::startUpload()
{
    const SshProfile* p = selectedConnectedProfile();
    if (!p) {
        setStatus(kNotConnected);
        return;
    }

    ClientError err;
    if (!m_engine.startUpload(&err)) {
        reportEngineError(err);
        return;
    }
    m_transferProfile = *p;
    openLocalPicker(LocalBrowser::resolveStart(QString(), m_store.lastLocalDir()), false);
    setStatus(QString("Select source for %1").arg(p->label()));
}

void ClientApp::startDownload()
{
    const SshProfile* p = selectedConnectedProfile();
    if (!p) {
        setStatus(kNotConnected);
        return;
    }

    ClientError err;
    if (!m_engine.startDownload(&err)) {
        reportEngineError(err);
        return;
    }
    m_transferProfile = *p;
    openRemotePicker(RemoteBrowser::resolveStart(*p), false);
    setStatus(QString("Select remote source for %1").arg(p->label()));
}

void ClientApp::openLocalPicker(const QString& dir, bool onlyDirs)
{
    ClientError err;
    if (!m_local.open(dir, onlyDirs, &err)) {
        // Unreadable start directory: fall back to home.
        if (!m_local.open(LocalBrowser::resolveStart(QString(), QString()), onlyDirs, &err)) {
            setStatus(QString("Failed to open local picker: %1").arg(err.message));
            m_engine.abort();
            m_picker = PickerKind::None;
            return;
        }
    }
    m_picker = PickerKind::Local;
}

void ClientApp::openRemotePicker(const QString& dir, bool onlyDirs)
{
    m_remote.open(m_transferProfile, dir, onlyDirs);
    m_picker = PickerKind::Remote;
}

void ClientApp::rememberLocalDir(const QString& dir)
{
    ClientError err;
    if (!m_store.rememberLocalDir(dir, &err))
        setStatus(QString("Failed to save: %1").arg(err.message));
}

void ClientApp::rememberRemoteDir(const QString& dir)
{
    if (m_store.indexOfIdentity(m_transferProfile) < 0)
        return;

    ClientError err;
    if (!m_store.rememberRemoteDir(m_transferProfile, dir, &err))
        setStatus(QString("Failed to save: %1").arg(err.message));
    m_transferProfile.lastRemoteDir = dir;
}

void ClientApp::reportEngineError(const ClientError& err)
{
    qWarning().noquote() << QString("[TRANSFER] %1: %2").arg(errorKindName(err.kind), err.message);
    setStatus(err.message);
}

void ClientApp::pickerUp()
{
    if (m_picker == PickerKind::Local)  m_local.moveUp();
    if (m_picker == PickerKind::Remote) m_remote.moveUp();
}

void ClientApp::pickerDown()
{
    if (m_picker == PickerKind::Local)  m_local.moveDown();
    if (m_picker == PickerKind::Remote) m_remote.moveDown();
}

void ClientApp::pickerAscend()
{
    if (m_picker == PickerKind::Local) {
        ClientError err;
        if (!m_local.ascend(&err))
            setStatus(err.message);
    } else if (m_picker == PickerKind::Remote) {
        m_remote.ascend();
    }
}

void ClientApp::pickerEnter()
{
    const TransferState* st = m_engine.state();
    if (!st || m_picker == PickerKind::None)
        return;

    ClientError err;

    if (m_picker == PickerKind::Local) {
        const EnterOutcome r = m_local.enterSelected(&err);
        if (r == EnterOutcome::NoSubfolders) {
            showNotice(kNoticeNoSubfoldersTitle, kNoticeNoSubfoldersMessage);
            return;
        }
        if (r != EnterOutcome::NotDirectory) {
            if (err.isError())
                setStatus(err.message);
            return;
        }

        // File picked as upload source.
        if (st->direction == TransferDirection::Upload && st->step == TransferStep::PickSource) {
            const DirEntry entry = *m_local.selected();
            rememberLocalDir(m_local.cwd());
            if (!m_engine.selectSourceLocal(entry.path, false, &err)) {
                reportEngineError(err);
                return;
            }
            openRemotePicker(RemoteBrowser::resolveStart(m_transferProfile), true);
            setStatus(QString("Select target folder on %1").arg(m_transferProfile.label()));
        }
        return;
    }

    // Remote picker
    const EnterOutcome r = m_remote.enterSelected(sessionFor(m_transferProfile), &err);
    if (r == EnterOutcome::NoSubfolders) {
        showNotice(kNoticeNoSubfoldersTitle, kNoticeNoSubfoldersMessage);
        return;
    }
    if (r != EnterOutcome::NotDirectory) {
        if (err.isError())
            setStatus(err.message);
        return;
    }

    // File picked as download source.
    if (st->direction == TransferDirection::Download && st->step == TransferStep::PickSource) {
        const DirEntry entry = *m_remote.selected();
        rememberRemoteDir(m_remote.cwd());
        if (!m_engine.selectSourceRemote(entry.path, false, &err)) {
            reportEngineError(err);
            return;
        }
        openLocalPicker(LocalBrowser::resolveStart(QString(), m_store.lastLocalDir()), true);
        setStatus("Select local target folder");
    }
}

void ClientApp::pickerSelectDir()
{
    const TransferState* st = m_engine.state();
    if (!st || m_picker == PickerKind::None)
        return;

    const DirEntry* sel = (m_picker == PickerKind::Local) ? m_local.selected() : m_remote.selected();
    if (!sel || !sel->isDir)
        return;
    const DirEntry entry = *sel;

    const TransferDirection dir = st->direction;
    const TransferStep step = st->step;
    ClientError err;

    if (m_picker == PickerKind::Local) {
        if (dir == TransferDirection::Upload && step == TransferStep::PickSource) {
            rememberLocalDir(entry.path);
            if (!m_engine.selectSourceLocal(entry.path, true, &err)) {
                reportEngineError(err);
                return;
            }
            openRemotePicker(RemoteBrowser::resolveStart(m_transferProfile), true);
            setStatus(QString("Select target folder on %1").arg(m_transferProfile.label()));
        } else if (dir == TransferDirection::Download && step == TransferStep::PickTarget) {
            rememberLocalDir(entry.path);
            if (!m_engine.selectTargetLocal(entry.path, m_transferProfile, &err)) {
                reportEngineError(err);
                return;
            }
            m_picker = PickerKind::None;
            setStatus("Confirm transfer");
        }
        return;
    }

    if (dir == TransferDirection::Upload && step == TransferStep::PickTarget) {
        rememberRemoteDir(entry.path);
        if (!m_engine.selectTargetRemote(entry.path, &err)) {
            reportEngineError(err);
            return;
        }
        m_picker = PickerKind::None;
        setStatus("Confirm transfer");
    } else if (dir == TransferDirection::Download && step == TransferStep::PickSource) {
        rememberRemoteDir(entry.path);
        if (!m_engine.selectSourceRemote(entry.path, true, &err)) {
            reportEngineError(err);
            return;
        }
        openLocalPicker(LocalBrowser::resolveStart(QString(), m_store.lastLocalDir()), true);
        setStatus("Select local target folder");
    }
}

void ClientApp::pickerBack()
{
    const TransferState* st = m_engine.state();
    if (!st || st->step != TransferStep::PickTarget)
        return;

    ClientError err;

    // Upload: remote target picker -> local source picker at the source's parent.
    if (m_picker == PickerKind::Remote && st->direction == TransferDirection::Upload) {
        const QString parent = QFileInfo(st->sourceLocal).absolutePath();
        if (!m_engine.back(&err)) {
            reportEngineError(err);
            return;
        }
        openLocalPicker(LocalBrowser::resolveStart(parent, m_store.lastLocalDir()), false);
        return;
    }

    // Download: local target picker -> remote source picker at the source's parent.
    if (m_picker == PickerKind::Local && st->direction == TransferDirection::Download) {
        const QString parent = RemoteOps::parentRemoteDir(st->sourceRemote);
        if (!m_engine.back(&err)) {
            reportEngineError(err);
            return;
        }
        openRemotePicker(parent, false);
    }
}

void ClientApp::pickerEscape()
{
    m_picker = PickerKind::None;
    ClientError err;
    if (!m_engine.abort(&err)) {
        reportEngineError(err);
        return;
    }
    setStatus(kStatusCancelled);
}

void ClientApp::pickerToggleHidden()
{
    if (m_picker == PickerKind::Local) {
        ClientError err;
        m_local.setShowHidden(!m_local.showHidden(), &err);
        if (err.isError())
            setStatus(err.message);
    } else if (m_picker == PickerKind::Remote) {
        m_remote.setShowHidden(!m_remote.showHidden());
    }
}

void ClientApp::confirmTransfer()
{
    const TransferState* st = m_engine.state();
    if (!st || st->step != TransferStep::Confirm)
        return;

    if (!isConnected(m_transferProfile)) {
        setStatus(kNotConnected);
        return;
    }

    ClientError err;
    if (!m_engine.confirm(m_transferProfile, &err)) {
        reportEngineError(err);
        return;
    }
    setStatus("Transfer started");
}

void ClientApp::confirmBack()
{
    const TransferState* st = m_engine.state();
    if (!st || st->step != TransferStep::Confirm)
        return;

    const TransferDirection dir = st->direction;
    const QString target = st->targetPath();

    ClientError err;
    if (!m_engine.back(&err)) {
        reportEngineError(err);
        return;
    }

    if (dir == TransferDirection::Upload)
        openRemotePicker(target.isEmpty() ? QStringLiteral("/") : target, true);
    else
        openLocalPicker(LocalBrowser::resolveStart(target, m_store.lastLocalDir()), true);
}

void ClientApp::confirmEscape()
{
    if (m_engine.isTransferring()) {
        ClientError err;
        if (!m_engine.cancel(&err))
            reportEngineError(err);
        else
            setStatus("Cancelling transfer...");
        return;
    }

    m_picker = PickerKind::None;
    m_engine.abort();
    setStatus(kStatusCancelled);
}

void ClientApp::hideTransfer()
{
    if (m_engine.isTransferring())
        m_engine.setHidden(true);
}

// =============================================================================
// Tick
// =============================================================================
bool ClientApp::tick()
{
    bool changed = false;

    if (m_remote.poll()) {
        changed = true;
        if (!m_remote.error().isEmpty())
            setStatus(QString("Remote listing failed: %1").arg(m_remote.error()));
    }

    if (m_engine.poll())
        changed = true;

    if (!m_hasNotice) {
        Notice n;
        if (m_engine.takeNotice(&n)) {
            showNotice(n.title, n.message);
            setStatus(n.message);
            changed = true;
        }
    }

    return changed;
}
