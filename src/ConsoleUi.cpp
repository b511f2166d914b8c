#include "ConsoleUi.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QSocketNotifier>
#include <QThread>

#include <cerrno>
#include <unistd.h>

#include "Logger.h"
#include "SshShellWorker.h"

static const char* kClearScreen = "\x1b[H\x1b[2J";
static const char* kHideCursor  = "\x1b[?25l";
static const char* kShowCursor  = "\x1b[?25h";

static constexpr int kLogLines = 6;

ConsoleUi::ConsoleUi(ClientApp& app, QSharedPointer<SshBackend> backend, QObject* parent)
    : QObject(parent)
    , m_app(app)
    , m_backend(std::move(backend))
{
    m_timer.setInterval(kTickMs);
    connect(&m_timer, &QTimer::timeout, this, &ConsoleUi::onTick);
}

ConsoleUi::~ConsoleUi()
{
    shutdown();
}

bool ConsoleUi::start()
{
    if (!m_raw.enter())
        return false;

    m_stdin = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdin, SIGNAL(activated(int)), this, SLOT(onStdinReady()));

    TerminalIo::writeOut(kHideCursor);
    m_timer.start();
    m_dirty = true;
    render();
    return true;
}

void ConsoleUi::shutdown()
{
    m_timer.stop();
    if (m_stdin) {
        m_stdin->setEnabled(false);
        m_stdin->deleteLater();
        m_stdin = nullptr;
    }

    while (!m_tabs.empty())
        closeTab(static_cast<int>(m_tabs.size()) - 1);

    if (m_raw.isActive()) {
        TerminalIo::writeOut(QByteArray(kClearScreen) + kShowCursor);
        m_raw.restore();
    }
}

// =============================================================================
// Input
// =============================================================================
void ConsoleUi::onStdinReady()
{
    char buf[4096];
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n == 0) {
        emit quitRequested();
        return;
    }
    if (n < 0) {
        if (errno != EINTR && errno != EAGAIN)
            emit quitRequested();
        return;
    }

    handleKeys(m_decoder.feed(QByteArray(buf, static_cast<int>(n))));
    render();
}

void ConsoleUi::onTick()
{
    if (m_decoder.hasPending())
        handleKeys(m_decoder.flush());

    if (m_app.tick())
        m_dirty = true;

    if (m_app.takeTerminalRequest())
        openTerminalTab();

    render();
}

void ConsoleUi::handleKeys(const QVector<KeyEvent>& keys)
{
    for (const KeyEvent& ev : keys)
        handleKey(ev);
}

UiMode ConsoleUi::currentMode() const
{
    if (m_activeTab > 0)
        return UiMode::Terminal;
    if (m_app.hasNotice())
        return UiMode::Notice;
    if (m_confirmDelete)
        return UiMode::ConfirmDelete;
    if (m_keyFilePickerOpen || m_knownKeysOpen)
        return UiMode::Picker;
    if (m_formOpen || m_masterOpen)
        return UiMode::Form;

    const TransferState* st = m_app.transfer().state();
    if (st) {
        if (st->step == TransferStep::Transferring && !m_app.transfer().isHidden())
            return UiMode::Transferring;
        if (st->step == TransferStep::Confirm)
            return UiMode::Confirm;
        if (m_app.picker() != PickerKind::None)
            return UiMode::Picker;
    }
    return UiMode::Normal;
}

void ConsoleUi::handleKey(const KeyEvent& ev)
{
    const UiMode mode = currentMode();
    const Command c = commandFor(mode, ev);
    if (c == Command::None)
        return;

    if (mode != UiMode::Terminal)
        m_dirty = true;

    switch (mode) {
        case UiMode::Normal:        handleNormal(c); break;
        case UiMode::Notice:        handleNotice(c); break;
        case UiMode::ConfirmDelete: handleConfirmDelete(c); break;
        case UiMode::Form:
            if (m_masterOpen)
                handleMasterForm(c, ev);
            else
                handleConnectionForm(c, ev);
            break;
        case UiMode::Picker:
            if (m_keyFilePickerOpen)
                handleKeyFilePicker(c);
            else if (m_knownKeysOpen)
                handleKnownKeyPicker(c);
            else
                handleTransferPicker(c);
            break;
        case UiMode::Confirm:
        case UiMode::Transferring:
            handleTransferConfirm(c);
            break;
        case UiMode::Terminal:
            handleTerminal(c, ev);
            break;
    }

    if (m_app.takeTerminalRequest())
        openTerminalTab();
}

void ConsoleUi::handleNormal(Command c)
{
    const int tabCount = static_cast<int>(m_tabs.size());

    switch (c) {
        case Command::Quit:
            emit quitRequested();
            break;

        case Command::NewProfile:
            m_form.reset();
            m_formOpen = true;
            m_app.setStatus("Fill fields and press Enter to connect");
            break;

        case Command::EditProfile:
            if (const SshProfile* p = m_app.selectedProfile()) {
                m_form.reset(ProfileDraft::fromProfile(*p), m_app.selectedIndex());
                m_formOpen = true;
                m_app.setStatus("Edit fields and press Enter to save");
            } else {
                m_app.setStatus("No saved connections");
            }
            break;

        case Command::ToggleConnect:
            if (m_app.selectedConnectedProfile())
                m_app.disconnectSelected();
            else
                m_app.connectSelected();
            break;

        case Command::OpenTerminal:  m_app.requestTerminal(); break;
        case Command::Upload:        m_app.requestUpload(); break;
        case Command::Download:      m_app.requestDownload(); break;

        case Command::ChangeMaster:
            m_master.reset();
            m_masterOpen = true;
            m_app.setStatus("Change master password");
            break;

        case Command::DeleteProfile:
            if (m_app.store().count() == 0) {
                m_app.setStatus("No saved connections");
            } else {
                m_confirmDelete = true;
                m_deleteIndex = m_app.selectedIndex();
                m_app.setStatus("Confirm delete");
            }
            break;

        case Command::CycleHeader:     m_app.cycleHeader(); break;
        case Command::SelectPrevious:  m_app.selectPrevious(); break;
        case Command::SelectNext:      m_app.selectNext(); break;
        case Command::HistoryPrevious: m_app.historyPagePrevious(); break;
        case Command::HistoryNext:     m_app.historyPageNext(); break;

        case Command::ShowTransfer:
            if (m_app.transfer().isTransferring())
                m_app.transfer().setHidden(false);
            else
                m_app.setStatus("No transfer running");
            break;

        case Command::NextTab:
            if (tabCount > 0)
                switchTo(1);
            break;
        case Command::PreviousTab:
            if (tabCount > 0)
                switchTo(tabCount);
            break;

        default:
            break;
    }
}

void ConsoleUi::handleNotice(Command c)
{
    switch (c) {
        case Command::AcceptNotice:      m_app.acceptNotice(); break;
        case Command::DismissNotice:     m_app.dismissNotice(); break;
        case Command::ConnectFromNotice: m_app.connectFromNotice(); break;
        default: break;
    }
}

void ConsoleUi::handleConfirmDelete(Command c)
{
    if (c == Command::ConfirmYes) {
        m_app.deleteAt(m_deleteIndex);
    } else if (c == Command::ConfirmNo) {
        m_app.setStatus("Cancelled");
    } else {
        return;
    }
    m_confirmDelete = false;
    m_deleteIndex = -1;
}

void ConsoleUi::handleConnectionForm(Command c, const KeyEvent& ev)
{
    switch (c) {
        case Command::FormCancel:
            m_formOpen = false;
            m_form.reset();
            m_app.setStatus("Cancelled");
            break;

        case Command::FieldNext:      m_form.next(); break;
        case Command::FieldPrevious:  m_form.previous(); break;
        case Command::OptionPrevious: m_form.cycleAuthKind(false); break;
        case Command::OptionNext:     m_form.cycleAuthKind(true); break;
        case Command::FieldBackspace: m_form.backspace(); break;

        case Command::FieldInsert:
            if (ev.ch.isPrint())
                m_form.insert(ev.ch);
            break;

        case Command::OpenKeyFilePicker: {
            if (m_form.activeField() != FormField::KeyPath)
                break;
            ClientError err;
            const QString start = LocalBrowser::resolveStart(m_form.draft().keyPath,
                                                             QDir::homePath() + "/.ssh");
            if (!m_keyFiles.open(start, false, &err)) {
                m_app.setStatus(err.message);
                break;
            }
            if (!m_keyFiles.showHidden())
                m_keyFiles.setShowHidden(true, &err);
            m_keyFilePickerOpen = true;
            break;
        }

        case Command::OpenKnownKeyPicker:
            if (m_form.activeField() != FormField::KeyPath)
                break;
            m_knownKeys = m_app.store().knownKeyCandidates();
            if (m_knownKeys.isEmpty()) {
                m_app.setStatus("No saved keys");
                break;
            }
            m_knownKeyIndex = 0;
            m_knownKeysOpen = true;
            break;

        case Command::FormSubmit:
            if (m_form.activeField() == FormField::ActionTest) {
                QString message;
                m_app.testDraft(m_form.draft(), &message);
                m_form.feedback = message;
                m_app.showNotice("Test connection", message);
            } else if (m_form.activeField() == FormField::ActionSave) {
                QString feedback;
                if (m_app.saveDraft(m_form.draft(), m_form.editIndex(), &feedback)) {
                    m_formOpen = false;
                    m_form.reset();
                } else {
                    m_form.feedback = feedback;
                }
            } else {
                m_form.next();
            }
            break;

        default:
            break;
    }
}

void ConsoleUi::handleMasterForm(Command c, const KeyEvent& ev)
{
    switch (c) {
        case Command::FormCancel:
            m_masterOpen = false;
            m_master.reset();
            m_app.setStatus("Cancelled");
            break;

        case Command::FieldNext:      m_master.next(); break;
        case Command::FieldPrevious:  m_master.previous(); break;
        case Command::FieldBackspace: m_master.backspace(); break;

        case Command::FieldInsert:
            if (ev.ch.isPrint())
                m_master.insert(ev.ch);
            break;

        case Command::FormSubmit:
            if (m_master.activeField() != MasterField::ActionSave) {
                m_master.next();
                break;
            }
            if (m_app.changeMaster(m_master.currentPassword(), m_master.newPassword(),
                                   m_master.confirmPassword())) {
                m_masterOpen = false;
                m_master.reset();
            }
            break;

        default:
            break;
    }
}

void ConsoleUi::handleKeyFilePicker(Command c)
{
    ClientError err;

    switch (c) {
        case Command::PickerUp:   m_keyFiles.moveUp(); break;
        case Command::PickerDown: m_keyFiles.moveDown(); break;

        case Command::PickerAscend:
            if (!m_keyFiles.ascend(&err))
                m_app.setStatus(err.message);
            break;

        case Command::PickerToggleHidden:
            m_keyFiles.setShowHidden(!m_keyFiles.showHidden(), &err);
            if (err.isError())
                m_app.setStatus(err.message);
            break;

        case Command::PickerEnter: {
            const EnterOutcome r = m_keyFiles.enterSelected(&err);
            if (r == EnterOutcome::NotDirectory) {
                m_form.setKeyPath(m_keyFiles.selected()->path);
                m_keyFilePickerOpen = false;
            } else if (err.isError()) {
                m_app.setStatus(err.message);
            }
            break;
        }

        case Command::PickerEscape:
            m_keyFilePickerOpen = false;
            break;

        default:
            break;
    }
}

void ConsoleUi::handleKnownKeyPicker(Command c)
{
    switch (c) {
        case Command::PickerUp:
            if (m_knownKeyIndex > 0)
                --m_knownKeyIndex;
            break;
        case Command::PickerDown:
            if (m_knownKeyIndex + 1 < m_knownKeys.size())
                ++m_knownKeyIndex;
            break;
        case Command::PickerEnter:
            if (m_knownKeyIndex >= 0 && m_knownKeyIndex < m_knownKeys.size())
                m_form.applyKeyCandidate(m_knownKeys.at(m_knownKeyIndex));
            m_knownKeysOpen = false;
            m_knownKeys.clear();
            break;
        case Command::PickerEscape:
            m_knownKeysOpen = false;
            m_knownKeys.clear();
            break;
        default:
            break;
    }
}

void ConsoleUi::handleTransferPicker(Command c)
{
    switch (c) {
        case Command::PickerUp:           m_app.pickerUp(); break;
        case Command::PickerDown:         m_app.pickerDown(); break;
        case Command::PickerAscend:       m_app.pickerAscend(); break;
        case Command::PickerEnter:        m_app.pickerEnter(); break;
        case Command::PickerSelectDir:    m_app.pickerSelectDir(); break;
        case Command::PickerBack:         m_app.pickerBack(); break;
        case Command::PickerEscape:       m_app.pickerEscape(); break;
        case Command::PickerToggleHidden: m_app.pickerToggleHidden(); break;
        default: break;
    }
}

void ConsoleUi::handleTransferConfirm(Command c)
{
    switch (c) {
        case Command::StartTransfer:  m_app.confirmTransfer(); break;
        case Command::TransferBack:   m_app.confirmBack(); break;
        case Command::TransferEscape: m_app.confirmEscape(); break;
        case Command::HideTransfer:   m_app.hideTransfer(); break;
        default: break;
    }
}

void ConsoleUi::handleTerminal(Command c, const KeyEvent& ev)
{
    const int count = static_cast<int>(m_tabs.size());

    switch (c) {
        case Command::LeaveTerminal:
            switchTo(0);
            break;
        case Command::NextTab:
            switchTo((m_activeTab + 1) % (count + 1));
            break;
        case Command::PreviousTab:
            switchTo((m_activeTab + count) % (count + 1));
            break;
        case Command::CloseTab:
            closeTab(m_activeTab - 1);
            break;
        case Command::SendToShell:
            m_tabs[m_activeTab - 1]->worker->sendInput(ev.raw);
            break;
        default:
            break;
    }
}

// =============================================================================
// Terminal tabs
// =============================================================================
void ConsoleUi::openTerminalTab()
{
    const SshProfile* selected = m_app.selectedConnectedProfile();
    if (!selected) {
        m_app.setStatus("Selected connection is not connected");
        return;
    }
    const SshProfile profile = *selected;

    // libssh sessions are single-threaded: the shell gets a session of its own.
    ClientError err;
    std::unique_ptr<RemoteSession> session = m_backend->dial(profile, &err);
    if (!session) {
        m_app.setStatus(QString("Terminal failed: %1").arg(err.message));
        return;
    }

    int cols = 80;
    int rows = 24;
    TerminalIo::size(&cols, &rows);

    std::unique_ptr<ShellChannel> channel = session->openShell(cols, rows, &err);
    if (!channel) {
        m_app.setStatus(QString("Terminal failed: %1").arg(err.message));
        return;
    }

    std::unique_ptr<TerminalTab> tab(new TerminalTab());
    tab->id = m_nextTabId++;
    tab->title = profile.label();
    tab->session = std::move(session);
    tab->thread = new QThread(this);
    tab->worker = new SshShellWorker(std::move(channel));
    tab->worker->moveToThread(tab->thread);

    const int id = tab->id;
    connect(tab->thread, &QThread::started, tab->worker, &SshShellWorker::startShell);
    connect(tab->worker, &SshShellWorker::outputReady, this,
            [this, id](const QByteArray& data) { onShellOutput(id, data); });
    connect(tab->worker, &SshShellWorker::shellClosed, this,
            [this, id](const QString& reason) { onShellClosed(id, reason); });

    tab->thread->start();
    m_tabs.push_back(std::move(tab));

    m_app.setStatus(QString("Terminal opened on %1 (Ctrl+G returns)").arg(profile.label()));
    switchTo(static_cast<int>(m_tabs.size()));
}

void ConsoleUi::closeTab(int tabIndex)
{
    if (tabIndex < 0 || tabIndex >= static_cast<int>(m_tabs.size()))
        return;

    std::unique_ptr<TerminalTab>& tab = m_tabs[tabIndex];

    tab->worker->stopShell();
    tab->thread->quit();
    tab->thread->wait();

    delete tab->worker;
    tab->worker = nullptr;
    delete tab->thread;
    tab->thread = nullptr;
    tab->session.reset();

    m_tabs.erase(m_tabs.begin() + tabIndex);

    const int closed = tabIndex + 1;
    if (m_activeTab == closed)
        switchTo(0);
    else if (m_activeTab > closed)
        --m_activeTab;
}

void ConsoleUi::switchTo(int activeTab)
{
    if (activeTab < 0 || activeTab > static_cast<int>(m_tabs.size()))
        return;

    m_activeTab = activeTab;

    if (m_activeTab == 0) {
        m_dirty = true;
        render();
        return;
    }

    TerminalIo::writeOut(QByteArray(kClearScreen) + kShowCursor + m_tabs[m_activeTab - 1]->replay);
}

int ConsoleUi::tabIndexForId(int id) const
{
    for (int i = 0; i < static_cast<int>(m_tabs.size()); ++i)
        if (m_tabs[i]->id == id)
            return i;
    return -1;
}

void ConsoleUi::onShellOutput(int id, const QByteArray& data)
{
    const int idx = tabIndexForId(id);
    if (idx < 0)
        return;

    QByteArray& replay = m_tabs[idx]->replay;
    replay.append(data);
    if (replay.size() > kReplayBytes)
        replay.remove(0, replay.size() - kReplayBytes);

    if (m_activeTab == idx + 1)
        TerminalIo::writeOut(data);
}

void ConsoleUi::onShellClosed(int id, const QString& reason)
{
    const int idx = tabIndexForId(id);
    if (idx < 0)
        return;

    const QString title = m_tabs[idx]->title;
    closeTab(idx);
    m_app.setStatus(QString("Terminal %1 closed: %2").arg(title, reason));
    m_dirty = true;
}

// =============================================================================
// Rendering
// =============================================================================
void ConsoleUi::render()
{
    if (m_activeTab != 0 || !m_dirty || !m_raw.isActive())
        return;
    m_dirty = false;

    QStringList out;
    renderTabs(out);
    renderHeader(out);
    out << QString();

    if (m_formOpen) {
        if (m_keyFilePickerOpen)
            renderBrowser(out, m_keyFiles, "Select private key (Enter: pick, Backspace: up, Esc: close)",
                          false, QString());
        else if (m_knownKeysOpen)
            renderKnownKeys(out);
        else
            renderConnectionForm(out);
    } else if (m_masterOpen) {
        renderMasterForm(out);
    } else if (m_app.transfer().isActive() &&
               !(m_app.transfer().isTransferring() && m_app.transfer().isHidden())) {
        renderTransfer(out);
    } else {
        renderProfiles(out);
        out << QString();
        renderDetails(out);
    }

    if (m_confirmDelete) {
        const SshProfile* p = m_app.store().at(m_deleteIndex);
        out << QString();
        out << QString("Delete %1? (y/Enter: yes, n/Esc: no)").arg(p ? p->label() : QString());
    }

    renderNotice(out);

    out << QString();
    out << QString("Status: %1").arg(m_app.status());

    int cols = 80;
    TerminalIo::size(&cols, nullptr);
    for (QString& line : out) {
        if (line.size() > cols)
            line.truncate(cols);
    }

    TerminalIo::writeOut(QByteArray(kClearScreen) + kHideCursor + out.join("\r\n").toUtf8());
}

void ConsoleUi::renderTabs(QStringList& out) const
{
    QStringList tabs;
    tabs << (m_activeTab == 0 ? "[Client]" : "Client");
    for (int i = 0; i < static_cast<int>(m_tabs.size()); ++i) {
        const QString t = QString("%1:%2").arg(i + 1).arg(m_tabs[i]->title);
        tabs << (m_activeTab == i + 1 ? "[" + t + "]" : t);
    }
    out << QString("ss-ssh  %1").arg(tabs.join("  "));
}

void ConsoleUi::renderHeader(QStringList& out) const
{
    switch (m_app.headerMode()) {
        case HeaderMode::Help:
            out << "q quit  n new  e edit  c connect/disconnect  t terminal  u upload  d download";
            out << "o master password  x delete  v header  p show transfer  Left/Right history  F6/F7 tabs  F8 close tab";
            break;
        case HeaderMode::Logs: {
            const QStringList lines = Logger::recentLines();
            const int from = qMax(0, lines.size() - kLogLines);
            for (int i = from; i < lines.size(); ++i)
                out << lines.at(i);
            if (lines.isEmpty())
                out << Logger::lastLine();
            break;
        }
        case HeaderMode::Off:
            break;
    }
}

void ConsoleUi::renderProfiles(QStringList& out) const
{
    const QVector<SshProfile>& profiles = m_app.store().profiles();
    out << QString("Saved connections (%1)").arg(profiles.size());

    if (profiles.isEmpty()) {
        out << "  none yet, press n to add one";
        return;
    }

    for (int i = 0; i < profiles.size(); ++i) {
        const SshProfile& p = profiles.at(i);
        const QString cursor = (i == m_app.selectedIndex()) ? "> " : "  ";
        const QString mark = m_app.isConnected(p) ? "[*] " : "[ ] ";
        out << cursor + mark + QString("%1  %2@%3").arg(p.label(), p.user, p.host);
    }
}

void ConsoleUi::renderDetails(QStringList& out) const
{
    const SshProfile* p = m_app.selectedProfile();
    if (!p)
        return;

    out << QString("Connection: %1@%2").arg(p->user, p->host);
    if (p->auth.kind == AuthKind::Password)
        out << "Auth: password";
    else
        out << QString("Auth: private key %1%2").arg(p->auth.keyPath,
                                                      p->auth.hasPassphrase() ? " (passphrase)" : "");

    if (!p->lastRemoteDir.isEmpty())
        out << QString("Last remote dir: %1").arg(p->lastRemoteDir);

    for (const OpenConnection& c : m_app.openConnections()) {
        if (sameIdentity(c.profile, *p))
            out << QString("Connected since %1").arg(c.connectedAt.toString("HH:mm:ss"));
    }

    const QString lastError = m_app.lastErrorFor(*p);
    if (!lastError.isEmpty())
        out << QString("Last error: %1").arg(lastError);

    out << QString("Past connections (%1/%2):").arg(m_app.historyPage() + 1)
                                               .arg(m_app.historyPageCount());
    if (p->history.isEmpty()) {
        out << "  (none)";
        return;
    }

    const QPair<int, int> range = m_app.historyRange();
    for (int i = range.first; i < range.second; ++i)
        out << "  " + formatHistoryEntry(p->history.at(p->history.size() - 1 - i));
}

void ConsoleUi::renderConnectionForm(QStringList& out) const
{
    out << (m_form.isEdit() ? "Edit connection" : "New connection");

    for (FormField f : m_form.fields()) {
        const QString cursor = (f == m_form.activeField()) ? "> " : "  ";
        if (f == FormField::ActionTest || f == FormField::ActionSave)
            out << cursor + formFieldLabel(f);
        else
            out << cursor + QString("%1: %2").arg(formFieldLabel(f), -10).arg(m_form.displayValue(f));
    }

    out << QString();
    out << "Tab/Up/Down move  Left/Right auth  F2 browse key  F3 known keys  Enter select  Esc cancel";
    if (!m_form.feedback.isEmpty())
        out << m_form.feedback;
}

void ConsoleUi::renderMasterForm(QStringList& out) const
{
    out << "Change master password";

    struct Row { MasterField field; const char* label; };
    const Row rows[] = {
        { MasterField::Current, "Current" },
        { MasterField::New,     "New" },
        { MasterField::Confirm, "Confirm" },
    };

    for (const Row& r : rows) {
        const QString cursor = (r.field == m_master.activeField()) ? "> " : "  ";
        out << cursor + QString("%1: %2").arg(QString(r.label), -10)
                            .arg(QString(m_master.length(r.field), QLatin1Char('*')));
    }
    out << ((m_master.activeField() == MasterField::ActionSave) ? "> [ Save ]" : "  [ Save ]");
}

void ConsoleUi::renderBrowser(QStringList& out, const DirBrowser& b, const QString& title,
                              bool loading, const QString& error) const
{
    out << title;
    out << QString("%1%2").arg(b.cwd(), b.showHidden() ? "  (hidden shown)" : "");

    if (loading) {
        out << "  loading...";
        return;
    }
    if (!error.isEmpty()) {
        out << QString("  error: %1").arg(error);
        return;
    }
    if (b.entries().isEmpty()) {
        out << (b.onlyDirs() ? "  (no subfolders)" : "  (empty)");
        return;
    }

    int rows = 24;
    TerminalIo::size(nullptr, &rows);
    const int window = qMax(5, rows - 14);
    const int count = b.entries().size();
    int first = qMax(0, b.selectedIndex() - window / 2);
    first = qMin(first, qMax(0, count - window));
    const int last = qMin(count, first + window);

    for (int i = first; i < last; ++i) {
        const DirEntry& e = b.entries().at(i);
        const QString cursor = (i == b.selectedIndex()) ? "> " : "  ";
        out << cursor + e.name + (e.isDir ? "/" : "");
    }
}

void ConsoleUi::renderKnownKeys(QStringList& out) const
{
    out << "Known keys (Enter: use, Esc: close)";
    for (int i = 0; i < m_knownKeys.size(); ++i) {
        const KeyCandidate& k = m_knownKeys.at(i);
        const QString cursor = (i == m_knownKeyIndex) ? "> " : "  ";
        out << cursor + k.path + (k.passphrase.isEmpty() ? "" : "  (passphrase)");
    }
}

void ConsoleUi::renderTransfer(QStringList& out) const
{
    const TransferState* st = m_app.transfer().state();
    if (!st)
        return;

    const bool upload = (st->direction == TransferDirection::Upload);
    const QString host = m_app.remoteBrowser().profile().label();

    if (st->step == TransferStep::PickSource || st->step == TransferStep::PickTarget) {
        if (m_app.picker() == PickerKind::Local) {
            const QString title = (st->step == TransferStep::PickSource)
                ? "Upload: select local source (Enter: file, s: folder, .: hidden, Esc: cancel)"
                : "Download: select local target folder (s: select, b: back, Esc: cancel)";
            renderBrowser(out, m_app.localBrowser(), title, false, QString());
        } else if (m_app.picker() == PickerKind::Remote) {
            const QString title = (st->step == TransferStep::PickSource)
                ? QString("Download: select source on %1 (Enter: file, s: folder, .: hidden, Esc: cancel)").arg(host)
                : QString("Upload: select target folder on %1 (s: select, b: back, Esc: cancel)").arg(host);
            renderBrowser(out, m_app.remoteBrowser(), title,
                          m_app.remoteBrowser().isLoading(), m_app.remoteBrowser().error());
        }
        return;
    }

    out << (upload ? "Upload" : "Download");
    out << QString("  From: %1%2").arg(st->sourcePath(), st->sourceIsDir ? "/" : "");
    out << QString("  To:   %1").arg(st->targetPath());

    if (st->step == TransferStep::Confirm) {
        out << QString("  Size: %1").arg(st->hasSize ? prettySize(st->sizeBytes) : QString("calculating..."));
        out << QString();
        out << "Enter/y: start  b: back  Esc: cancel";
        return;
    }

    out << "  " + formatTransferProgress(st->progressBytes, st->hasSize, st->sizeBytes);
    out << QString();
    out << "Esc: cancel  Enter: hide (p shows it again)";
}

void ConsoleUi::renderNotice(QStringList& out) const
{
    if (!m_app.hasNotice())
        return;

    const Notice& n = m_app.notice();
    out << QString();
    out << QString("== %1 ==").arg(n.title);
    out << n.message;
    out << (m_app.noticeAction() == NoticeAction::None
                ? "Enter/Esc: close  c: connect"
                : "Enter: connect and continue  Esc: close  c: connect");
}
