#pragma once

#include <QByteArray>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>

#include <memory>
#include <vector>

#include "ClientApp.h"
#include "FormState.h"
#include "KeyBindings.h"
#include "LocalBrowser.h"
#include "RemoteSession.h"
#include "TerminalIo.h"

class QSocketNotifier;
class QThread;
class SshShellWorker;

/*
    ConsoleUi
    ---------
    Line-oriented front end over ClientApp.

    - stdin is read raw through a QSocketNotifier and decoded into keys
    - keys are routed by commandFor() for the surface on top
    - a 150 ms timer drains worker channels and redraws when needed

    Terminal tabs each dial their own session and pump the shell from a
    dedicated QThread (SshShellWorker). While a tab is active its output
    goes to stdout untouched; Ctrl+G returns to the client.
*/
class ConsoleUi : public QObject
{
    Q_OBJECT
public:
    static constexpr int kTickMs = 150;
    static constexpr int kReplayBytes = 256 * 1024;

    ConsoleUi(ClientApp& app, QSharedPointer<SshBackend> backend, QObject* parent = nullptr);
    ~ConsoleUi() override;

    // Enters raw mode and starts the loop. False if stdin is not a tty.
    bool start();

    // Closes every terminal tab and restores the terminal.
    void shutdown();

signals:
    void quitRequested();

private slots:
    void onStdinReady();
    void onTick();

private:
    struct TerminalTab {
        int                            id = 0;
        QString                        title;
        std::unique_ptr<RemoteSession> session;
        QThread*                       thread = nullptr;
        SshShellWorker*                worker = nullptr;
        QByteArray                     replay;
    };

    UiMode currentMode() const;
    void handleKeys(const QVector<KeyEvent>& keys);
    void handleKey(const KeyEvent& ev);

    void handleNormal(Command c);
    void handleNotice(Command c);
    void handleConfirmDelete(Command c);
    void handleConnectionForm(Command c, const KeyEvent& ev);
    void handleMasterForm(Command c, const KeyEvent& ev);
    void handleKeyFilePicker(Command c);
    void handleKnownKeyPicker(Command c);
    void handleTransferPicker(Command c);
    void handleTransferConfirm(Command c);
    void handleTerminal(Command c, const KeyEvent& ev);

    void openTerminalTab();
    void closeTab(int tabIndex);
    void switchTo(int activeTab);
    void onShellOutput(int id, const QByteArray& data);
    void onShellClosed(int id, const QString& reason);
    int tabIndexForId(int id) const;

    void render();
    void renderHeader(QStringList& out) const;
    void renderProfiles(QStringList& out) const;
    void renderDetails(QStringList& out) const;
    void renderTabs(QStringList& out) const;
    void renderConnectionForm(QStringList& out) const;
    void renderMasterForm(QStringList& out) const;
    void renderBrowser(QStringList& out, const DirBrowser& b, const QString& title,
                       bool loading, const QString& error) const;
    void renderKnownKeys(QStringList& out) const;
    void renderTransfer(QStringList& out) const;
    void renderNotice(QStringList& out) const;

    ClientApp&                 m_app;
    QSharedPointer<SshBackend> m_backend;

    RawTerminal                m_raw;
    QSocketNotifier*           m_stdin = nullptr;
    QTimer                     m_timer;
    KeyDecoder                 m_decoder;
    bool                       m_dirty = true;

    // 0 = client view, i > 0 = m_tabs[i - 1]
    std::vector<std::unique_ptr<TerminalTab>> m_tabs;
    int                        m_activeTab = 0;
    int                        m_nextTabId = 1;

    bool                       m_formOpen = false;
    ConnectionForm             m_form;
    bool                       m_masterOpen = false;
    MasterForm                 m_master;
    bool                       m_confirmDelete = false;
    int                        m_deleteIndex = -1;

    bool                       m_keyFilePickerOpen = false;
    LocalBrowser               m_keyFiles;
    bool                       m_knownKeysOpen = false;
    QVector<KeyCandidate>      m_knownKeys;
    int                        m_knownKeyIndex = 0;
};
