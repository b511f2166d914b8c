#pragma once

#include <QObject>
#include <QAtomicInteger>
#include <QByteArray>
#include <QMutex>

#include <memory>

#include "RemoteSession.h"

/**
 * SshShellWorker
 *
 * Purpose:
 *  Pumps bytes between an open PTY shell channel and the console.
 *
 * Design:
 *  - This object is meant to live in its own QThread
 *  - It does NOT open the channel; the caller passes in one from
 *    RemoteSession::openShell()
 *  - The session behind the channel must outlive this worker and must not
 *    be used by another thread while the loop runs
 *
 * Threading model:
 *  - startShell() runs a polling loop until EOF or stopShell()
 *  - sendInput() may be called from any thread; bytes are written by the
 *    loop on its next pass
 */
class SshShellWorker : public QObject
{
    Q_OBJECT
public:
    explicit SshShellWorker(std::unique_ptr<ShellChannel> channel,
                            QObject *parent = nullptr);
    ~SshShellWorker() override;

    bool isRunning() const { return m_running.loadRelaxed(); }

public slots:
    /**
     * Enters the read loop. Blocks until the shell exits or stopShell()
     * is called, then closes the channel and emits shellClosed().
     */
    void startShell();

    /**
     * Signals the worker loop to exit gracefully.
     * Safe to call from another thread.
     */
    void stopShell();

    /**
     * Queues raw keystroke bytes for the remote shell.
     */
    void sendInput(const QByteArray &data);

signals:
    void outputReady(const QByteArray &data);

    /**
     * @param reason Human-readable reason (normal exit, error, etc.)
     */
    void shellClosed(const QString &reason);

private:
    QByteArray takePendingInput();

    std::unique_ptr<ShellChannel> m_channel;

    QMutex                m_inputMutex;
    QByteArray            m_pendingInput;

    QAtomicInteger<bool>  m_running { false };
    QAtomicInteger<bool>  m_stopRequested { false };
};
