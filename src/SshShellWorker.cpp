#include "SshShellWorker.h"
#include <QDebug>
#include <QMutexLocker>
#include <QThread>

/*
 * SshShellWorker
 * --------------
 * Background worker that mirrors an interactive shell channel.
 *
 * Keeps ALL blocking SSH I/O off the console thread. The worker is moved
 * to its own QThread; output travels back through outputReady().
 */

SshShellWorker::SshShellWorker(std::unique_ptr<ShellChannel> channel,
                               QObject *parent)
    : QObject(parent)
    , m_channel(std::move(channel))
{
}

SshShellWorker::~SshShellWorker()
{
    if (m_channel)
        m_channel->close();
}

// ===========================================================================
// Shell lifecycle
// ===========================================================================

/*
 * startShell
 * ----------
 * Entry point executed inside the worker thread.
 *
 *  - Flush queued keystrokes
 *  - Read whatever the remote produced (non-blocking)
 *  - Stop on remote EOF / close, I/O error or stopShell()
 */
void SshShellWorker::startShell()
{
    if (!m_channel) {
        emit shellClosed(QStringLiteral("Failed to open PTY shell"));
        return;
    }

    m_running.storeRelaxed(true);

    QString failure;
    while (!m_stopRequested.loadRelaxed()) {

        const QByteArray input = takePendingInput();
        if (!input.isEmpty()) {
            ClientError err;
            if (!m_channel->write(input, &err)) {
                failure = err.message;
                break;
            }
        }

        QByteArray chunk;
        ClientError err;
        if (!m_channel->readAvailable(&chunk, &err)) {
            failure = err.message;
            break;
        }
        if (!chunk.isEmpty())
            emit outputReady(chunk);

        // Remote side closed the channel or sent EOF
        if (m_channel->atEnd()) {
            qDebug() << "[SshShellWorker] channel EOF or closed";
            break;
        }

        // Small sleep to avoid busy-spinning
        QThread::msleep(5);
    }

    // -----------------------------------------------------------------------
    // Cleanup + exit reporting
    // -----------------------------------------------------------------------
    m_channel->close();
    const int exitStatus = m_channel->exitStatus();
    m_running.storeRelaxed(false);

    QString reason;
    if (!failure.isEmpty()) {
        reason = failure;
    } else if (exitStatus < 0) {
        reason = QStringLiteral("Shell terminated");
    } else if (exitStatus == 0) {
        reason = QStringLiteral("Shell exited normally");
    } else {
        reason = QString("Shell exited with status %1").arg(exitStatus);
    }

    qInfo().noquote() << QString("[SSH] shell closed: %1").arg(reason);
    emit shellClosed(reason);
}

void SshShellWorker::stopShell()
{
    m_stopRequested.storeRelaxed(true);
}

// ===========================================================================
// Input handling
// ===========================================================================

void SshShellWorker::sendInput(const QByteArray &data)
{
    if (data.isEmpty())
        return;

    QMutexLocker lock(&m_inputMutex);
    m_pendingInput.append(data);
}

QByteArray SshShellWorker::takePendingInput()
{
    QMutexLocker lock(&m_inputMutex);
    QByteArray out;
    out.swap(m_pendingInput);
    return out;
}
