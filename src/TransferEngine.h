#pragma once

#include <QFuture>
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QtGlobal>

#include <memory>

#include "Channel.h"
#include "ClientError.h"
#include "RemoteOps.h"
#include "RemoteSession.h"
#include "SshProfile.h"

enum class TransferDirection {
    Upload,
    Download
};

enum class TransferStep {
    PickSource,
    PickTarget,
    Confirm,
    Transferring
};

/*
    One in-flight copy.

    Upload:   sourceLocal  -> targetRemote
    Download: sourceRemote -> targetLocal

    Going back keeps earlier choices until they are overwritten, so the
    browsers can reopen where the user was.
*/
struct TransferState {
    TransferDirection direction = TransferDirection::Upload;
    TransferStep      step      = TransferStep::PickSource;

    QString sourceLocal;
    QString sourceRemote;
    bool    sourceIsDir = false;

    QString targetRemote;
    QString targetLocal;

    bool    hasSize       = false;   // advisory, may never arrive
    quint64 sizeBytes     = 0;
    quint64 progressBytes = 0;

    QString sourcePath() const { return direction == TransferDirection::Upload ? sourceLocal : sourceRemote; }
    QString targetPath() const { return direction == TransferDirection::Upload ? targetRemote : targetLocal; }
};

// Modal message for the front end.
struct Notice {
    QString title;
    QString message;
};

// "1.5 MB" style, for display only.
QString prettySize(quint64 bytes);

// "Transfer progress: 42% (1.5 MB of 3.0 MB)" or "Transfer progress: 1.5 MB"
// when the total is unknown.
QString formatTransferProgress(quint64 done, bool hasTotal, quint64 total);

/*
    TransferEngine
    --------------
    Source/target selection state machine plus the worker protocol:

      confirm()  -> worker dials a fresh session, copies, streams
                    Progress(n)... Done(result) on the progress channel
      cancel()   -> one-shot, observed at the next chunk boundary
      poll()     -> drains channels on each tick (never blocks)

    Only one transfer exists at a time. Commands issued in the wrong step
    fail with InvalidState and leave the state untouched.
*/
class TransferEngine
{
public:
    static constexpr quint64 kProgressLogBytes = 1024 * 1024;

    explicit TransferEngine(QSharedPointer<SshBackend> backend);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    bool isActive() const { return m_state != nullptr; }
    bool isTransferring() const { return m_state && m_state->step == TransferStep::Transferring; }

    // nullptr when idle
    const TransferState* state() const { return m_state.get(); }

    bool startUpload(ClientError* err = nullptr);
    bool startDownload(ClientError* err = nullptr);

    // PickSource -> PickTarget
    bool selectSourceLocal(const QString& path, bool isDir, ClientError* err = nullptr);
    bool selectSourceRemote(const QString& path, bool isDir, ClientError* err = nullptr);

    // PickTarget -> Confirm, starts the size computation.
    bool selectTargetRemote(const QString& dir, ClientError* err = nullptr);
    bool selectTargetLocal(const QString& dir, const SshProfile& profile, ClientError* err = nullptr);

    // PickTarget -> PickSource, Confirm -> PickTarget
    bool back(ClientError* err = nullptr);

    // Confirm -> Transferring
    bool confirm(const SshProfile& profile, ClientError* err = nullptr);

    // Transferring only. The worker answers with Done(Cancelled).
    bool cancel(ClientError* err = nullptr);

    // Drops a transfer that has not started yet.
    bool abort(ClientError* err = nullptr);

    // Hides/shows the progress modal; the worker is unaffected.
    void setHidden(bool hidden) { m_hidden = hidden; }
    bool isHidden() const { return m_hidden; }

    // Drains the size and progress channels. Returns true if anything changed.
    bool poll();

    bool takeNotice(Notice* out);

    // Result of the last finished transfer.
    const ClientError& lastError() const { return m_lastError; }

    // Bytes and Progress updates counted before the last Done.
    quint64 lastTransferredBytes() const { return m_lastBytes; }
    int lastProgressUpdates() const { return m_lastUpdates; }

    // Blocks until background workers have returned. Shutdown and tests only.
    void waitForWorkers();

private:
    struct SizeResult {
        quint64 generation = 0;
        bool    ok         = false;
        quint64 bytes      = 0;
        QString error;
    };

    bool start(TransferDirection direction, ClientError* err);
    bool requireStep(TransferStep step, const char* what, ClientError* err) const;
    void computeLocalSize();
    void computeRemoteSize(const SshProfile& profile);
    void applyProgress(quint64 bytes);
    void finish(const TransferUpdate& done);
    void track(const QFuture<void>& future);
    void setNotice(const QString& title, const QString& message);

    QSharedPointer<SshBackend>     m_backend;
    std::unique_ptr<TransferState> m_state;
    bool                           m_hidden = false;

    ProgressPtr                    m_progress;
    CancelPtr                      m_cancel;
    quint64                        m_loggedBytes = 0;
    int                            m_updates = 0;

    quint64                        m_sizeGeneration = 0;
    OneShotPtr<SizeResult>         m_sizeResult;
    QList<QFuture<void>>           m_workers;

    bool                           m_hasNotice = false;
    Notice                         m_notice;
    ClientError                    m_lastError;
    quint64                        m_lastBytes = 0;
    int                            m_lastUpdates = 0;
};
