// TransferEngine.cpp
//
// Selection state machine + background copy worker.
//
// Worker side (QtConcurrent pool thread):
//   dial fresh session -> uploadPath/downloadPath -> drop session -> Done
//
// Foreground side (tick):
//   poll() drains Progress into progressBytes (saturating), logs every
//   1 MiB, and on Done clears the state and raises a notice.

#include "TransferEngine.h"

#include <QDebug>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>

// -----------------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------------
QString prettySize(quint64 bytes)
{
    const double b = (double)bytes;
    if (b < 1024.0) return QString("%1 B").arg(bytes);
    if (b < 1024.0 * 1024.0) return QString::number(b / 1024.0, 'f', 1) + " KB";
    if (b < 1024.0 * 1024.0 * 1024.0) return QString::number(b / (1024.0 * 1024.0), 'f', 1) + " MB";
    return QString::number(b / (1024.0 * 1024.0 * 1024.0), 'f', 1) + " GB";
}

QString formatTransferProgress(quint64 done, bool hasTotal, quint64 total)
{
    if (!hasTotal || total == 0)
        return QString("Transfer progress: %1").arg(prettySize(done));

    const double ratio = std::min(1.0, (double)done / (double)total);
    const int pct = static_cast<int>(ratio * 100.0);
    return QString("Transfer progress: %1% (%2 of %3)")
        .arg(pct)
        .arg(prettySize(done), prettySize(total));
}

static QString directionName(TransferDirection d)
{
    return d == TransferDirection::Upload ? QStringLiteral("Upload") : QStringLiteral("Download");
}

static QString stepName(TransferStep s)
{
    switch (s) {
        case TransferStep::PickSource:   return "PickSource";
        case TransferStep::PickTarget:   return "PickTarget";
        case TransferStep::Confirm:      return "Confirm";
        case TransferStep::Transferring: return "Transferring";
    }
    return "?";
}

// -----------------------------------------------------------------------------
// Worker entry point. Owns clones only; talks back through `progress`.
// Done is always the last message.
// -----------------------------------------------------------------------------
static void runTransfer(QSharedPointer<SshBackend> backend,
                        SshProfile profile,
                        TransferState st,
                        ProgressPtr progress,
                        CancelPtr cancel)
{
    ClientError err;
    bool ok = false;

    std::unique_ptr<RemoteSession> session = backend->dial(profile, &err);
    if (session) {
        if (st.direction == TransferDirection::Upload) {
            ok = RemoteOps::uploadPath(*session, st.sourceLocal, st.targetRemote,
                                       st.sourceIsDir, progress, cancel, &err);
        } else {
            ok = RemoteOps::downloadPath(*session, st.sourceRemote, st.targetLocal,
                                         st.sourceIsDir, progress, cancel, &err);
        }
    }
    session.reset();

    progress->send(TransferUpdate::done(ok, ok ? ClientError() : err));
}

// =============================================================================
// TransferEngine
// =============================================================================
TransferEngine::TransferEngine(QSharedPointer<SshBackend> backend)
    : m_backend(std::move(backend))
{
}

TransferEngine::~TransferEngine()
{
    if (m_cancel)
        m_cancel->send(true);
    waitForWorkers();
}

void TransferEngine::waitForWorkers()
{
    for (QFuture<void>& f : m_workers)
        f.waitForFinished();
    m_workers.clear();
}

// Superseded size workers are still waited on at shutdown.
void TransferEngine::track(const QFuture<void>& future)
{
    for (int i = m_workers.size() - 1; i >= 0; --i) {
        if (m_workers.at(i).isFinished())
            m_workers.removeAt(i);
    }
    m_workers.append(future);
}

bool TransferEngine::requireStep(TransferStep step, const char* what, ClientError* err) const
{
    if (!m_state)
        return failWith(err, ErrorKind::InvalidState,
                        QString("%1: no transfer in progress").arg(QString::fromLatin1(what)));
    if (m_state->step != step)
        return failWith(err, ErrorKind::InvalidState,
                        QString("%1 is not allowed in step %2")
                            .arg(QString::fromLatin1(what), stepName(m_state->step)));
    return true;
}

bool TransferEngine::start(TransferDirection direction, ClientError* err)
{
    clearError(err);

    if (isTransferring())
        return failWith(err, ErrorKind::InvalidState, "A transfer is already running");

    m_state.reset(new TransferState());
    m_state->direction = direction;
    m_state->step = TransferStep::PickSource;
    m_hidden = false;
    ++m_sizeGeneration;

    qDebug().noquote() << QString("[TRANSFER] %1: pick source").arg(directionName(direction));
    return true;
}

bool TransferEngine::startUpload(ClientError* err)
{
    return start(TransferDirection::Upload, err);
}

bool TransferEngine::startDownload(ClientError* err)
{
    return start(TransferDirection::Download, err);
}

// -----------------------------------------------------------------------------
// Source / target selection
// -----------------------------------------------------------------------------
bool TransferEngine::selectSourceLocal(const QString& path, bool isDir, ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::PickSource, "Select local source", err))
        return false;
    if (m_state->direction != TransferDirection::Upload)
        return failWith(err, ErrorKind::InvalidState, "Download source must be remote");
    if (path.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing source");

    m_state->sourceLocal = path;
    m_state->sourceIsDir = isDir;
    m_state->step = TransferStep::PickTarget;
    return true;
}

bool TransferEngine::selectSourceRemote(const QString& path, bool isDir, ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::PickSource, "Select remote source", err))
        return false;
    if (m_state->direction != TransferDirection::Download)
        return failWith(err, ErrorKind::InvalidState, "Upload source must be local");
    if (path.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing source");

    m_state->sourceRemote = path;
    m_state->sourceIsDir = isDir;
    m_state->step = TransferStep::PickTarget;
    return true;
}

bool TransferEngine::selectTargetRemote(const QString& dir, ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::PickTarget, "Select remote target", err))
        return false;
    if (m_state->direction != TransferDirection::Upload)
        return failWith(err, ErrorKind::InvalidState, "Download target must be local");
    if (dir.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing target");

    m_state->targetRemote = dir;
    m_state->step = TransferStep::Confirm;
    computeLocalSize();
    return true;
}

bool TransferEngine::selectTargetLocal(const QString& dir, const SshProfile& profile, ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::PickTarget, "Select local target", err))
        return false;
    if (m_state->direction != TransferDirection::Download)
        return failWith(err, ErrorKind::InvalidState, "Upload target must be remote");
    if (dir.isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Missing target");

    m_state->targetLocal = dir;
    m_state->step = TransferStep::Confirm;
    computeRemoteSize(profile);
    return true;
}

bool TransferEngine::back(ClientError* err)
{
    clearError(err);
    if (!m_state)
        return failWith(err, ErrorKind::InvalidState, "Back: no transfer in progress");

    switch (m_state->step) {
        case TransferStep::PickTarget:
            m_state->step = TransferStep::PickSource;
            return true;
        case TransferStep::Confirm:
            m_state->step = TransferStep::PickTarget;
            m_state->hasSize = false;
            m_state->sizeBytes = 0;
            ++m_sizeGeneration;
            return true;
        default:
            return failWith(err, ErrorKind::InvalidState,
                            QString("Back is not allowed in step %1").arg(stepName(m_state->step)));
    }
}

// -----------------------------------------------------------------------------
// Size pre-computation (advisory)
// -----------------------------------------------------------------------------
void TransferEngine::computeLocalSize()
{
    ++m_sizeGeneration;

    quint64 bytes = 0;
    ClientError err;
    if (RemoteOps::localSize(m_state->sourceLocal, m_state->sourceIsDir, &bytes, &err)) {
        m_state->hasSize = true;
        m_state->sizeBytes = bytes;
    } else {
        qWarning().noquote() << QString("[TRANSFER] size of %1 unavailable: %2")
                                .arg(m_state->sourceLocal, err.message);
    }
}

void TransferEngine::computeRemoteSize(const SshProfile& profile)
{
    const quint64 generation = ++m_sizeGeneration;
    m_state->hasSize = false;
    m_state->sizeBytes = 0;

    OneShotPtr<SizeResult> result(new OneShot<SizeResult>());
    m_sizeResult = result;

    QSharedPointer<SshBackend> backend = m_backend;
    const QString path = m_state->sourceRemote;
    const bool isDir = m_state->sourceIsDir;

    track(QtConcurrent::run([backend, profile, path, isDir, generation, result]() {
        SizeResult r;
        r.generation = generation;

        ClientError err;
        std::unique_ptr<RemoteSession> session = backend->dial(profile, &err);
        if (session)
            r.ok = RemoteOps::remoteSize(*session, path, isDir, &r.bytes, &err);
        if (!r.ok)
            r.error = err.message;

        result->send(r);
    }));
}

// -----------------------------------------------------------------------------
// Confirm / cancel / abort
// -----------------------------------------------------------------------------
bool TransferEngine::confirm(const SshProfile& profile, ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::Confirm, "Confirm", err))
        return false;
    if (m_state->targetPath().isEmpty())
        return failWith(err, ErrorKind::InvalidState, "Confirm: no target selected");

    m_state->step = TransferStep::Transferring;
    m_state->progressBytes = 0;
    m_loggedBytes = 0;
    m_updates = 0;
    m_lastError = ClientError();

    m_progress = ProgressPtr(new ProgressChannel());
    m_cancel = CancelPtr(new CancelSignal());

    qInfo().noquote() << QString("[TRANSFER] %1 started: %2 -> %3")
                         .arg(directionName(m_state->direction),
                              m_state->sourcePath(),
                              m_state->targetPath());

    track(QtConcurrent::run(runTransfer, m_backend, profile, *m_state, m_progress, m_cancel));
    return true;
}

bool TransferEngine::cancel(ClientError* err)
{
    clearError(err);
    if (!requireStep(TransferStep::Transferring, "Cancel", err))
        return false;

    if (m_cancel && m_cancel->send(true))
        qInfo().noquote() << "[TRANSFER] cancel requested";
    return true;
}

bool TransferEngine::abort(ClientError* err)
{
    clearError(err);
    if (!m_state)
        return true;
    if (m_state->step == TransferStep::Transferring)
        return failWith(err, ErrorKind::InvalidState, "Transfer is running; cancel it instead");

    m_state.reset();
    m_hidden = false;
    ++m_sizeGeneration;
    m_sizeResult.reset();
    return true;
}

// -----------------------------------------------------------------------------
// Tick
// -----------------------------------------------------------------------------
bool TransferEngine::poll()
{
    bool changed = false;

    if (m_sizeResult) {
        SizeResult r;
        if (m_sizeResult->tryTake(&r)) {
            m_sizeResult.reset();
            if (m_state && r.generation == m_sizeGeneration) {
                if (r.ok) {
                    m_state->hasSize = true;
                    m_state->sizeBytes = r.bytes;
                    changed = true;
                } else {
                    qWarning().noquote() << QString("[TRANSFER] remote size unavailable: %1").arg(r.error);
                }
            }
        }
    }

    if (m_progress) {
        TransferUpdate u;
        while (m_progress && m_progress->tryReceive(&u)) {
            changed = true;
            if (u.kind == TransferUpdate::Kind::Progress)
                applyProgress(u.bytes);
            else
                finish(u);
        }
    }

    return changed;
}

void TransferEngine::applyProgress(quint64 bytes)
{
    if (!m_state)
        return;

    m_state->progressBytes = RemoteOps::saturatingAdd(m_state->progressBytes, bytes);
    ++m_updates;

    if (m_state->progressBytes - m_loggedBytes >= kProgressLogBytes) {
        m_loggedBytes = m_state->progressBytes;
        qInfo().noquote() << formatTransferProgress(m_state->progressBytes,
                                                    m_state->hasSize,
                                                    m_state->sizeBytes);
    }
}

void TransferEngine::finish(const TransferUpdate& done)
{
    const quint64 total = m_state ? m_state->progressBytes : 0;
    m_lastBytes = total;
    m_lastUpdates = m_updates;

    if (done.ok) {
        m_lastError = ClientError();
        qInfo().noquote() << QString("[TRANSFER] OK (%1)").arg(prettySize(total));
        setNotice("Transfer complete", "Transfer finished successfully");
    } else {
        m_lastError = done.error;
        const QString msg = done.error.message.trimmed().isEmpty()
            ? QStringLiteral("Transfer failed or cancelled.")
            : done.error.message.trimmed();
        qWarning().noquote() << QString("[TRANSFER] FAILED: %1").arg(msg);
        setNotice("Transfer failed", msg);
    }

    m_state.reset();
    m_progress.reset();
    m_cancel.reset();
    m_hidden = false;
    m_loggedBytes = 0;
}

void TransferEngine::setNotice(const QString& title, const QString& message)
{
    m_notice.title = title;
    m_notice.message = message;
    m_hasNotice = true;
}

bool TransferEngine::takeNotice(Notice* out)
{
    if (!m_hasNotice)
        return false;
    *out = m_notice;
    m_hasNotice = false;
    return true;
}
