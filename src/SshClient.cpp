// SshClient.cpp
//
// Purpose:
//   SSH/SFTP layer for ss-ssh.
//   - Opens the TCP connection itself (per-address connect timeout) and
//     hands the socket to libssh
//   - Authenticates with a password or a private key (+ optional passphrase)
//   - Exposes the SFTP primitives the browsers and the transfer engine need
//   - Runs `pwd` and opens PTY shells over fresh channels
//
// Never log secrets (passwords, passphrases).

#include "SshClient.h"

#include <QFile>
#include <QFileInfo>
#include <QDebug>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "CryptoBox.h"
#include "RemoteOps.h"

// ------------------------------------------------------------
// Small helper to turn libssh's last error into QString
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

static QString errnoText(int e)
{
    return QString::fromLocal8Bit(std::strerror(e));
}

// Directory detection: attribute type first, permission bits as fallback.
static bool attrIsDir(sftp_attributes a)
{
    if (a->type == SSH_FILEXFER_TYPE_DIRECTORY)
        return true;
    if (a->type == SSH_FILEXFER_TYPE_REGULAR || a->type == SSH_FILEXFER_TYPE_SYMLINK)
        return false;
    return (a->permissions & S_IFMT) == S_IFDIR;
}

static bool attrIsLink(sftp_attributes a)
{
    if (a->type == SSH_FILEXFER_TYPE_SYMLINK)
        return true;
    return (a->permissions & S_IFMT) == S_IFLNK;
}

static RemoteStat toRemoteStat(sftp_attributes a, const QString& name)
{
    RemoteStat st;
    st.name   = name;
    st.size   = static_cast<quint64>(a->size);
    st.isDir  = attrIsDir(a);
    st.isLink = attrIsLink(a);
    return st;
}

// ------------------------------------------------------------
// TCP connect with a timeout, trying every resolved address in order.
// Returns a connected blocking socket with read/write timeouts, or -1.
// ------------------------------------------------------------
static int connectTcp(const QString& host, int port, int timeoutSec, QString* err)
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray portStr  = QByteArray::number(port);

    struct addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(hostUtf8.constData(), portStr.constData(), &hints, &res);
    if (gai != 0) {
        *err = QString("Cannot resolve '%1': %2").arg(host, QString::fromLocal8Bit(gai_strerror(gai)));
        return -1;
    }

    QString lastErr = QStringLiteral("no addresses");

    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErr = errnoText(errno);
            continue;
        }

        const int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            lastErr = errnoText(errno);
            ::close(fd);
            continue;
        }

        if (rc != 0) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            rc = ::poll(&pfd, 1, timeoutSec * 1000);
            if (rc == 0) {
                lastErr = QString("connect timed out after %1 s").arg(timeoutSec);
                ::close(fd);
                continue;
            }
            if (rc < 0) {
                lastErr = errnoText(errno);
                ::close(fd);
                continue;
            }

            int soErr = 0;
            socklen_t len = sizeof(soErr);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0 || soErr != 0) {
                lastErr = errnoText(soErr ? soErr : errno);
                ::close(fd);
                continue;
            }
        }

        ::fcntl(fd, F_SETFL, flags);

        struct timeval tv;
        tv.tv_sec = timeoutSec;
        tv.tv_usec = 0;
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        ::freeaddrinfo(res);
        return fd;
    }

    ::freeaddrinfo(res);
    *err = QString("Cannot connect to %1:%2: %3").arg(host).arg(port).arg(lastErr);
    return -1;
}

// ============================================================
// Remote file handle
// ============================================================
namespace {

class SftpFile : public RemoteFile
{
public:
    SftpFile(sftp_file file, ssh_session session, const QString& path)
        : m_file(file), m_session(session), m_path(path) {}

    ~SftpFile() override
    {
        if (m_file) sftp_close(m_file);
    }

    qint64 read(char* buf, qint64 maxLen, ClientError* err) override
    {
        const ssize_t n = sftp_read(m_file, buf, static_cast<size_t>(maxLen));
        if (n < 0) {
            failWith(err, ErrorKind::SftpFailure,
                     QString("Read failed on '%1': %2").arg(m_path, libsshError(m_session)));
            return -1;
        }
        return static_cast<qint64>(n);
    }

    bool writeAll(const char* buf, qint64 len, ClientError* err) override
    {
        qint64 done = 0;
        while (done < len) {
            const ssize_t w = sftp_write(m_file, buf + done, static_cast<size_t>(len - done));
            if (w <= 0)
                return failWith(err, ErrorKind::SftpFailure,
                                QString("Write failed on '%1': %2").arg(m_path, libsshError(m_session)));
            done += w;
        }
        return true;
    }

private:
    sftp_file   m_file    = nullptr;
    ssh_session m_session = nullptr;
    QString     m_path;
};

// ============================================================
// PTY shell channel
// ============================================================
class LibsshShell : public ShellChannel
{
public:
    LibsshShell(ssh_channel channel, ssh_session session)
        : m_channel(channel), m_session(session) {}

    ~LibsshShell() override { close(); }

    bool readAvailable(QByteArray* out, ClientError* err) override
    {
        out->clear();
        if (!m_channel)
            return true;

        char buf[4096];
        for (int isStderr = 0; isStderr <= 1; ++isStderr) {
            while (true) {
                const int n = ssh_channel_read_nonblocking(m_channel, buf, sizeof(buf), isStderr);
                if (n > 0) {
                    out->append(buf, n);
                    continue;
                }
                if (n == 0 || n == SSH_EOF)
                    break;
                return failWith(err, ErrorKind::SftpFailure,
                                QString("Shell read failed: %1").arg(libsshError(m_session)));
            }
        }
        return true;
    }

    bool write(const QByteArray& data, ClientError* err) override
    {
        if (!m_channel)
            return failWith(err, ErrorKind::InvalidState, "Shell is closed");

        int done = 0;
        while (done < data.size()) {
            const int w = ssh_channel_write(m_channel, data.constData() + done,
                                            static_cast<uint32_t>(data.size() - done));
            if (w == SSH_ERROR)
                return failWith(err, ErrorKind::SftpFailure,
                                QString("Shell write failed: %1").arg(libsshError(m_session)));
            done += w;
        }
        return true;
    }

    bool atEnd() const override
    {
        if (!m_channel)
            return true;
        return ssh_channel_is_eof(m_channel) || ssh_channel_is_closed(m_channel);
    }

    int exitStatus() const override
    {
        if (!m_channel)
            return m_exitStatus;
        return ssh_channel_get_exit_status(m_channel);
    }

    void close() override
    {
        if (!m_channel)
            return;

        // exit status is valid only once the remote side has closed
        m_exitStatus = ssh_channel_get_exit_status(m_channel);

        ssh_channel_send_eof(m_channel);
        ssh_channel_close(m_channel);
        ssh_channel_free(m_channel);
        m_channel = nullptr;
    }

private:
    ssh_channel m_channel    = nullptr;
    ssh_session m_session    = nullptr;
    int         m_exitStatus = -1;
};

} // namespace

// ============================================================
// SshClient
// ============================================================
SshClient::~SshClient()
{
    // Ensure we never leak sessions on shutdown.
    disconnect();
}

bool SshClient::connectProfile(const SshProfile& profile, ClientError* err)
{
    clearError(err);

    const QString host = profile.host.trimmed();
    const QString user = profile.user.trimmed();

    if (host.isEmpty())
        return failWith(err, ErrorKind::DialFailure, "No host specified.");
    if (user.isEmpty())
        return failWith(err, ErrorKind::DialFailure, "No user specified.");

    const bool usesKey = profile.auth.kind == AuthKind::PrivateKey;
    qInfo().noquote() << QString("[SSH] connect start user='%1' host='%2' auth=%3")
                         .arg(user, host, usesKey ? "key" : "password");

    // Always clean up any previous libssh session before reconnecting.
    disconnect();
    m_label = user + "@" + host;

    QString tcpErr;
    const int fd = connectTcp(host, kSshPort, kTimeoutSeconds, &tcpErr);
    if (fd < 0) {
        qWarning().noquote() << QString("[SSH] connect FAILED user='%1' host='%2': %3")
                                .arg(user, host, tcpErr);
        return failWith(err, ErrorKind::DialFailure, tcpErr);
    }

    ssh_session s = ssh_new();
    if (!s) {
        ::close(fd);
        return failWith(err, ErrorKind::DialFailure, "ssh_new() failed.");
    }

    auto failAndFree = [&](const QString& msg) -> bool {
        qWarning().noquote() << QString("[SSH] connect FAILED user='%1' host='%2': %3")
                                .arg(user, host, msg);
        ssh_disconnect(s);
        ssh_free(s);
        return failWith(err, ErrorKind::DialFailure, msg);
    };

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) -> bool {
        const int r = ssh_options_set(s, opt, val);
        if (r != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
            return false;
        }
        return true;
    };

    // The socket belongs to the session from here on; ssh_free() closes it.
    socket_t sock = fd;
    if (!optSet(SSH_OPTIONS_FD, &sock, "FD")) {
        ::close(fd);
        ssh_free(s);
        return failWith(err, ErrorKind::DialFailure, "Cannot attach socket to SSH session.");
    }

    long timeoutSec = kTimeoutSeconds;
    if (!optSet(SSH_OPTIONS_HOST, host.toUtf8().constData(), "HOST") ||
        !optSet(SSH_OPTIONS_USER, user.toUtf8().constData(), "USER") ||
        !optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT")) {
        return failAndFree(QString("Invalid SSH options: %1").arg(libsshError(s)));
    }

    int rc = ssh_connect(s);
    if (rc != SSH_OK)
        return failAndFree(QString("SSH handshake failed: %1").arg(libsshError(s)));

    qInfo().noquote() << QString("[SSH] handshake OK host='%1'").arg(host);

    if (usesKey) {
        const QString keyPath = RemoteOps::expandTilde(profile.auth.keyPath.trimmed());
        if (!QFileInfo::exists(keyPath))
            return failAndFree(QString("Private key not found at %1").arg(keyPath));

        QByteArray pass = profile.auth.secret.toUtf8();
        ssh_key key = nullptr;
        const int importRc = ssh_pki_import_privkey_file(QFile::encodeName(keyPath).constData(),
                                                         pass.isEmpty() ? nullptr : pass.constData(),
                                                         nullptr, nullptr, &key);
        CryptoBox::wipe(pass);

        if (importRc != SSH_OK || !key)
            return failAndFree(QString("Cannot load private key %1 (wrong passphrase?)").arg(keyPath));

        rc = ssh_userauth_publickey(s, nullptr, key);
        ssh_key_free(key);
    } else {
        QByteArray pw = profile.auth.secret.toUtf8();
        rc = ssh_userauth_password(s, nullptr, pw.constData());
        CryptoBox::wipe(pw);
    }

    if (rc != SSH_AUTH_SUCCESS)
        return failAndFree(QString("Authentication failed: %1").arg(libsshError(s)));

    // Success: keep session
    m_session = s;

    qInfo().noquote() << QString("[SSH] connect OK user='%1' host='%2'").arg(user, host);
    return true;
}

// ------------------------------------------------------------
// Disconnect and free session (safe to call multiple times).
// ------------------------------------------------------------
void SshClient::disconnect()
{
    if (m_sftp) {
        sftp_free(m_sftp);
        m_sftp = nullptr;
    }
    if (m_session) {
        qDebug().noquote() << QString("[SSH] disconnect %1").arg(m_label);
        ssh_disconnect(m_session);
        ssh_free(m_session);
        m_session = nullptr;
    }
}

bool SshClient::ensureSftp(ClientError* err)
{
    if (m_sftp)
        return true;
    if (!m_session)
        return failWith(err, ErrorKind::SftpFailure, "Not connected.");

    sftp_session sftp = sftp_new(m_session);
    if (!sftp)
        return failWith(err, ErrorKind::SftpFailure, "sftp_new failed: " + libsshError(m_session));

    if (sftp_init(sftp) != SSH_OK) {
        const QString e = libsshError(m_session);
        sftp_free(sftp);
        return failWith(err, ErrorKind::SftpFailure, "sftp_init failed: " + e);
    }

    m_sftp = sftp;
    return true;
}

QString SshClient::sftpError(const QString& what, const QString& path) const
{
    const int code = m_sftp ? sftp_get_error(m_sftp) : -1;
    return QString("%1 failed for '%2': %3 (sftp code %4)")
        .arg(what, path, libsshError(m_session))
        .arg(code);
}

// ------------------------------------------------------------
// SFTP: stream a directory (non-recursive).
// ------------------------------------------------------------
bool SshClient::forEachEntry(const QString& dir, const EntryVisitor& visit, ClientError* err)
{
    if (!ensureSftp(err))
        return false;

    sftp_dir d = sftp_opendir(m_sftp, dir.toUtf8().constData());
    if (!d)
        return failWith(err, ErrorKind::SftpFailure, sftpError("opendir", dir));

    bool stopped = false;
    while (!stopped) {
        sftp_attributes a = sftp_readdir(m_sftp, d);
        if (!a) break;

        const QString name = QString::fromUtf8(a->name ? a->name : "");
        if (name.isEmpty() || name == "." || name == "..") {
            sftp_attributes_free(a);
            continue;
        }

        const RemoteStat st = toRemoteStat(a, name);
        sftp_attributes_free(a);

        if (!visit(st))
            stopped = true;
    }

    const bool complete = stopped || sftp_dir_eof(d);
    QString readErr;
    if (!complete)
        readErr = sftpError("readdir", dir);

    sftp_closedir(d);

    if (!complete)
        return failWith(err, ErrorKind::SftpFailure, readErr);
    return true;
}

bool SshClient::statPath(const QString& path, RemoteStat* out, ClientError* err)
{
    if (!ensureSftp(err))
        return false;

    sftp_attributes a = sftp_stat(m_sftp, path.toUtf8().constData());
    if (!a)
        return failWith(err, ErrorKind::SftpFailure, sftpError("stat", path));

    *out = toRemoteStat(a, RemoteOps::remoteBaseName(path));
    sftp_attributes_free(a);
    return true;
}

bool SshClient::makeDir(const QString& path, bool* alreadyExists, ClientError* err)
{
    if (alreadyExists) *alreadyExists = false;
    if (!ensureSftp(err))
        return false;

    if (sftp_mkdir(m_sftp, path.toUtf8().constData(), 0755) == 0)
        return true;

    const QString mkdirErr = sftpError("mkdir", path);

    sftp_attributes a = sftp_stat(m_sftp, path.toUtf8().constData());
    if (a) {
        const bool isDir = attrIsDir(a);
        sftp_attributes_free(a);
        if (isDir) {
            if (alreadyExists) *alreadyExists = true;
            return true;
        }
    }

    return failWith(err, ErrorKind::SftpFailure, mkdirErr);
}

std::unique_ptr<RemoteFile> SshClient::openForRead(const QString& path, ClientError* err)
{
    if (!ensureSftp(err))
        return nullptr;

    sftp_file f = sftp_open(m_sftp, path.toUtf8().constData(), O_RDONLY, 0);
    if (!f) {
        failWith(err, ErrorKind::SftpFailure, sftpError("open", path));
        return nullptr;
    }
    return std::unique_ptr<RemoteFile>(new SftpFile(f, m_session, path));
}

std::unique_ptr<RemoteFile> SshClient::openForWrite(const QString& path, ClientError* err)
{
    if (!ensureSftp(err))
        return nullptr;

    sftp_file f = sftp_open(m_sftp, path.toUtf8().constData(),
                            O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!f) {
        failWith(err, ErrorKind::SftpFailure, sftpError("open", path));
        return nullptr;
    }
    return std::unique_ptr<RemoteFile>(new SftpFile(f, m_session, path));
}

// ------------------------------------------------------------
// Remote pwd helper (executes `pwd` over a fresh channel).
// ------------------------------------------------------------
bool SshClient::homeDir(QString* out, ClientError* err)
{
    if (!m_session)
        return failWith(err, ErrorKind::SftpFailure, "Not connected.");

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch)
        return failWith(err, ErrorKind::SftpFailure, "ssh_channel_new failed.");

    if (ssh_channel_open_session(ch) != SSH_OK) {
        const QString e = libsshError(m_session);
        ssh_channel_free(ch);
        return failWith(err, ErrorKind::SftpFailure, "ssh_channel_open_session failed: " + e);
    }

    if (ssh_channel_request_exec(ch, "pwd") != SSH_OK) {
        const QString e = libsshError(m_session);
        ssh_channel_close(ch);
        ssh_channel_free(ch);
        return failWith(err, ErrorKind::SftpFailure, "ssh_channel_request_exec(pwd) failed: " + e);
    }

    QByteArray buf;
    char tmp[256];
    int n = 0;
    while ((n = ssh_channel_read(ch, tmp, sizeof(tmp), 0)) > 0)
        buf.append(tmp, n);

    const bool readFailed = (n == SSH_ERROR);
    const QString readErr = readFailed ? libsshError(m_session) : QString();

    ssh_channel_send_eof(ch);
    ssh_channel_close(ch);
    ssh_channel_free(ch);

    if (readFailed)
        return failWith(err, ErrorKind::SftpFailure, "Reading pwd output failed: " + readErr);

    const QString pwd = QString::fromUtf8(buf).trimmed();
    if (pwd.isEmpty())
        return failWith(err, ErrorKind::SftpFailure, "Remote 'pwd' returned empty.");

    *out = pwd;
    return true;
}

// ------------------------------------------------------------
// PTY-backed interactive shell
// ------------------------------------------------------------
std::unique_ptr<ShellChannel> SshClient::openShell(int cols, int rows, ClientError* err)
{
    if (!m_session) {
        failWith(err, ErrorKind::SftpFailure, "Not connected.");
        return nullptr;
    }

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        failWith(err, ErrorKind::SftpFailure, "Failed to create channel");
        return nullptr;
    }

    // 1) Session channel
    if (ssh_channel_open_session(ch) != SSH_OK) {
        failWith(err, ErrorKind::SftpFailure, "ssh_channel_open_session failed: " + libsshError(m_session));
        ssh_channel_free(ch);
        return nullptr;
    }

    // 2) Request PTY
    if (ssh_channel_request_pty_size(ch, "xterm-256color", cols, rows) != SSH_OK) {
        failWith(err, ErrorKind::SftpFailure, "PTY request failed: " + libsshError(m_session));
        ssh_channel_close(ch);
        ssh_channel_free(ch);
        return nullptr;
    }

    // 3) Request interactive shell
    if (ssh_channel_request_shell(ch) != SSH_OK) {
        failWith(err, ErrorKind::SftpFailure, "Shell request failed: " + libsshError(m_session));
        ssh_channel_close(ch);
        ssh_channel_free(ch);
        return nullptr;
    }

    qInfo().noquote() << QString("[SSH] shell opened on %1 (%2x%3)").arg(m_label).arg(cols).arg(rows);
    return std::unique_ptr<ShellChannel>(new LibsshShell(ch, m_session));
}

// ============================================================
// LibsshBackend
// ============================================================
std::unique_ptr<RemoteSession> LibsshBackend::dial(const SshProfile& profile, ClientError* err)
{
    std::unique_ptr<SshClient> client(new SshClient());
    if (!client->connectProfile(profile, err))
        return nullptr;
    return std::unique_ptr<RemoteSession>(client.release());
}
