#include "TerminalIo.h"

#include <QDebug>

#include "CryptoBox.h"

#include <cerrno>
#include <cstring>
#include <sys/ioctl.h>
#include <unistd.h>

RawTerminal::RawTerminal(int fd)
    : m_fd(fd)
{
}

RawTerminal::~RawTerminal()
{
    restore();
}

bool RawTerminal::enter()
{
    if (m_active)
        return true;
    if (!::isatty(m_fd))
        return false;

    if (::tcgetattr(m_fd, &m_saved) != 0) {
        qWarning().noquote() << QString("tcgetattr failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }

    termios raw = m_saved;
    ::cfmakeraw(&raw);
    // keep output post-processing so "\n" still returns the carriage
    raw.c_oflag |= OPOST;
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;

    if (::tcsetattr(m_fd, TCSAFLUSH, &raw) != 0) {
        qWarning().noquote() << QString("tcsetattr failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }

    m_active = true;
    return true;
}

void RawTerminal::restore()
{
    if (!m_active)
        return;
    ::tcsetattr(m_fd, TCSAFLUSH, &m_saved);
    m_active = false;
}

namespace TerminalIo {

bool isTerminal(int fd)
{
    return ::isatty(fd) == 1;
}

void size(int* cols, int* rows)
{
    int c = 80;
    int r = 24;

    winsize ws {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        c = ws.ws_col;
        r = ws.ws_row;
    }

    if (cols) *cols = c;
    if (rows) *rows = r;
}

bool writeOut(const QByteArray& data)
{
    const char* p = data.constData();
    qint64 left = data.size();

    while (left > 0) {
        const ssize_t n = ::write(STDOUT_FILENO, p, static_cast<size_t>(left));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return false;
        }
        p += n;
        left -= n;
    }
    return true;
}

bool promptLine(const QString& prompt, bool secret, QString* out)
{
    writeOut(prompt.toUtf8());

    termios saved {};
    bool restoreEcho = false;
    if (secret && ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved) == 0) {
        termios noEcho = saved;
        noEcho.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        noEcho.c_lflag |= ICANON;
        restoreEcho = (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &noEcho) == 0);
    }

    QByteArray line;
    bool ok = false;
    for (;;) {
        char c = 0;
        const ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        if (c == '\n') {
            ok = true;
            break;
        }
        if (c != '\r')
            line.append(c);
    }

    if (restoreEcho) {
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
        writeOut("\n");
    }

    if (out)
        *out = QString::fromUtf8(line);

    CryptoBox::wipe(line);
    return ok || (out && !out->isEmpty());
}

} // namespace TerminalIo
