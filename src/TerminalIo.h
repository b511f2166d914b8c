#pragma once

#include <QByteArray>
#include <QString>

#include <termios.h>

/*
    TerminalIo
    ----------
    Thin POSIX helpers for the console front end: raw mode while the
    client runs, echo-less line prompts for secrets before it starts,
    and unbuffered writes to stdout.
*/

// Puts a tty into raw mode for its lifetime.
class RawTerminal
{
public:
    explicit RawTerminal(int fd = 0);
    ~RawTerminal();

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    // False when `fd` is not a terminal or tcsetattr failed.
    bool enter();
    void restore();
    bool isActive() const { return m_active; }

private:
    int     m_fd;
    bool    m_active = false;
    termios m_saved {};
};

namespace TerminalIo {
    bool isTerminal(int fd = 0);

    // Columns/rows of the controlling terminal, 80x24 when unknown.
    void size(int* cols, int* rows);

    // Writes the whole buffer to stdout.
    bool writeOut(const QByteArray& data);

    // Canonical-mode prompt on stdin. `secret` disables echo.
    // Returns false on EOF or read error.
    bool promptLine(const QString& prompt, bool secret, QString* out);
}
