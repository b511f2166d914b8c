#include "KeyBindings.h"

#include <QString>

static const char kEsc = 0x1b;

static KeyEvent makeKey(Key k, const QByteArray& raw)
{
    KeyEvent ev;
    ev.key = k;
    ev.raw = raw;
    return ev;
}

// Length of a complete escape sequence at `pos`, 0 if incomplete, -1 if
// not a sequence we know (the ESC is then reported on its own).
static int escapeLength(const QByteArray& b, int pos, Key* key)
{
    const int avail = b.size() - pos;
    if (avail < 2)
        return 0;

    const char intro = b.at(pos + 1);

    // SS3: ESC O P/Q/R/S, ESC O A..D
    if (intro == 'O') {
        if (avail < 3)
            return 0;
        switch (b.at(pos + 2)) {
            case 'A': *key = Key::Up;    return 3;
            case 'B': *key = Key::Down;  return 3;
            case 'C': *key = Key::Right; return 3;
            case 'D': *key = Key::Left;  return 3;
            case 'Q': *key = Key::F2;    return 3;
            case 'R': *key = Key::F3;    return 3;
            default:  *key = Key::Other; return 3;
        }
    }

    if (intro != '[')
        return -1;

    // CSI: parameters, then one final byte in 0x40..0x7e
    int i = pos + 2;
    while (i < b.size()) {
        const char c = b.at(i);
        if (c >= 0x40 && c <= 0x7e)
            break;
        ++i;
    }
    if (i >= b.size())
        return 0;

    const char final = b.at(i);
    const QByteArray params = b.mid(pos + 2, i - pos - 2);
    const int len = i - pos + 1;

    switch (final) {
        case 'A': *key = Key::Up;      return len;
        case 'B': *key = Key::Down;    return len;
        case 'C': *key = Key::Right;   return len;
        case 'D': *key = Key::Left;    return len;
        case 'Z': *key = Key::BackTab; return len;
        case 'Q': *key = Key::F2;      return len;   // CSI 1;2Q style
        case 'R': *key = Key::F3;      return len;
        case '~':
            if (params == "12")      *key = Key::F2;
            else if (params == "13") *key = Key::F3;
            else if (params == "17") *key = Key::F6;
            else if (params == "18") *key = Key::F7;
            else if (params == "19") *key = Key::F8;
            else                     *key = Key::Other;
            return len;
        default:
            *key = Key::Other;
            return len;
    }
}

// Byte count of the UTF-8 sequence starting with `lead`.
static int utf8Length(unsigned char lead)
{
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

QVector<KeyEvent> KeyDecoder::feed(const QByteArray& bytes)
{
    m_pending.append(bytes);

    QVector<KeyEvent> out;
    int pos = 0;
    const QByteArray& b = m_pending;

    while (pos < b.size()) {
        const unsigned char c = static_cast<unsigned char>(b.at(pos));

        if (c == static_cast<unsigned char>(kEsc)) {
            Key k = Key::Other;
            const int n = escapeLength(b, pos, &k);
            if (n == 0)
                break;   // wait for the rest, or flush()
            if (n < 0) {
                out.push_back(makeKey(Key::Escape, b.mid(pos, 1)));
                ++pos;
                continue;
            }
            out.push_back(makeKey(k, b.mid(pos, n)));
            pos += n;
            continue;
        }

        if (c == '\r' || c == '\n') {
            out.push_back(makeKey(Key::Enter, b.mid(pos, 1)));
            ++pos;
            continue;
        }
        if (c == 0x7f || c == 0x08) {
            out.push_back(makeKey(Key::Backspace, b.mid(pos, 1)));
            ++pos;
            continue;
        }
        if (c == '\t') {
            out.push_back(makeKey(Key::Tab, b.mid(pos, 1)));
            ++pos;
            continue;
        }
        if (c == 0x07) {
            out.push_back(makeKey(Key::CtrlG, b.mid(pos, 1)));
            ++pos;
            continue;
        }
        if (c < 0x20) {
            out.push_back(makeKey(Key::Other, b.mid(pos, 1)));
            ++pos;
            continue;
        }

        const int n = utf8Length(c);
        if (pos + n > b.size())
            break;

        const QByteArray raw = b.mid(pos, n);
        const QString s = QString::fromUtf8(raw);
        KeyEvent ev = makeKey(Key::Char, raw);
        ev.ch = s.isEmpty() ? QChar() : s.at(0);
        out.push_back(ev);
        pos += n;
    }

    m_pending.remove(0, pos);
    return out;
}

QVector<KeyEvent> KeyDecoder::flush()
{
    QVector<KeyEvent> out;
    if (m_pending.isEmpty())
        return out;

    // Whatever is left is a prefix that never completed.
    if (m_pending.at(0) == kEsc) {
        out.push_back(makeKey(Key::Escape, m_pending.left(1)));
        const QByteArray rest = m_pending.mid(1);
        m_pending.clear();
        out += feed(rest);
        m_pending.clear();
        return out;
    }

    out.push_back(makeKey(Key::Other, m_pending));
    m_pending.clear();
    return out;
}

// =============================================================================
// Routing
// =============================================================================
static Command tabCommand(const KeyEvent& ev)
{
    switch (ev.key) {
        case Key::F6: return Command::PreviousTab;
        case Key::F7: return Command::NextTab;
        case Key::F8: return Command::CloseTab;
        default:      return Command::None;
    }
}

static Command normalCommand(const KeyEvent& ev)
{
    const Command tab = tabCommand(ev);
    if (tab != Command::None)
        return tab;

    switch (ev.key) {
        case Key::Up:
        case Key::BackTab:
            return Command::SelectPrevious;
        case Key::Down:
        case Key::Tab:
            return Command::SelectNext;
        case Key::Left:
            return Command::HistoryPrevious;
        case Key::Right:
            return Command::HistoryNext;
        case Key::Char:
            break;
        default:
            return Command::None;
    }

    switch (ev.ch.toLatin1()) {
        case 'q': return Command::Quit;
        case 'n': return Command::NewProfile;
        case 'e': return Command::EditProfile;
        case 'c': return Command::ToggleConnect;
        case 't': return Command::OpenTerminal;
        case 'u': return Command::Upload;
        case 'd': return Command::Download;
        case 'o': return Command::ChangeMaster;
        case 'x': return Command::DeleteProfile;
        case 'v': return Command::CycleHeader;
        case 'p': return Command::ShowTransfer;
        default:  return Command::None;
    }
}

Command commandFor(UiMode mode, const KeyEvent& ev)
{
    switch (mode) {
        case UiMode::Normal:
            return normalCommand(ev);

        case UiMode::Notice:
            if (ev.key == Key::Enter)  return Command::AcceptNotice;
            if (ev.key == Key::Escape) return Command::DismissNotice;
            if (ev.isChar('c'))        return Command::ConnectFromNotice;
            return Command::None;

        case UiMode::ConfirmDelete:
            if (ev.key == Key::Enter || ev.isChar('y'))  return Command::ConfirmYes;
            if (ev.key == Key::Escape || ev.isChar('n')) return Command::ConfirmNo;
            return Command::None;

        case UiMode::Form:
            switch (ev.key) {
                case Key::Escape:    return Command::FormCancel;
                case Key::Tab:
                case Key::Down:      return Command::FieldNext;
                case Key::BackTab:
                case Key::Up:        return Command::FieldPrevious;
                case Key::Left:      return Command::OptionPrevious;
                case Key::Right:     return Command::OptionNext;
                case Key::Backspace: return Command::FieldBackspace;
                case Key::Enter:     return Command::FormSubmit;
                case Key::F2:        return Command::OpenKeyFilePicker;
                case Key::F3:        return Command::OpenKnownKeyPicker;
                case Key::Char:      return Command::FieldInsert;
                default:             return Command::None;
            }

        case UiMode::Picker:
            switch (ev.key) {
                case Key::Up:        return Command::PickerUp;
                case Key::Down:      return Command::PickerDown;
                case Key::Backspace: return Command::PickerAscend;
                case Key::Enter:     return Command::PickerEnter;
                case Key::Escape:    return Command::PickerEscape;
                default:             break;
            }
            if (ev.isChar('s')) return Command::PickerSelectDir;
            if (ev.isChar('b')) return Command::PickerBack;
            if (ev.isChar('.')) return Command::PickerToggleHidden;
            return Command::None;

        case UiMode::Confirm:
            if (ev.key == Key::Enter || ev.isChar('y')) return Command::StartTransfer;
            if (ev.isChar('b'))                         return Command::TransferBack;
            if (ev.key == Key::Escape)                  return Command::TransferEscape;
            return Command::None;

        case UiMode::Transferring:
            if (ev.key == Key::Escape) return Command::TransferEscape;
            if (ev.key == Key::Enter)  return Command::HideTransfer;
            return Command::None;

        case UiMode::Terminal: {
            if (ev.key == Key::CtrlG)
                return Command::LeaveTerminal;
            const Command tab = tabCommand(ev);
            if (tab != Command::None)
                return tab;
            return Command::SendToShell;
        }
    }
    return Command::None;
}

const char* commandName(Command c)
{
    switch (c) {
        case Command::None:               return "None";
        case Command::Quit:               return "Quit";
        case Command::NewProfile:         return "NewProfile";
        case Command::EditProfile:        return "EditProfile";
        case Command::ToggleConnect:      return "ToggleConnect";
        case Command::OpenTerminal:       return "OpenTerminal";
        case Command::Upload:             return "Upload";
        case Command::Download:           return "Download";
        case Command::ChangeMaster:       return "ChangeMaster";
        case Command::DeleteProfile:      return "DeleteProfile";
        case Command::CycleHeader:        return "CycleHeader";
        case Command::SelectPrevious:     return "SelectPrevious";
        case Command::SelectNext:         return "SelectNext";
        case Command::HistoryPrevious:    return "HistoryPrevious";
        case Command::HistoryNext:        return "HistoryNext";
        case Command::ShowTransfer:       return "ShowTransfer";
        case Command::AcceptNotice:       return "AcceptNotice";
        case Command::DismissNotice:      return "DismissNotice";
        case Command::ConnectFromNotice:  return "ConnectFromNotice";
        case Command::ConfirmYes:         return "ConfirmYes";
        case Command::ConfirmNo:          return "ConfirmNo";
        case Command::PickerUp:           return "PickerUp";
        case Command::PickerDown:         return "PickerDown";
        case Command::PickerAscend:       return "PickerAscend";
        case Command::PickerEnter:        return "PickerEnter";
        case Command::PickerSelectDir:    return "PickerSelectDir";
        case Command::PickerBack:         return "PickerBack";
        case Command::PickerEscape:       return "PickerEscape";
        case Command::PickerToggleHidden: return "PickerToggleHidden";
        case Command::StartTransfer:      return "StartTransfer";
        case Command::TransferBack:       return "TransferBack";
        case Command::TransferEscape:     return "TransferEscape";
        case Command::HideTransfer:       return "HideTransfer";
        case Command::FieldNext:          return "FieldNext";
        case Command::FieldPrevious:      return "FieldPrevious";
        case Command::OptionPrevious:     return "OptionPrevious";
        case Command::OptionNext:         return "OptionNext";
        case Command::FieldBackspace:     return "FieldBackspace";
        case Command::FieldInsert:        return "FieldInsert";
        case Command::FormSubmit:         return "FormSubmit";
        case Command::FormCancel:         return "FormCancel";
        case Command::OpenKeyFilePicker:  return "OpenKeyFilePicker";
        case Command::OpenKnownKeyPicker: return "OpenKnownKeyPicker";
        case Command::PreviousTab:        return "PreviousTab";
        case Command::NextTab:            return "NextTab";
        case Command::CloseTab:           return "CloseTab";
        case Command::LeaveTerminal:      return "LeaveTerminal";
        case Command::SendToShell:        return "SendToShell";
    }
    return "Unknown";
}
