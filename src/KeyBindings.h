#pragma once

#include <QByteArray>
#include <QChar>
#include <QVector>

// -----------------------------
// Decoded keystrokes
// -----------------------------
enum class Key {
    Char,
    Enter,
    Escape,
    Backspace,
    Tab,
    BackTab,
    Up,
    Down,
    Left,
    Right,
    F2,
    F3,
    F6,
    F7,
    F8,
    CtrlG,
    Other
};

struct KeyEvent {
    Key        key = Key::Other;
    QChar      ch;      // Key::Char only
    QByteArray raw;     // bytes as read, forwarded verbatim to shells

    bool isChar(char c) const { return key == Key::Char && ch == QLatin1Char(c); }
};

/*
    KeyDecoder
    ----------
    Turns raw stdin bytes (terminal in raw mode) into key events.

    Understands CSI / SS3 cursor keys, the xterm and linux-console forms
    of F2/F3 and the "~"-terminated F6..F8. An incomplete sequence at the
    end of a chunk is kept until the next feed(); a lone ESC is reported
    as Escape once flush() is called with nothing following it.
*/
class KeyDecoder
{
public:
    QVector<KeyEvent> feed(const QByteArray& bytes);

    // Releases a pending lone ESC (call on the tick when no more bytes came).
    QVector<KeyEvent> flush();

    bool hasPending() const { return !m_pending.isEmpty(); }

private:
    QByteArray m_pending;
};

// -----------------------------
// Command routing
// -----------------------------

// Which surface currently receives keys.
enum class UiMode {
    Normal,
    Notice,
    ConfirmDelete,
    Form,
    Picker,
    Confirm,
    Transferring,
    Terminal
};

enum class Command {
    None,

    // Normal
    Quit,
    NewProfile,
    EditProfile,
    ToggleConnect,
    OpenTerminal,
    Upload,
    Download,
    ChangeMaster,
    DeleteProfile,
    CycleHeader,
    SelectPrevious,
    SelectNext,
    HistoryPrevious,
    HistoryNext,
    ShowTransfer,

    // Notice
    AcceptNotice,
    DismissNotice,
    ConnectFromNotice,

    // Delete confirmation
    ConfirmYes,
    ConfirmNo,

    // Pickers
    PickerUp,
    PickerDown,
    PickerAscend,
    PickerEnter,
    PickerSelectDir,
    PickerBack,
    PickerEscape,
    PickerToggleHidden,

    // Transfer confirm / progress
    StartTransfer,
    TransferBack,
    TransferEscape,
    HideTransfer,

    // Forms
    FieldNext,
    FieldPrevious,
    OptionPrevious,
    OptionNext,
    FieldBackspace,
    FieldInsert,
    FormSubmit,
    FormCancel,
    OpenKeyFilePicker,
    OpenKnownKeyPicker,

    // Terminal tabs (valid in every mode that has tabs)
    PreviousTab,
    NextTab,
    CloseTab,
    LeaveTerminal,
    SendToShell
};

// Maps a key to the command it triggers in `mode`.
// Terminal tab keys (F6/F7/F8) map in Normal and Terminal mode only.
Command commandFor(UiMode mode, const KeyEvent& ev);

const char* commandName(Command c);
