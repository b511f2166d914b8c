#pragma once

#include <QChar>
#include <QString>
#include <QVector>

#include "ProfileStore.h"
#include "SshProfile.h"

// Focusable rows of the new/edit connection form.
enum class FormField {
    Name,
    User,
    Host,
    AuthType,
    KeyPath,
    Password,
    ActionTest,
    ActionSave
};

QString formFieldLabel(FormField f);
QString draftAuthKindLabel(DraftAuthKind k);

/*
    ConnectionForm
    --------------
    Editable state of the new/edit connection form. Which rows exist
    depends on the auth kind: the key path only for key auth, the
    password for password auth and for keys with a passphrase.
*/
class ConnectionForm
{
public:
    // editIndex < 0 => new connection
    void reset(const ProfileDraft& draft = ProfileDraft(), int editIndex = -1);

    const ProfileDraft& draft() const { return m_draft; }
    int editIndex() const { return m_editIndex; }
    bool isEdit() const { return m_editIndex >= 0; }

    FormField activeField() const { return m_active; }
    QVector<FormField> fields() const;

    void next();
    void previous();

    // Left/Right on the auth type row.
    void cycleAuthKind(bool forward);

    void insert(QChar ch);
    void backspace();

    void setKeyPath(const QString& path);
    void applyKeyCandidate(const KeyCandidate& candidate);

    // Text shown for a row. Passwords are masked.
    QString displayValue(FormField f) const;

    QString feedback;

private:
    QString* textFor(FormField f);

    ProfileDraft m_draft;
    int          m_editIndex = -1;
    FormField    m_active = FormField::Name;
};

// Rows of the change-master-password form.
enum class MasterField {
    Current,
    New,
    Confirm,
    ActionSave
};

class MasterForm
{
public:
    void reset();

    MasterField activeField() const { return m_active; }
    void next();
    void previous();

    void insert(QChar ch);
    void backspace();

    const QString& currentPassword() const { return m_current; }
    const QString& newPassword() const { return m_new; }
    const QString& confirmPassword() const { return m_confirm; }

    // Number of characters typed, for the masked display.
    int length(MasterField f) const;

private:
    QString* textFor(MasterField f);

    QString     m_current;
    QString     m_new;
    QString     m_confirm;
    MasterField m_active = MasterField::Current;
};
