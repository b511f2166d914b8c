#include "FormState.h"

QString formFieldLabel(FormField f)
{
    switch (f) {
        case FormField::Name:       return "Name";
        case FormField::User:       return "User";
        case FormField::Host:       return "Host";
        case FormField::AuthType:   return "Auth";
        case FormField::KeyPath:    return "Key path";
        case FormField::Password:   return "Password";
        case FormField::ActionTest: return "[ Test connection ]";
        case FormField::ActionSave: return "[ Save ]";
    }
    return QString();
}

QString draftAuthKindLabel(DraftAuthKind k)
{
    switch (k) {
        case DraftAuthKind::PasswordOnly:           return "Password";
        case DraftAuthKind::PrivateKey:             return "Private key";
        case DraftAuthKind::PrivateKeyWithPassword: return "Private key + passphrase";
    }
    return QString();
}

// =============================================================================
// ConnectionForm
// =============================================================================
void ConnectionForm::reset(const ProfileDraft& draft, int editIndex)
{
    m_draft = draft;
    m_editIndex = editIndex;
    m_active = FormField::Name;
    feedback.clear();
}

QVector<FormField> ConnectionForm::fields() const
{
    QVector<FormField> out { FormField::Name, FormField::User, FormField::Host, FormField::AuthType };

    switch (m_draft.authKind) {
        case DraftAuthKind::PasswordOnly:
            out << FormField::Password;
            break;
        case DraftAuthKind::PrivateKey:
            out << FormField::KeyPath;
            break;
        case DraftAuthKind::PrivateKeyWithPassword:
            out << FormField::KeyPath << FormField::Password;
            break;
    }

    out << FormField::ActionTest << FormField::ActionSave;
    return out;
}

void ConnectionForm::next()
{
    const QVector<FormField> f = fields();
    const int i = f.indexOf(m_active);
    m_active = f.at((i + 1) % f.size());
}

void ConnectionForm::previous()
{
    const QVector<FormField> f = fields();
    const int i = f.indexOf(m_active);
    m_active = f.at((i <= 0) ? f.size() - 1 : i - 1);
}

void ConnectionForm::cycleAuthKind(bool forward)
{
    if (m_active != FormField::AuthType)
        return;

    switch (m_draft.authKind) {
        case DraftAuthKind::PasswordOnly:
            m_draft.authKind = forward ? DraftAuthKind::PrivateKey : DraftAuthKind::PrivateKeyWithPassword;
            break;
        case DraftAuthKind::PrivateKey:
            m_draft.authKind = forward ? DraftAuthKind::PrivateKeyWithPassword : DraftAuthKind::PasswordOnly;
            break;
        case DraftAuthKind::PrivateKeyWithPassword:
            m_draft.authKind = forward ? DraftAuthKind::PasswordOnly : DraftAuthKind::PrivateKey;
            break;
    }
}

QString* ConnectionForm::textFor(FormField f)
{
    switch (f) {
        case FormField::Name:     return &m_draft.name;
        case FormField::User:     return &m_draft.user;
        case FormField::Host:     return &m_draft.host;
        case FormField::KeyPath:  return &m_draft.keyPath;
        case FormField::Password: return &m_draft.password;
        default:                  return nullptr;
    }
}

void ConnectionForm::insert(QChar ch)
{
    if (QString* t = textFor(m_active))
        t->append(ch);
}

void ConnectionForm::backspace()
{
    if (QString* t = textFor(m_active))
        t->chop(1);
}

void ConnectionForm::setKeyPath(const QString& path)
{
    m_draft.keyPath = path;
    if (m_draft.authKind == DraftAuthKind::PasswordOnly)
        m_draft.authKind = DraftAuthKind::PrivateKey;
}

void ConnectionForm::applyKeyCandidate(const KeyCandidate& candidate)
{
    m_draft.keyPath = candidate.path;
    if (candidate.passphrase.isEmpty()) {
        if (m_draft.authKind == DraftAuthKind::PasswordOnly)
            m_draft.authKind = DraftAuthKind::PrivateKey;
    } else {
        m_draft.authKind = DraftAuthKind::PrivateKeyWithPassword;
        m_draft.password = candidate.passphrase;
    }
}

QString ConnectionForm::displayValue(FormField f) const
{
    switch (f) {
        case FormField::Name:     return m_draft.name;
        case FormField::User:     return m_draft.user;
        case FormField::Host:     return m_draft.host;
        case FormField::AuthType: return "< " + draftAuthKindLabel(m_draft.authKind) + " >";
        case FormField::KeyPath:  return m_draft.keyPath;
        case FormField::Password: return QString(m_draft.password.size(), QLatin1Char('*'));
        default:                  return QString();
    }
}

// =============================================================================
// MasterForm
// =============================================================================
void MasterForm::reset()
{
    m_current.clear();
    m_new.clear();
    m_confirm.clear();
    m_active = MasterField::Current;
}

void MasterForm::next()
{
    switch (m_active) {
        case MasterField::Current:    m_active = MasterField::New;        break;
        case MasterField::New:        m_active = MasterField::Confirm;    break;
        case MasterField::Confirm:    m_active = MasterField::ActionSave; break;
        case MasterField::ActionSave: m_active = MasterField::Current;    break;
    }
}

void MasterForm::previous()
{
    switch (m_active) {
        case MasterField::Current:    m_active = MasterField::ActionSave; break;
        case MasterField::New:        m_active = MasterField::Current;    break;
        case MasterField::Confirm:    m_active = MasterField::New;        break;
        case MasterField::ActionSave: m_active = MasterField::Confirm;    break;
    }
}

QString* MasterForm::textFor(MasterField f)
{
    switch (f) {
        case MasterField::Current: return &m_current;
        case MasterField::New:     return &m_new;
        case MasterField::Confirm: return &m_confirm;
        default:                   return nullptr;
    }
}

void MasterForm::insert(QChar ch)
{
    if (QString* t = textFor(m_active))
        t->append(ch);
}

void MasterForm::backspace()
{
    if (QString* t = textFor(m_active))
        t->chop(1);
}

int MasterForm::length(MasterField f) const
{
    switch (f) {
        case MasterField::Current: return m_current.size();
        case MasterField::New:     return m_new.size();
        case MasterField::Confirm: return m_confirm.size();
        default:                   return 0;
    }
}
