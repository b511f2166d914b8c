// SshProfile.cpp
//
// Identity, labels and the profile builder shared by the store, the
// connection layer and the transfer flow.

#include "SshProfile.h"

#include <QDateTime>

QString SshProfile::label() const
{
    return name.trimmed().isEmpty() ? host : name;
}

quint64 SshProfile::lastActivity() const
{
    quint64 best = 0;
    for (const HistoryEntry& e : history)
        best = qMax(best, e.ts);
    return best;
}

bool sameIdentity(const SshProfile& a, const SshProfile& b)
{
    if (a.user != b.user || a.host != b.host)
        return false;
    if (a.auth.kind != b.auth.kind)
        return false;
    if (a.auth.kind == AuthKind::PrivateKey)
        return a.auth.keyPath == b.auth.keyPath;
    return true;
}

QString profileKey(const SshProfile& p)
{
    const QString authKey = (p.auth.kind == AuthKind::Password)
                                ? QStringLiteral("pw")
                                : QStringLiteral("pk:%1").arg(p.auth.keyPath);
    return QStringLiteral("%1@%2|%3").arg(p.user, p.host, authKey);
}

QString formatHistoryEntry(const HistoryEntry& e)
{
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(e.ts));
    const QString state = (e.state == HistoryState::Success) ? QStringLiteral("success")
                                                             : QStringLiteral("failed");
    return QStringLiteral("%1 | %2").arg(dt.toString("yyyy-MM-dd HH:mm:ss"), state);
}

quint64 nowEpochSeconds()
{
    const qint64 s = QDateTime::currentSecsSinceEpoch();
    return s > 0 ? static_cast<quint64>(s) : 0;
}

ProfileDraft ProfileDraft::fromProfile(const SshProfile& p)
{
    ProfileDraft d;
    d.name = p.name;
    d.user = p.user;
    d.host = p.host;
    if (p.auth.kind == AuthKind::Password) {
        d.authKind = DraftAuthKind::PasswordOnly;
        d.password = p.auth.secret;
    } else {
        d.keyPath = p.auth.keyPath;
        if (p.auth.hasPassphrase()) {
            d.authKind = DraftAuthKind::PrivateKeyWithPassword;
            d.password = p.auth.secret;
        } else {
            d.authKind = DraftAuthKind::PrivateKey;
        }
    }
    return d;
}

bool buildProfile(const ProfileDraft& draft, SshProfile* out, ClientError* err)
{
    clearError(err);

    if (draft.user.trimmed().isEmpty())
        return failWith(err, ErrorKind::ConfigMissingField, "User is required");
    if (draft.host.trimmed().isEmpty())
        return failWith(err, ErrorKind::ConfigMissingField, "Host is required");

    AuthConfig auth;
    switch (draft.authKind) {
        case DraftAuthKind::PasswordOnly:
            if (draft.password.isEmpty())
                return failWith(err, ErrorKind::ConfigMissingField, "Password is required");
            auth = AuthConfig::password(draft.password);
            break;
        case DraftAuthKind::PrivateKey:
            if (draft.keyPath.trimmed().isEmpty())
                return failWith(err, ErrorKind::ConfigMissingField, "Private key path is required");
            auth = AuthConfig::privateKey(draft.keyPath);
            break;
        case DraftAuthKind::PrivateKeyWithPassword:
            if (draft.keyPath.trimmed().isEmpty())
                return failWith(err, ErrorKind::ConfigMissingField, "Private key path is required");
            if (draft.password.isEmpty())
                return failWith(err, ErrorKind::ConfigMissingField, "Key password is required");
            auth = AuthConfig::privateKey(draft.keyPath, draft.password);
            break;
    }

    if (out) {
        SshProfile p;
        p.name = draft.name.trimmed();
        p.user = draft.user.trimmed();
        p.host = draft.host.trimmed();
        p.auth = auth;
        *out = p;
    }
    return true;
}
