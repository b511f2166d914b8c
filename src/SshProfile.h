#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include "ClientError.h"

// -----------------------------
// Authentication (tagged struct)
// -----------------------------
enum class AuthKind {
    Password,   // password auth, `secret` is the password
    PrivateKey  // public-key auth, `secret` is the optional key passphrase
};

struct AuthConfig {
    AuthKind kind = AuthKind::Password;
    QString  keyPath;   // only for PrivateKey
    QString  secret;    // password, or key passphrase (empty => none)

    bool hasPassphrase() const { return kind == AuthKind::PrivateKey && !secret.isEmpty(); }

    static AuthConfig password(const QString& pw)
    {
        AuthConfig a;
        a.kind = AuthKind::Password;
        a.secret = pw;
        return a;
    }

    static AuthConfig privateKey(const QString& path, const QString& passphrase = QString())
    {
        AuthConfig a;
        a.kind = AuthKind::PrivateKey;
        a.keyPath = path;
        a.secret = passphrase;
        return a;
    }

    bool operator==(const AuthConfig& o) const
    {
        return kind == o.kind && keyPath == o.keyPath && secret == o.secret;
    }
    bool operator!=(const AuthConfig& o) const { return !(*this == o); }
};

// -----------------------------
// Connection history
// -----------------------------
enum class HistoryState {
    Success,
    Failure
};

struct HistoryEntry {
    quint64      ts = 0;   // seconds since epoch
    HistoryState state = HistoryState::Success;

    bool operator==(const HistoryEntry& o) const { return ts == o.ts && state == o.state; }
    bool operator!=(const HistoryEntry& o) const { return !(*this == o); }
};

struct SshProfile {
    QString    name;
    QString    user;
    QString    host;
    AuthConfig auth;

    QVector<HistoryEntry> history;
    QString    lastRemoteDir;   // empty => none remembered

    // Display label: name, or host when the name is blank.
    QString label() const;

    // Newest history timestamp, 0 when there is no history.
    quint64 lastActivity() const;

    bool operator==(const SshProfile& o) const
    {
        return name == o.name && user == o.user && host == o.host && auth == o.auth
            && history == o.history && lastRemoteDir == o.lastRemoteDir;
    }
    bool operator!=(const SshProfile& o) const { return !(*this == o); }
};

// Identity: (user, host, auth-kind, key-path). Secrets are never compared.
bool sameIdentity(const SshProfile& a, const SshProfile& b);

// Stable key for an identity, e.g. "alice@h.example|pw" or "bob@h|pk:/k".
QString profileKey(const SshProfile& p);

// "2025-01-31 12:00:00 | success"
QString formatHistoryEntry(const HistoryEntry& e);

quint64 nowEpochSeconds();

// -----------------------------
// Editable form state for new/edit
// -----------------------------
enum class DraftAuthKind {
    PasswordOnly,
    PrivateKey,
    PrivateKeyWithPassword
};

struct ProfileDraft {
    QString       name;
    QString       user;
    QString       host;
    DraftAuthKind authKind = DraftAuthKind::PasswordOnly;
    QString       keyPath;
    QString       password;

    static ProfileDraft fromProfile(const SshProfile& p);
};

// Validates the draft and builds a profile with empty history.
// Fails with ConfigMissingField naming the first missing field.
bool buildProfile(const ProfileDraft& draft, SshProfile* out, ClientError* err = nullptr);
