#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include "ClientError.h"
#include "CryptoBox.h"
#include "SshProfile.h"   // Uses the shared SshProfile struct (do NOT redefine)

/*
    Stored (encrypted) form of a profile, exactly as it appears in config.json.
    Every secret is an EncryptedBlob; nothing in here is plaintext.
*/
struct StoredAuth {
    AuthKind kind = AuthKind::Password;
    QString  keyPath;

    bool                    hasSecret = false;   // PrivateKey without passphrase => false
    CryptoBox::EncryptedBlob secret;

    bool operator==(const StoredAuth& o) const
    {
        return kind == o.kind && keyPath == o.keyPath && hasSecret == o.hasSecret
            && (!hasSecret || secret == o.secret);
    }
};

struct StoredProfile {
    QString    name;
    QString    user;
    QString    host;
    StoredAuth auth;

    QVector<HistoryEntry> history;
    QString    lastRemoteDir;

    bool operator==(const StoredProfile& o) const
    {
        return name == o.name && user == o.user && host == o.host && auth == o.auth
            && history == o.history && lastRemoteDir == o.lastRemoteDir;
    }
};

struct StoreDocument {
    CryptoBox::MasterConfig master;
    QVector<StoredProfile>  profiles;
    QString                 lastLocalDir;   // empty => null

    bool operator==(const StoreDocument& o) const
    {
        return master == o.master && profiles == o.profiles && lastLocalDir == o.lastLocalDir;
    }
};

enum class HistoryEncoding {
    Structured,   // [{"ts": 1, "state": "Success"}, ...]
    Timestamps    // [1, 2, ...] (older stores, all entries are successes)
};

/*
    JSON codec for the store document.

    - Pretty printed UTF-8 on write.
    - Unknown fields are ignored on read.
    - "history" accepts both the structured and the legacy integer encoding.
*/
namespace StoreJson {
    QJsonArray historyToJson(const QVector<HistoryEntry>& history,
                             HistoryEncoding enc = HistoryEncoding::Structured);
    bool historyFromJson(const QJsonValue& v, QVector<HistoryEntry>* out, ClientError* err = nullptr);

    QByteArray serialize(const StoreDocument& doc);
    bool parse(const QByteArray& data, StoreDocument* out, ClientError* err = nullptr);
}

// Encrypt / decrypt one profile's secrets under the master key.
bool sealProfile(const SshProfile& p, const QByteArray& key, StoredProfile* out, ClientError* err = nullptr);
bool openProfile(const StoredProfile& s, const QByteArray& key, SshProfile* out, ClientError* err = nullptr);

struct KeyCandidate {
    QString path;
    QString passphrase;   // empty => none
};

/*
    ProfileStore
    ------------
    Owns the decrypted, in-memory profile list plus the master key, and
    persists everything to a single JSON file.

    Lifecycle:
    - exists() false  -> initialize(password, confirm) writes an empty store
    - exists() true   -> unlock(password) until it succeeds

    Every mutation re-sorts the list (most recent activity first, no history
    last) and rewrites the whole file. If the write fails the error is
    returned and the in-memory state stays authoritative; the next successful
    save persists it.
*/
class ProfileStore
{
public:
    explicit ProfileStore(const QString& path = QString());
    ~ProfileStore();

    ProfileStore(const ProfileStore&) = delete;
    ProfileStore& operator=(const ProfileStore&) = delete;

    // <GenericConfigLocation>/ss-ssh/config.json
    static QString defaultPath();

    QString path() const { return m_path; }
    bool exists() const;
    bool isUnlocked() const { return !m_key.isEmpty(); }

    // First run. Both entries must be non-empty and equal.
    bool initialize(const QString& password, const QString& confirm, ClientError* err = nullptr);

    // Loads the file and accepts the password only if the verifier matches.
    bool unlock(const QString& password, ClientError* err = nullptr);

    const QVector<SshProfile>& profiles() const { return m_profiles; }
    int count() const { return m_profiles.size(); }
    const SshProfile* at(int index) const;
    int indexOfKey(const QString& key) const;
    int indexOfIdentity(const SshProfile& p) const;

    QString lastLocalDir() const { return m_lastLocalDir; }

    // Inserts, or replaces the profile with the same identity.
    bool upsert(const SshProfile& p, ClientError* err = nullptr);

    // Replaces the profile at `index`; history and last remote directory
    // of the old entry are carried over.
    bool editAt(int index, const SshProfile& p, ClientError* err = nullptr);

    bool removeAt(int index, ClientError* err = nullptr);

    // Appends {now, state} to the matching profile. Returns false with
    // InvalidState if no profile has that identity.
    bool appendHistory(const SshProfile& identity, HistoryState state,
                       quint64 ts = 0, ClientError* err = nullptr);

    bool rememberRemoteDir(const SshProfile& identity, const QString& dir, ClientError* err = nullptr);
    bool rememberLocalDir(const QString& dir, ClientError* err = nullptr);

    // Verifies `current`, derives a new key for `next` and rewrites every
    // secret in one save. The old key is wiped.
    bool changeMaster(const QString& current, const QString& next, const QString& confirm,
                      ClientError* err = nullptr);

    // Unique private key paths across profiles, first passphrase wins.
    QVector<KeyCandidate> knownKeyCandidates() const;

    // Rewrites the file from the in-memory state.
    bool save(ClientError* err = nullptr) const;

    // Stable sort by lastActivity() descending.
    static void sortByRecent(QVector<SshProfile>& profiles);

private:
    bool buildDocument(const QByteArray& key, const CryptoBox::MasterConfig& master,
                       StoreDocument* out, ClientError* err) const;
    bool writeDocument(const StoreDocument& doc, ClientError* err) const;
    bool commit(ClientError* err);

    QString                 m_path;
    CryptoBox::MasterConfig m_master;
    QByteArray              m_key;
    QVector<SshProfile>     m_profiles;
    QString                 m_lastLocalDir;
};
