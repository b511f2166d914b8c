// ProfileStore.cpp
//
// ARCHITECTURE NOTES (ProfileStore.cpp)
//
// ProfileStore is the persistence boundary for SSH profiles.
// Responsibilities:
// - Locate config.json
// - Serialize/deserialize the store document (StoreJson)
// - Encrypt secrets on the way out, decrypt them on unlock
// - Keep backward compatibility with the integer-only history encoding
//
// Non-responsibilities:
// - No UI / prompting (callers collect passwords)
// - No SSH/network operations
//
// Writes go through QSaveFile so a crash mid-write leaves the previous file intact.
//

#include "ProfileStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <QSet>
#include <QStandardPaths>
#include <QDebug>

#include <algorithm>

// -----------------------------
// Helpers: blobs / history <-> JSON
// -----------------------------
static QJsonObject blobToJson(const CryptoBox::EncryptedBlob& b)
{
    QJsonObject o;
    o["nonce"] = b.nonceB64;
    o["ciphertext"] = b.ciphertextB64;
    return o;
}

static bool blobFromJson(const QJsonValue& v, CryptoBox::EncryptedBlob* out)
{
    if (!v.isObject())
        return false;
    const QJsonObject o = v.toObject();
    if (!o.value("nonce").isString() || !o.value("ciphertext").isString())
        return false;
    out->nonceB64 = o.value("nonce").toString();
    out->ciphertextB64 = o.value("ciphertext").toString();
    return true;
}

static bool readTimestamp(const QJsonValue& v, quint64* out)
{
    if (!v.isDouble())
        return false;
    const double d = v.toDouble();
    if (d < 0)
        return false;
    *out = static_cast<quint64>(d);
    return true;
}

static QJsonValue optionalString(const QString& s)
{
    return s.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(s);
}

static QJsonObject authToJson(const StoredAuth& a)
{
    QJsonObject inner;
    QJsonObject outer;
    if (a.kind == AuthKind::Password) {
        inner["password"] = blobToJson(a.secret);
        outer["Password"] = inner;
    } else {
        inner["path"] = a.keyPath;
        inner["password"] = a.hasSecret ? QJsonValue(blobToJson(a.secret))
                                        : QJsonValue(QJsonValue::Null);
        outer["PrivateKey"] = inner;
    }
    return outer;
}

static bool authFromJson(const QJsonValue& v, StoredAuth* out)
{
    if (!v.isObject())
        return false;
    const QJsonObject o = v.toObject();

    if (o.contains("Password")) {
        const QJsonObject inner = o.value("Password").toObject();
        StoredAuth a;
        a.kind = AuthKind::Password;
        a.hasSecret = blobFromJson(inner.value("password"), &a.secret);
        if (!a.hasSecret)
            return false;
        *out = a;
        return true;
    }

    if (o.contains("PrivateKey")) {
        const QJsonObject inner = o.value("PrivateKey").toObject();
        if (!inner.value("path").isString())
            return false;
        StoredAuth a;
        a.kind = AuthKind::PrivateKey;
        a.keyPath = inner.value("path").toString();
        const QJsonValue pw = inner.value("password");
        if (pw.isNull() || pw.isUndefined()) {
            a.hasSecret = false;
        } else if (!blobFromJson(pw, &a.secret)) {
            return false;
        } else {
            a.hasSecret = true;
        }
        *out = a;
        return true;
    }

    return false;
}

namespace StoreJson {

QJsonArray historyToJson(const QVector<HistoryEntry>& history, HistoryEncoding enc)
{
    QJsonArray a;
    for (const HistoryEntry& e : history) {
        if (enc == HistoryEncoding::Timestamps) {
            a.append(static_cast<qint64>(e.ts));
            continue;
        }
        QJsonObject o;
        o["ts"] = static_cast<qint64>(e.ts);
        o["state"] = (e.state == HistoryState::Success) ? QStringLiteral("Success")
                                                        : QStringLiteral("Failure");
        a.append(o);
    }
    return a;
}

bool historyFromJson(const QJsonValue& v, QVector<HistoryEntry>* out, ClientError* err)
{
    clearError(err);
    QVector<HistoryEntry> result;

    if (v.isUndefined() || v.isNull()) {
        *out = result;
        return true;
    }
    if (!v.isArray())
        return failWith(err, ErrorKind::StoreIoFailure, "history must be an array");

    const QJsonArray arr = v.toArray();
    result.reserve(arr.size());

    // Either every element is an object or every element is an integer.
    const bool legacy = !arr.isEmpty() && arr.first().isDouble();

    for (const QJsonValue& item : arr) {
        HistoryEntry e;
        if (legacy) {
            if (!readTimestamp(item, &e.ts))
                return failWith(err, ErrorKind::StoreIoFailure, "Invalid history timestamp");
            e.state = HistoryState::Success;
        } else {
            if (!item.isObject())
                return failWith(err, ErrorKind::StoreIoFailure, "Invalid history entry");
            const QJsonObject o = item.toObject();
            if (!readTimestamp(o.value("ts"), &e.ts))
                return failWith(err, ErrorKind::StoreIoFailure, "Invalid history timestamp");
            const QString st = o.value("state").toString();
            if (st == "Success")
                e.state = HistoryState::Success;
            else if (st == "Failure")
                e.state = HistoryState::Failure;
            else
                return failWith(err, ErrorKind::StoreIoFailure,
                                QString("Unknown history state: %1").arg(st));
        }
        result.push_back(e);
    }

    *out = result;
    return true;
}

QByteArray serialize(const StoreDocument& doc)
{
    QJsonObject master;
    master["salt_b64"] = doc.master.saltB64;
    master["check"] = blobToJson(doc.master.check);

    QJsonArray conns;
    for (const StoredProfile& p : doc.profiles) {
        QJsonObject obj;
        obj["name"] = p.name;
        obj["user"] = p.user;
        obj["host"] = p.host;
        obj["auth"] = authToJson(p.auth);
        obj["history"] = historyToJson(p.history);
        obj["last_remote_dir"] = optionalString(p.lastRemoteDir);
        conns.append(obj);
    }

    QJsonObject root;
    root["master"] = master;
    root["connections"] = conns;
    root["last_local_dir"] = optionalString(doc.lastLocalDir);

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool parse(const QByteArray& data, StoreDocument* out, ClientError* err)
{
    clearError(err);

    QJsonParseError perr;
    const QJsonDocument jd = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !jd.isObject())
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Invalid JSON in config file: %1").arg(perr.errorString()));

    const QJsonObject root = jd.object();

    StoreDocument doc;

    const QJsonObject master = root.value("master").toObject();
    if (!master.value("salt_b64").isString() || !blobFromJson(master.value("check"), &doc.master.check))
        return failWith(err, ErrorKind::StoreIoFailure, "Config file has no master section");
    doc.master.saltB64 = master.value("salt_b64").toString();

    const QJsonValue connsVal = root.value("connections");
    if (!connsVal.isArray())
        return failWith(err, ErrorKind::StoreIoFailure, "Config file has no connections list");

    const QJsonArray conns = connsVal.toArray();
    for (int i = 0; i < conns.size(); ++i) {
        if (!conns.at(i).isObject())
            return failWith(err, ErrorKind::StoreIoFailure,
                            QString("Connection %1 is not an object").arg(i));

        const QJsonObject obj = conns.at(i).toObject();

        StoredProfile p;
        p.name = obj.value("name").toString();
        if (!obj.value("user").isString() || !obj.value("host").isString())
            return failWith(err, ErrorKind::StoreIoFailure,
                            QString("Connection %1 is missing user or host").arg(i));
        p.user = obj.value("user").toString();
        p.host = obj.value("host").toString();

        if (!authFromJson(obj.value("auth"), &p.auth))
            return failWith(err, ErrorKind::StoreIoFailure,
                            QString("Connection %1 has invalid auth").arg(i));

        ClientError herr;
        if (!historyFromJson(obj.value("history"), &p.history, &herr))
            return failWith(err, ErrorKind::StoreIoFailure,
                            QString("Connection %1: %2").arg(i).arg(herr.message));

        p.lastRemoteDir = obj.value("last_remote_dir").toString();
        doc.profiles.push_back(p);
    }

    doc.lastLocalDir = root.value("last_local_dir").toString();

    *out = doc;
    return true;
}

} // namespace StoreJson

// -----------------------------
// Seal / open
// -----------------------------
bool sealProfile(const SshProfile& p, const QByteArray& key, StoredProfile* out, ClientError* err)
{
    clearError(err);

    StoredProfile s;
    s.name = p.name;
    s.user = p.user;
    s.host = p.host;
    s.history = p.history;
    s.lastRemoteDir = p.lastRemoteDir;

    s.auth.kind = p.auth.kind;
    if (p.auth.kind == AuthKind::PrivateKey)
        s.auth.keyPath = p.auth.keyPath;

    const bool needsSecret = (p.auth.kind == AuthKind::Password) || p.auth.hasPassphrase();
    if (needsSecret) {
        if (!CryptoBox::encryptString(key, p.auth.secret, &s.auth.secret, err))
            return false;
        s.auth.hasSecret = true;
    }

    *out = s;
    return true;
}

bool openProfile(const StoredProfile& s, const QByteArray& key, SshProfile* out, ClientError* err)
{
    clearError(err);

    SshProfile p;
    p.name = s.name;
    p.user = s.user;
    p.host = s.host;
    p.history = s.history;
    p.lastRemoteDir = s.lastRemoteDir;

    p.auth.kind = s.auth.kind;
    p.auth.keyPath = s.auth.keyPath;
    if (s.auth.hasSecret) {
        if (!CryptoBox::decryptString(key, s.auth.secret, &p.auth.secret, err))
            return false;
    }

    *out = p;
    return true;
}

// -----------------------------
// ProfileStore
// -----------------------------
ProfileStore::ProfileStore(const QString& path)
    : m_path(path.isEmpty() ? defaultPath() : path)
{
}

ProfileStore::~ProfileStore()
{
    CryptoBox::wipe(m_key);
}

QString ProfileStore::defaultPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty())
        return QDir::current().absoluteFilePath("ss-ssh-config.json");
    return base + "/ss-ssh/config.json";
}

bool ProfileStore::exists() const
{
    return QFileInfo::exists(m_path);
}

const SshProfile* ProfileStore::at(int index) const
{
    if (index < 0 || index >= m_profiles.size())
        return nullptr;
    return &m_profiles[index];
}

int ProfileStore::indexOfKey(const QString& key) const
{
    for (int i = 0; i < m_profiles.size(); ++i) {
        if (profileKey(m_profiles[i]) == key)
            return i;
    }
    return -1;
}

int ProfileStore::indexOfIdentity(const SshProfile& p) const
{
    for (int i = 0; i < m_profiles.size(); ++i) {
        if (sameIdentity(m_profiles[i], p))
            return i;
    }
    return -1;
}

bool ProfileStore::initialize(const QString& password, const QString& confirm, ClientError* err)
{
    clearError(err);

    if (password.isEmpty())
        return failWith(err, ErrorKind::ConfigMissingField, "Master password cannot be empty");
    if (password != confirm)
        return failWith(err, ErrorKind::ConfigMissingField, "Passwords do not match");

    CryptoBox::MasterConfig master;
    QByteArray key;
    if (!CryptoBox::createMaster(password, &master, &key, err))
        return false;

    StoreDocument doc;
    doc.master = master;
    if (!writeDocument(doc, err)) {
        CryptoBox::wipe(key);
        return false;
    }

    CryptoBox::wipe(m_key);
    m_master = master;
    m_key = key;
    m_profiles.clear();
    m_lastLocalDir.clear();

    qInfo().noquote() << QString("Created new profile store: %1").arg(m_path);
    return true;
}

bool ProfileStore::unlock(const QString& password, ClientError* err)
{
    clearError(err);

    QFile f(m_path);
    if (!f.open(QIODevice::ReadOnly))
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Could not open config file: %1").arg(f.errorString()));
    const QByteArray data = f.readAll();
    f.close();

    StoreDocument doc;
    if (!StoreJson::parse(data, &doc, err))
        return false;

    QByteArray key;
    if (!CryptoBox::unlockMaster(password, doc.master, &key, err)) {
        qWarning().noquote() << "Master password rejected";
        return false;
    }

    QVector<SshProfile> profiles;
    profiles.reserve(doc.profiles.size());
    for (const StoredProfile& s : doc.profiles) {
        SshProfile p;
        ClientError derr;
        if (!openProfile(s, key, &p, &derr)) {
            CryptoBox::wipe(key);
            return failWith(err, derr.kind,
                            QString("Could not decrypt profile %1@%2: %3")
                                .arg(s.user, s.host, derr.message));
        }
        profiles.push_back(p);
    }

    sortByRecent(profiles);

    CryptoBox::wipe(m_key);
    m_master = doc.master;
    m_key = key;
    m_profiles = profiles;
    m_lastLocalDir = doc.lastLocalDir;

    qInfo().noquote() << QString("Profile store unlocked (%1 profiles)").arg(m_profiles.size());
    return true;
}

bool ProfileStore::upsert(const SshProfile& p, ClientError* err)
{
    const int idx = indexOfIdentity(p);
    if (idx >= 0)
        m_profiles[idx] = p;
    else
        m_profiles.push_back(p);
    return commit(err);
}

bool ProfileStore::editAt(int index, const SshProfile& p, ClientError* err)
{
    clearError(err);
    if (index < 0 || index >= m_profiles.size())
        return failWith(err, ErrorKind::InvalidState, "No saved connection selected");

    SshProfile updated = p;
    updated.history = m_profiles[index].history;
    updated.lastRemoteDir = m_profiles[index].lastRemoteDir;

    m_profiles.removeAt(index);

    const int idx = indexOfIdentity(updated);
    if (idx >= 0)
        m_profiles[idx] = updated;
    else
        m_profiles.push_back(updated);

    return commit(err);
}

bool ProfileStore::removeAt(int index, ClientError* err)
{
    clearError(err);
    if (index < 0 || index >= m_profiles.size())
        return failWith(err, ErrorKind::InvalidState, "No saved connection selected");
    m_profiles.removeAt(index);
    return commit(err);
}

bool ProfileStore::appendHistory(const SshProfile& identity, HistoryState state,
                                 quint64 ts, ClientError* err)
{
    clearError(err);
    const int idx = indexOfIdentity(identity);
    if (idx < 0)
        return failWith(err, ErrorKind::InvalidState, "Unknown connection");

    HistoryEntry e;
    e.ts = ts ? ts : nowEpochSeconds();
    e.state = state;
    m_profiles[idx].history.push_back(e);
    return commit(err);
}

bool ProfileStore::rememberRemoteDir(const SshProfile& identity, const QString& dir, ClientError* err)
{
    clearError(err);
    const int idx = indexOfIdentity(identity);
    if (idx < 0)
        return failWith(err, ErrorKind::InvalidState, "Unknown connection");
    m_profiles[idx].lastRemoteDir = dir;
    return commit(err);
}

bool ProfileStore::rememberLocalDir(const QString& dir, ClientError* err)
{
    m_lastLocalDir = dir;
    return commit(err);
}

bool ProfileStore::changeMaster(const QString& current, const QString& next, const QString& confirm,
                                ClientError* err)
{
    clearError(err);

    if (current.isEmpty())
        return failWith(err, ErrorKind::ConfigMissingField, "Current password is required");
    if (next.isEmpty())
        return failWith(err, ErrorKind::ConfigMissingField, "New password is required");
    if (next != confirm)
        return failWith(err, ErrorKind::ConfigMissingField, "New password confirmation does not match");

    QByteArray currentKey;
    if (!CryptoBox::unlockMaster(current, m_master, &currentKey, err))
        return failWith(err, ErrorKind::MasterMismatch, "Current master password incorrect");
    CryptoBox::wipe(currentKey);

    CryptoBox::MasterConfig newMaster;
    QByteArray newKey;
    if (!CryptoBox::createMaster(next, &newMaster, &newKey, err))
        return false;

    StoreDocument doc;
    if (!buildDocument(newKey, newMaster, &doc, err) || !writeDocument(doc, err)) {
        CryptoBox::wipe(newKey);
        return false;
    }

    CryptoBox::wipe(m_key);
    m_master = newMaster;
    m_key = newKey;

    qInfo() << "Master password updated";
    return true;
}

QVector<KeyCandidate> ProfileStore::knownKeyCandidates() const
{
    QVector<KeyCandidate> out;
    QSet<QString> seen;
    for (const SshProfile& p : m_profiles) {
        if (p.auth.kind != AuthKind::PrivateKey)
            continue;
        if (seen.contains(p.auth.keyPath))
            continue;
        seen.insert(p.auth.keyPath);

        KeyCandidate c;
        c.path = p.auth.keyPath;
        c.passphrase = p.auth.secret;
        out.push_back(c);
    }
    return out;
}

void ProfileStore::sortByRecent(QVector<SshProfile>& profiles)
{
    std::stable_sort(profiles.begin(), profiles.end(),
                     [](const SshProfile& a, const SshProfile& b) {
                         return a.lastActivity() > b.lastActivity();
                     });
}

bool ProfileStore::save(ClientError* err) const
{
    clearError(err);
    if (!isUnlocked())
        return failWith(err, ErrorKind::InvalidState, "Profile store is locked");

    StoreDocument doc;
    if (!buildDocument(m_key, m_master, &doc, err))
        return false;
    return writeDocument(doc, err);
}

bool ProfileStore::buildDocument(const QByteArray& key, const CryptoBox::MasterConfig& master,
                                 StoreDocument* out, ClientError* err) const
{
    StoreDocument doc;
    doc.master = master;
    doc.lastLocalDir = m_lastLocalDir;
    doc.profiles.reserve(m_profiles.size());

    for (const SshProfile& p : m_profiles) {
        StoredProfile s;
        if (!sealProfile(p, key, &s, err))
            return false;
        doc.profiles.push_back(s);
    }

    *out = doc;
    return true;
}

bool ProfileStore::writeDocument(const StoreDocument& doc, ClientError* err) const
{
    clearError(err);

    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir))
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Could not create config directory: %1").arg(dir));

    QSaveFile f(m_path);
    if (!f.open(QIODevice::WriteOnly))
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Could not write config file: %1").arg(f.errorString()));

    const QByteArray data = StoreJson::serialize(doc);
    if (f.write(data) != data.size()) {
        const QString why = f.errorString();
        f.cancelWriting();
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Could not write config file: %1").arg(why));
    }

    if (!f.commit())
        return failWith(err, ErrorKind::StoreIoFailure,
                        QString("Could not write config file: %1").arg(f.errorString()));

    return true;
}

bool ProfileStore::commit(ClientError* err)
{
    sortByRecent(m_profiles);
    const bool ok = save(err);
    if (!ok && err)
        qWarning().noquote() << QString("Failed to save profile store: %1").arg(err->message);
    return ok;
}
