// ProfileStore tests: lifecycle, persistence, ordering, history encodings
// and master password rotation.
#include "ProfileStore.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

HistoryEntry success(quint64 ts) {
    HistoryEntry e;
    e.ts = ts;
    e.state = HistoryState::Success;
    return e;
}

SshProfile keyProfile(const QString &user, const QString &host,
                      const QString &path, const QString &passphrase) {
    SshProfile p;
    p.user = user;
    p.host = host;
    p.auth = AuthConfig::privateKey(path, passphrase);
    return p;
}

// Scenario: create, restart, reject a bad master, accept the right one.
void test_create_and_verify(TestContext &t, const QString &dir) {
    const QString path = dir + "/a/config.json";
    {
        ProfileStore store(path);
        t.check(!store.exists(), "store should not exist before initialize");
        ClientError err;
        t.check(store.initialize("s3cret", "s3cret", &err),
                "initialize should succeed: " + err.message);
        t.check(store.exists(), "initialize should write the file");
        t.check(store.count() == 0, "a new store has no profiles");

        SshProfile p = makePasswordProfile("alice", "h.example", "p");
        t.check(store.upsert(p, &err), "upsert should save: " + err.message);
    }

    ProfileStore reopened(path);
    ClientError err;
    t.check(!reopened.unlock("bad", &err), "unlock should reject a bad master");
    t.check(err.kind == ErrorKind::MasterMismatch,
            "bad master should be MasterMismatch");
    t.check(!reopened.isUnlocked(), "store should stay locked after a bad master");

    t.check(reopened.unlock("s3cret", &err), "unlock should accept the right master");
    t.check(reopened.count() == 1, "store should contain exactly one profile");
    if (reopened.count() == 1) {
        const SshProfile *p = reopened.at(0);
        t.check(p->user == "alice" && p->host == "h.example",
                "profile should be alice@h.example");
        t.check(p->auth.kind == AuthKind::Password && p->auth.secret == "p",
                "decrypted password should be 'p'");
    }

    const QByteArray raw = readFile(path);
    t.check(!raw.contains("\"p\""), "plaintext password must not appear on disk");
}

void test_initialize_validation(TestContext &t, const QString &dir) {
    ProfileStore store(dir + "/b/config.json");
    ClientError err;
    t.check(!store.initialize("", "", &err), "empty master should be rejected");
    t.check(err.kind == ErrorKind::ConfigMissingField,
            "empty master should be ConfigMissingField");
    t.check(!store.initialize("one", "two", &err), "mismatched confirm should be rejected");
    t.check(!store.exists(), "failed initialize should not write a file");
}

// Scenario: most recent activity first, no history last.
void test_history_ordering(TestContext &t, const QString &dir) {
    const QString path = dir + "/c/config.json";
    {
        ProfileStore store(path);
        store.initialize("m", "m");

        SshProfile p1 = makePasswordProfile("u1", "h1", "x");
        p1.history = {success(10)};
        SshProfile p2 = makePasswordProfile("u2", "h2", "x");
        SshProfile p3 = makePasswordProfile("u3", "h3", "x");
        p3.history = {success(20)};

        store.upsert(p1);
        store.upsert(p2);
        store.upsert(p3);
    }

    ProfileStore store(path);
    t.check(store.unlock("m"), "unlock should succeed for ordering test");
    t.check(store.count() == 3, "three profiles expected");
    if (store.count() == 3) {
        t.check(store.at(0)->user == "u3", "P3 (t=20) should come first");
        t.check(store.at(1)->user == "u1", "P1 (t=10) should come second");
        t.check(store.at(2)->user == "u2", "P2 (no history) should come last");
    }

    for (int i = 1; i < store.count(); ++i)
        t.check(store.at(i - 1)->lastActivity() >= store.at(i)->lastActivity(),
                "last activity should be non-increasing");
}

// Scenario: legacy integer history loads as successes, in order.
void test_legacy_history(TestContext &t) {
    QVector<HistoryEntry> h;
    ClientError err;
    t.check(StoreJson::historyFromJson(QJsonArray{1, 2}, &h, &err),
            "legacy integer history should parse");
    t.check(h.size() == 2, "legacy history should have two entries");
    if (h.size() == 2) {
        t.check(h[0].ts == 1 && h[0].state == HistoryState::Success,
                "first legacy entry should be {1, Success}");
        t.check(h[1].ts == 2 && h[1].state == HistoryState::Success,
                "second legacy entry should be {2, Success}");
    }

    QVector<HistoryEntry> structured;
    HistoryEntry failed;
    failed.ts = 7;
    failed.state = HistoryState::Failure;
    const QVector<HistoryEntry> original = {success(5), failed};
    t.check(StoreJson::historyFromJson(StoreJson::historyToJson(original), &structured),
            "structured history should parse");
    t.check(structured == original, "structured history should survive encoding");

    const QJsonArray legacy = StoreJson::historyToJson({success(3), success(4)},
                                                       HistoryEncoding::Timestamps);
    t.check(legacy.size() == 2 && legacy[0].toInt() == 3,
            "timestamp encoding should write plain integers");

    t.check(!StoreJson::historyFromJson(QJsonArray{QJsonObject{{"ts", 1}, {"state", "Maybe"}}}, &h),
            "unknown history state should be rejected");
}

void test_parse_serialize(TestContext &t) {
    StoreDocument doc;
    doc.master.saltB64 = "c2FsdA==";
    doc.master.check.nonceB64 = "bm9uY2U=";
    doc.master.check.ciphertextB64 = "Y3Q=";
    doc.lastLocalDir = "/home/alice/Downloads";

    StoredProfile s;
    s.name = "work";
    s.user = "bob";
    s.host = "h";
    s.auth.kind = AuthKind::PrivateKey;
    s.auth.keyPath = "/k/id_ed25519";
    s.auth.hasSecret = false;
    s.history = {success(42)};
    s.lastRemoteDir = "/srv";
    doc.profiles.push_back(s);

    StoreDocument back;
    ClientError err;
    t.check(StoreJson::parse(StoreJson::serialize(doc), &back, &err),
            "serialized document should parse: " + err.message);
    t.check(back == doc, "parse(serialize(doc)) should equal doc");

    t.check(!StoreJson::parse("{ not json", &back, &err), "invalid JSON should fail");
    t.check(err.kind == ErrorKind::StoreIoFailure, "invalid JSON should be StoreIoFailure");

    QJsonObject root = QJsonDocument::fromJson(StoreJson::serialize(doc)).object();
    root["unknown_field"] = "ignored";
    t.check(StoreJson::parse(QJsonDocument(root).toJson(), &back, &err),
            "unknown fields should be ignored");
}

// Scenario: rotating the master re-encrypts every secret.
void test_master_rotation(TestContext &t, const QString &dir) {
    const QString path = dir + "/d/config.json";
    {
        ProfileStore store(path);
        store.initialize("old", "old");
        store.upsert(makePasswordProfile("a", "h1", "pa"));
        store.upsert(keyProfile("b", "h2", "/k/b", "phrase"));
        store.upsert(keyProfile("c", "h3", "/k/c", ""));

        ClientError err;
        t.check(!store.changeMaster("wrong", "new", "new", &err),
                "changeMaster should reject a wrong current password");
        t.check(err.kind == ErrorKind::MasterMismatch, "wrong current should be MasterMismatch");
        t.check(!store.changeMaster("old", "new", "typo", &err),
                "changeMaster should reject a mismatched confirmation");
        t.check(store.changeMaster("old", "new", "new", &err),
                "changeMaster should succeed: " + err.message);
    }

    ProfileStore oldMaster(path);
    t.check(!oldMaster.unlock("old"), "store should no longer open with the old master");

    ProfileStore store(path);
    t.check(store.unlock("new"), "store should open with the new master");
    t.check(store.count() == 3, "all three profiles should survive rotation");

    for (const SshProfile &p : store.profiles()) {
        if (p.user == "a")
            t.check(p.auth.secret == "pa", "password should survive rotation");
        else if (p.user == "b")
            t.check(p.auth.secret == "phrase", "passphrase should survive rotation");
        else if (p.user == "c")
            t.check(p.auth.secret.isEmpty() && !p.auth.hasPassphrase(),
                    "key without passphrase should stay without one");
    }
}

void test_mutations(TestContext &t, const QString &dir) {
    const QString path = dir + "/e/config.json";
    ProfileStore store(path);
    store.initialize("m", "m");

    SshProfile p = makePasswordProfile("alice", "h", "one");
    store.upsert(p);
    p.auth.secret = "two";
    store.upsert(p);
    t.check(store.count() == 1, "upsert with the same identity should replace");
    t.check(store.at(0)->auth.secret == "two", "upsert should store the new secret");

    ClientError err;
    t.check(store.appendHistory(p, HistoryState::Failure, 100, &err),
            "appendHistory should succeed for a known identity");
    t.check(store.at(0)->history.size() == 1 &&
                store.at(0)->history[0].state == HistoryState::Failure,
            "appendHistory should record a Failure entry");

    SshProfile stranger = makePasswordProfile("bob", "h", "x");
    t.check(!store.appendHistory(stranger, HistoryState::Success, 0, &err),
            "appendHistory should fail for an unknown identity");
    t.check(err.kind == ErrorKind::InvalidState, "unknown identity should be InvalidState");

    t.check(store.rememberRemoteDir(p, "/srv/www"), "rememberRemoteDir should save");
    t.check(store.rememberLocalDir(dir), "rememberLocalDir should save");

    SshProfile edited = makePasswordProfile("alice", "h2", "three");
    edited.name = "renamed";
    t.check(store.editAt(0, edited, &err), "editAt should succeed");
    t.check(store.at(0)->host == "h2" && store.at(0)->name == "renamed",
            "editAt should apply the new fields");
    t.check(store.at(0)->history.size() == 1, "editAt should keep the history");
    t.check(store.at(0)->lastRemoteDir == "/srv/www", "editAt should keep the last remote dir");

    ProfileStore reopened(path);
    reopened.unlock("m");
    t.check(reopened.lastLocalDir() == dir, "last local dir should persist");
    t.check(reopened.count() == 1 && reopened.at(0)->lastRemoteDir == "/srv/www",
            "last remote dir should persist");

    t.check(store.removeAt(0, &err), "removeAt should succeed");
    t.check(store.count() == 0, "removeAt should drop the profile");
    t.check(!store.removeAt(0, &err), "removeAt on an empty store should fail");
}

void test_known_key_candidates(TestContext &t, const QString &dir) {
    ProfileStore store(dir + "/f/config.json");
    store.initialize("m", "m");
    store.upsert(keyProfile("a", "h1", "/k/shared", "first"));
    store.upsert(keyProfile("b", "h2", "/k/shared", "second"));
    store.upsert(keyProfile("c", "h3", "/k/other", ""));
    store.upsert(makePasswordProfile("d", "h4", "pw"));

    const QVector<KeyCandidate> keys = store.knownKeyCandidates();
    t.check(keys.size() == 2, "key candidates should be unique by path");

    bool sawShared = false;
    for (const KeyCandidate &k : keys) {
        if (k.path == "/k/shared") {
            sawShared = true;
            t.check(k.passphrase == "first", "first passphrase for a path should win");
        }
    }
    t.check(sawShared, "shared key path should be listed");
}

void test_profile_builder(TestContext &t) {
    ProfileDraft d;
    d.name = "  work  ";
    d.user = " alice ";
    d.host = " h.example ";
    d.password = "pw";

    SshProfile p;
    ClientError err;
    t.check(buildProfile(d, &p, &err), "password draft should build");
    t.check(p.user == "alice" && p.host == "h.example" && p.name == "work",
            "builder should trim name, user and host");
    t.check(p.history.isEmpty(), "built profile should have no history");

    d.user.clear();
    t.check(!buildProfile(d, &p, &err), "empty user should be rejected");
    t.check(err.kind == ErrorKind::ConfigMissingField && err.message == "User is required",
            "empty user should name the field");

    d.user = "alice";
    d.authKind = DraftAuthKind::PrivateKey;
    t.check(!buildProfile(d, &p, &err), "key auth without a path should be rejected");

    d.keyPath = "/k/id";
    d.authKind = DraftAuthKind::PrivateKeyWithPassword;
    d.password.clear();
    t.check(!buildProfile(d, &p, &err), "key with passphrase needs the passphrase");

    d.password = "phrase";
    t.check(buildProfile(d, &p, &err), "key with passphrase should build");
    t.check(p.auth.kind == AuthKind::PrivateKey && p.auth.secret == "phrase",
            "passphrase should be carried into the auth config");

    const ProfileDraft back = ProfileDraft::fromProfile(p);
    t.check(back.authKind == DraftAuthKind::PrivateKeyWithPassword && back.keyPath == "/k/id",
            "fromProfile should restore the auth kind and key path");
}

void test_identity_and_labels(TestContext &t) {
    SshProfile a = makePasswordProfile("alice", "h", "one");
    SshProfile b = makePasswordProfile("alice", "h", "two");
    t.check(sameIdentity(a, b), "secrets should not take part in identity");
    t.check(profileKey(a) == "alice@h|pw", "password profile key format");

    SshProfile k = a;
    k.auth = AuthConfig::privateKey("/k/id");
    t.check(!sameIdentity(a, k), "auth kind should take part in identity");
    t.check(profileKey(k) == "alice@h|pk:/k/id", "key profile key format");

    t.check(a.label() == "h", "label should fall back to the host");
    a.name = "prod";
    t.check(a.label() == "prod", "label should prefer the name");

    HistoryEntry e;
    e.ts = 0;
    e.state = HistoryState::Failure;
    t.check(formatHistoryEntry(e).endsWith(" | failed"), "failure should format as 'failed'");
    e.state = HistoryState::Success;
    t.check(formatHistoryEntry(e).endsWith(" | success"), "success should format as 'success'");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;

    QTemporaryDir tmp;
    t.check(tmp.isValid(), "temporary directory should be available");

    test_create_and_verify(t, tmp.path());
    test_initialize_validation(t, tmp.path());
    test_history_ordering(t, tmp.path());
    test_legacy_history(t);
    test_parse_serialize(t);
    test_master_rotation(t, tmp.path());
    test_mutations(t, tmp.path());
    test_known_key_candidates(t, tmp.path());
    test_profile_builder(t);
    test_identity_and_labels(t);

    return t.finish("profile_store_tests");
}
