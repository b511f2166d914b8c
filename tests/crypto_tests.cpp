// CryptoBox tests: key derivation, AES-GCM sealing and the master verifier.
#include "CryptoBox.h"
#include "TestSupport.h"

#include <QCoreApplication>

namespace {

QByteArray fixedSalt() {
    return QByteArray(CryptoBox::kSaltBytes, '\x11');
}

void test_derive_key_is_deterministic(TestContext &t) {
    QByteArray a, b, c;
    ClientError err;
    t.check(CryptoBox::deriveKey("s3cret", fixedSalt(), &a, &err),
            "deriveKey should succeed");
    t.check(CryptoBox::deriveKey("s3cret", fixedSalt(), &b, &err),
            "deriveKey should succeed twice");
    t.check(CryptoBox::deriveKey("other", fixedSalt(), &c, &err),
            "deriveKey should succeed for another password");

    t.check(a.size() == CryptoBox::kKeyBytes, "derived key should be 32 bytes");
    t.check(a == b, "same password and salt should give the same key");
    t.check(a != c, "different passwords should give different keys");
}

void test_encrypt_decrypt_roundtrip(TestContext &t) {
    QByteArray key;
    t.check(CryptoBox::deriveKey("pw", fixedSalt(), &key),
            "deriveKey should succeed before roundtrip");

    const QStringList samples = {
        "p", "", "correct horse battery staple",
        QString::fromUtf8("p\xC3\xA4ss w\xC3\xB6rd \xE2\x9C\x93")};

    for (const QString &plain : samples) {
        CryptoBox::EncryptedBlob blob;
        QString back;
        ClientError err;
        t.check(CryptoBox::encryptString(key, plain, &blob, &err),
                "encrypt should succeed for '" + plain + "'");
        t.check(CryptoBox::decryptString(key, blob, &back, &err),
                "decrypt should succeed for '" + plain + "'");
        t.check(back == plain, "decrypted text should equal the original");

        const QByteArray nonce = QByteArray::fromBase64(blob.nonceB64.toLatin1());
        const QByteArray ct = QByteArray::fromBase64(blob.ciphertextB64.toLatin1());
        t.check(nonce.size() == CryptoBox::kNonceBytes, "nonce should be 12 bytes");
        t.check(ct.size() == plain.toUtf8().size() + CryptoBox::kTagBytes,
                "ciphertext should be plaintext length plus the 16-byte tag");
    }
}

void test_fresh_nonce_per_encryption(TestContext &t) {
    QByteArray key;
    CryptoBox::deriveKey("pw", fixedSalt(), &key);

    CryptoBox::EncryptedBlob a, b;
    CryptoBox::encryptString(key, "same", &a);
    CryptoBox::encryptString(key, "same", &b);
    t.check(a.nonceB64 != b.nonceB64, "two encryptions should use different nonces");
    t.check(a.ciphertextB64 != b.ciphertextB64,
            "two encryptions of the same text should differ");
}

void test_tampering_is_detected(TestContext &t) {
    QByteArray key;
    CryptoBox::deriveKey("pw", fixedSalt(), &key);

    CryptoBox::EncryptedBlob blob;
    CryptoBox::encryptString(key, "secret", &blob);

    QByteArray ct = QByteArray::fromBase64(blob.ciphertextB64.toLatin1());
    ct[0] = static_cast<char>(ct[0] ^ 0x01);
    CryptoBox::EncryptedBlob tampered = blob;
    tampered.ciphertextB64 = QString::fromLatin1(ct.toBase64());

    QString out;
    ClientError err;
    t.check(!CryptoBox::decryptString(key, tampered, &out, &err),
            "decrypt should fail on a flipped ciphertext bit");
    t.check(err.kind == ErrorKind::CryptoFailure, "tampering should be CryptoFailure");

    QByteArray otherKey;
    CryptoBox::deriveKey("other", fixedSalt(), &otherKey);
    err = ClientError();
    t.check(!CryptoBox::decryptString(otherKey, blob, &out, &err),
            "decrypt should fail under the wrong key");
    t.check(err.kind == ErrorKind::CryptoFailure, "wrong key should be CryptoFailure");
}

void test_bad_base64_is_rejected(TestContext &t) {
    QByteArray key;
    CryptoBox::deriveKey("pw", fixedSalt(), &key);

    CryptoBox::EncryptedBlob blob;
    CryptoBox::encryptString(key, "secret", &blob);
    blob.nonceB64 = "***not base64***";

    QString out;
    ClientError err;
    t.check(!CryptoBox::decryptString(key, blob, &out, &err),
            "decrypt should fail on invalid base64");
    t.check(err.kind == ErrorKind::CryptoFailure, "bad base64 should be CryptoFailure");
}

void test_master_verifier(TestContext &t) {
    CryptoBox::MasterConfig master;
    QByteArray key;
    ClientError err;
    t.check(CryptoBox::createMaster("s3cret", &master, &key, &err),
            "createMaster should succeed");
    t.check(QByteArray::fromBase64(master.saltB64.toLatin1()).size() == CryptoBox::kSaltBytes,
            "salt should be 16 bytes");

    QByteArray unlocked;
    t.check(CryptoBox::unlockMaster("s3cret", master, &unlocked, &err),
            "unlockMaster should accept the right password");
    t.check(unlocked == key, "unlocked key should match the created key");

    err = ClientError();
    t.check(!CryptoBox::unlockMaster("bad", master, &unlocked, &err),
            "unlockMaster should reject a wrong password");
    t.check(err.kind == ErrorKind::MasterMismatch, "wrong master should be MasterMismatch");

    CryptoBox::MasterConfig other;
    QByteArray otherKey;
    CryptoBox::createMaster("s3cret", &other, &otherKey);
    t.check(other.saltB64 != master.saltB64, "each master setup should get a new salt");
}

void test_wipe_clears_buffer(TestContext &t) {
    QByteArray key(32, 'k');
    CryptoBox::wipe(key);
    t.check(key.isEmpty(), "wipe should leave an empty buffer");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;

    test_derive_key_is_deterministic(t);
    test_encrypt_decrypt_roundtrip(t);
    test_fresh_nonce_per_encryption(t);
    test_tampering_is_detected(t);
    test_bad_base64_is_rejected(t);
    test_master_verifier(t);
    test_wipe_clears_buffer(t);

    return t.finish("crypto_tests");
}
