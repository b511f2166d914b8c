// CryptoBox.cpp
//
// SECURITY MODEL (high level)
// ---------------------------
// - User supplies one master password.
// - We derive a symmetric key with PBKDF2-HMAC-SHA256 (OpenSSL) from a random
//   16-byte salt that is persisted next to the profiles.
// - Each secret is encrypted with AES-256-GCM (OpenSSL EVP) under a fresh random
//   12-byte nonce. The 16-byte tag is appended to the ciphertext.
// - Possession of the key is proven by decrypting the verifier blob to
//   "ssh-client-check"; nothing else about the password is stored.
//
// GOTCHAS
// -------
// 1) KDF parameters are fixed. Changing the iteration count makes every existing
//    store undecryptable unless the parameter is persisted.
// 2) No associated data is used; the nonce is bound through GCM itself.
// 3) Randomness comes from randombytes_buf() (libsodium CSPRNG). No manual RNG.
// 4) Intermediate plaintext buffers are wiped with sodium_memzero().
//
// IMPORTANT: Do not log plaintext, passwords, or derived keys.

#include "CryptoBox.h"

#include <QTextCodec>

#include <openssl/evp.h>
#include <sodium.h>

namespace {

bool sodiumReady()
{
    // sodium_init() is idempotent and thread-safe; cache the outcome.
    static const bool ok = (sodium_init() >= 0);
    return ok;
}

bool decodeB64Strict(const QString& text, QByteArray* out)
{
    const auto r = QByteArray::fromBase64Encoding(text.toLatin1(),
                                                  QByteArray::AbortOnBase64DecodingErrors);
    if (r.decodingStatus != QByteArray::Base64DecodingStatus::Ok)
        return false;
    *out = r.decoded;
    return true;
}

bool isValidUtf8(const QByteArray& bytes)
{
    QTextCodec* codec = QTextCodec::codecForName("UTF-8");
    if (!codec)
        return false;
    QTextCodec::ConverterState state;
    codec->toUnicode(bytes.constData(), bytes.size(), &state);
    return state.invalidChars == 0 && state.remainingChars == 0;
}

struct CipherCtx {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ~CipherCtx() { if (ctx) EVP_CIPHER_CTX_free(ctx); }
    CipherCtx() = default;
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

} // namespace

namespace CryptoBox {

QString checkString()
{
    return QStringLiteral("ssh-client-check");
}

QByteArray randomBytes(int n)
{
    QByteArray out(n, '\0');
    if (n <= 0)
        return out;
    if (!sodiumReady())
        return QByteArray();
    randombytes_buf(out.data(), static_cast<size_t>(out.size()));
    return out;
}

void wipe(QByteArray& bytes)
{
    if (!bytes.isEmpty()) {
        // data() detaches, so only this copy is scrubbed.
        sodium_memzero(bytes.data(), static_cast<size_t>(bytes.size()));
    }
    bytes.clear();
}

bool deriveKey(const QString& password,
               const QByteArray& salt,
               QByteArray* outKey,
               ClientError* err)
{
    clearError(err);
    if (!outKey)
        return failWith(err, ErrorKind::CryptoFailure, "No output buffer for key");

    if (salt.size() != kSaltBytes)
        return failWith(err, ErrorKind::CryptoFailure,
                        QString("Salt must be %1 bytes").arg(kSaltBytes));

    QByteArray pw = password.toUtf8();
    QByteArray key(kKeyBytes, '\0');

    // OpenSSL returns 1 on success.
    const int ok = PKCS5_PBKDF2_HMAC(
        pw.constData(), pw.size(),
        reinterpret_cast<const unsigned char*>(salt.constData()), salt.size(),
        kPbkdf2Iterations,
        EVP_sha256(),
        key.size(),
        reinterpret_cast<unsigned char*>(key.data()));

    wipe(pw);

    if (ok != 1) {
        wipe(key);
        return failWith(err, ErrorKind::CryptoFailure, "PBKDF2 key derivation failed");
    }

    *outKey = key;
    return true;
}

bool encryptString(const QByteArray& key,
                   const QString& plain,
                   EncryptedBlob* out,
                   ClientError* err)
{
    clearError(err);
    if (!out)
        return failWith(err, ErrorKind::CryptoFailure, "No output blob");
    if (key.size() != kKeyBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Invalid key length");

    const QByteArray nonce = randomBytes(kNonceBytes);
    if (nonce.size() != kNonceBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Random generator unavailable");

    QByteArray pt = plain.toUtf8();

    CipherCtx c;
    if (!c.ctx) {
        wipe(pt);
        return failWith(err, ErrorKind::CryptoFailure, "EVP_CIPHER_CTX_new failed");
    }

    QByteArray ct(pt.size() + kTagBytes, '\0');
    int len = 0;
    int total = 0;

    bool ok =
        EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, kNonceBytes, nullptr) == 1
        && EVP_EncryptInit_ex(c.ctx, nullptr, nullptr,
                              reinterpret_cast<const unsigned char*>(key.constData()),
                              reinterpret_cast<const unsigned char*>(nonce.constData())) == 1;

    if (ok) {
        ok = EVP_EncryptUpdate(c.ctx,
                               reinterpret_cast<unsigned char*>(ct.data()), &len,
                               reinterpret_cast<const unsigned char*>(pt.constData()),
                               pt.size()) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(c.ctx,
                                 reinterpret_cast<unsigned char*>(ct.data()) + total,
                                 &len) == 1;
        total += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, kTagBytes,
                                 ct.data() + total) == 1;
    }

    wipe(pt);

    if (!ok)
        return failWith(err, ErrorKind::CryptoFailure, "AES-256-GCM encrypt failed");

    ct.resize(total + kTagBytes);

    out->nonceB64      = QString::fromLatin1(nonce.toBase64());
    out->ciphertextB64 = QString::fromLatin1(ct.toBase64());
    return true;
}

bool decryptString(const QByteArray& key,
                   const EncryptedBlob& blob,
                   QString* outPlain,
                   ClientError* err)
{
    clearError(err);
    if (!outPlain)
        return failWith(err, ErrorKind::CryptoFailure, "No output string");
    if (key.size() != kKeyBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Invalid key length");

    QByteArray nonce;
    QByteArray ct;
    if (!decodeB64Strict(blob.nonceB64, &nonce) || !decodeB64Strict(blob.ciphertextB64, &ct))
        return failWith(err, ErrorKind::CryptoFailure, "Invalid base64 in encrypted blob");

    if (nonce.size() != kNonceBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Invalid nonce length");
    if (ct.size() < kTagBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Ciphertext too small");

    const int bodyLen = ct.size() - kTagBytes;
    QByteArray tag = ct.mid(bodyLen);

    CipherCtx c;
    if (!c.ctx)
        return failWith(err, ErrorKind::CryptoFailure, "EVP_CIPHER_CTX_new failed");

    QByteArray pt(bodyLen, '\0');
    int len = 0;
    int total = 0;

    bool ok =
        EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, kNonceBytes, nullptr) == 1
        && EVP_DecryptInit_ex(c.ctx, nullptr, nullptr,
                              reinterpret_cast<const unsigned char*>(key.constData()),
                              reinterpret_cast<const unsigned char*>(nonce.constData())) == 1;

    if (ok) {
        ok = EVP_DecryptUpdate(c.ctx,
                               reinterpret_cast<unsigned char*>(pt.data()), &len,
                               reinterpret_cast<const unsigned char*>(ct.constData()),
                               bodyLen) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, kTagBytes, tag.data()) == 1;
    }
    if (ok) {
        // Tag verification happens here.
        ok = EVP_DecryptFinal_ex(c.ctx,
                                 reinterpret_cast<unsigned char*>(pt.data()) + total,
                                 &len) > 0;
        total += len;
    }

    if (!ok) {
        wipe(pt);
        return failWith(err, ErrorKind::CryptoFailure,
                        "Decrypt failed (wrong key or corrupted data)");
    }

    pt.resize(total);
    if (!isValidUtf8(pt)) {
        wipe(pt);
        return failWith(err, ErrorKind::CryptoFailure, "Decrypted data is not UTF-8");
    }

    *outPlain = QString::fromUtf8(pt);
    wipe(pt);
    return true;
}

bool createMaster(const QString& password,
                  MasterConfig* outConfig,
                  QByteArray* outKey,
                  ClientError* err)
{
    clearError(err);
    if (!outConfig || !outKey)
        return failWith(err, ErrorKind::CryptoFailure, "No output for master config");

    const QByteArray salt = randomBytes(kSaltBytes);
    if (salt.size() != kSaltBytes)
        return failWith(err, ErrorKind::CryptoFailure, "Random generator unavailable");

    QByteArray key;
    if (!deriveKey(password, salt, &key, err))
        return false;

    EncryptedBlob check;
    if (!encryptString(key, checkString(), &check, err)) {
        wipe(key);
        return false;
    }

    outConfig->saltB64 = QString::fromLatin1(salt.toBase64());
    outConfig->check   = check;
    *outKey = key;
    return true;
}

bool unlockMaster(const QString& password,
                  const MasterConfig& config,
                  QByteArray* outKey,
                  ClientError* err)
{
    clearError(err);
    if (!outKey)
        return failWith(err, ErrorKind::CryptoFailure, "No output buffer for key");

    QByteArray salt;
    if (!decodeB64Strict(config.saltB64, &salt))
        return failWith(err, ErrorKind::CryptoFailure, "Invalid base64 in master salt");

    QByteArray key;
    if (!deriveKey(password, salt, &key, err))
        return false;

    QString plain;
    if (!decryptString(key, config.check, &plain, nullptr) || plain != checkString()) {
        wipe(key);
        return failWith(err, ErrorKind::MasterMismatch, "Incorrect master password");
    }

    *outKey = key;
    return true;
}

} // namespace CryptoBox
