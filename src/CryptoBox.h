#pragma once
#include <QByteArray>
#include <QString>

#include "ClientError.h"

// =====================================================
// CryptoBox
// =====================================================
//
// Purpose
// -------
// Key derivation and authenticated encryption of short UTF-8 strings
// (profile passwords and key passphrases) for the encrypted profile store.
//
// What it DOES
// ------------
// - Derives a 32-byte master key from the master password and a stored salt
//   (PBKDF2-HMAC-SHA256, 100 000 iterations).
// - Encrypts / decrypts strings with AES-256-GCM under a fresh 12-byte nonce.
// - Creates and verifies the master verifier blob ("ssh-client-check").
//
// What it does NOT do
// -------------------
// - It does not read/write files; ProfileStore owns I/O.
// - It does not keep key material around; callers own the key bytes.
//
// Security notes
// --------------
// - Never log passwords, derived keys or plaintexts.
// - Callers wipe keys they no longer need with CryptoBox::wipe().
//
// Format notes
// ------------
// - EncryptedBlob holds base64 text: nonce (12 bytes) and ciphertext||tag
//   (plaintext length + 16 bytes).
//

namespace CryptoBox {

static constexpr int kSaltBytes        = 16;
static constexpr int kNonceBytes       = 12;
static constexpr int kKeyBytes         = 32;
static constexpr int kTagBytes         = 16;
static constexpr int kPbkdf2Iterations = 100000;

// Plaintext of the master verifier.
QString checkString();

struct EncryptedBlob {
    QString nonceB64;
    QString ciphertextB64;

    bool operator==(const EncryptedBlob& o) const
    {
        return nonceB64 == o.nonceB64 && ciphertextB64 == o.ciphertextB64;
    }
    bool operator!=(const EncryptedBlob& o) const { return !(*this == o); }
};

// Persisted part of the master secret: salt plus verifier.
struct MasterConfig {
    QString       saltB64;
    EncryptedBlob check;

    bool operator==(const MasterConfig& o) const
    {
        return saltB64 == o.saltB64 && check == o.check;
    }
};

// Cryptographic RNG (libsodium).
QByteArray randomBytes(int n);

// Overwrites the buffer contents and clears it.
void wipe(QByteArray& bytes);

// PBKDF2-HMAC-SHA256(password, salt, 100000) -> 32 bytes.
bool deriveKey(const QString& password,
               const QByteArray& salt,
               QByteArray* outKey,
               ClientError* err = nullptr);

bool encryptString(const QByteArray& key,
                   const QString& plain,
                   EncryptedBlob* out,
                   ClientError* err = nullptr);

// Fails with CryptoFailure on bad base64, wrong sizes, tag mismatch or
// non-UTF-8 plaintext.
bool decryptString(const QByteArray& key,
                   const EncryptedBlob& blob,
                   QString* outPlain,
                   ClientError* err = nullptr);

// First setup: new salt, derived key and verifier.
bool createMaster(const QString& password,
                  MasterConfig* outConfig,
                  QByteArray* outKey,
                  ClientError* err = nullptr);

// Accepts the password only when the verifier decrypts to checkString().
// Anything else is MasterMismatch.
bool unlockMaster(const QString& password,
                  const MasterConfig& config,
                  QByteArray* outKey,
                  ClientError* err = nullptr);

} // namespace CryptoBox
