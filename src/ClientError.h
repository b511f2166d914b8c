#pragma once

#include <QString>

// ClientError
// -----------
// Structured error passed through the optional `ClientError* err`
// out-parameter of every fallible core call. `kind` says what went wrong,
// `message` is the human-readable detail shown in notices and logs.
//
// Never put secrets into `message`.

enum class ErrorKind {
    None,
    ConfigMissingField,   // builder rejected an empty required field
    MasterMismatch,       // verifier did not decrypt to the check string
    CryptoFailure,        // GCM tag mismatch, bad base64, non-UTF-8 plaintext
    StoreIoFailure,       // read/write/parse error on the store file
    DialFailure,          // DNS, TCP connect, handshake or authentication
    SftpFailure,          // any remote filesystem operation
    LocalIoFailure,       // local filesystem during a transfer or size walk
    Cancelled,            // cooperative cancel observed mid-transfer
    InvalidState          // command issued in a step where it is undefined
};

struct ClientError
{
    ErrorKind kind = ErrorKind::None;
    QString   message;

    bool isError() const { return kind != ErrorKind::None; }
};

static inline QString errorKindName(ErrorKind k)
{
    switch (k) {
        case ErrorKind::None:               return "None";
        case ErrorKind::ConfigMissingField: return "ConfigMissingField";
        case ErrorKind::MasterMismatch:     return "MasterMismatch";
        case ErrorKind::CryptoFailure:      return "CryptoFailure";
        case ErrorKind::StoreIoFailure:     return "StoreIoFailure";
        case ErrorKind::DialFailure:        return "DialFailure";
        case ErrorKind::SftpFailure:        return "SftpFailure";
        case ErrorKind::LocalIoFailure:     return "LocalIoFailure";
        case ErrorKind::Cancelled:          return "Cancelled";
        case ErrorKind::InvalidState:       return "InvalidState";
    }
    return "Unknown";
}

// Fill `err` (if provided) and return false so call sites can write
// `return failWith(err, ErrorKind::X, "...");`
static inline bool failWith(ClientError* err, ErrorKind kind, const QString& message)
{
    if (err) {
        err->kind = kind;
        err->message = message;
    }
    return false;
}

static inline void clearError(ClientError* err)
{
    if (err) *err = ClientError{};
}
