/**
 * SEL: Sweets Economy Ledger - Error Taxonomy
 * Purpose: Typed failures for declined financial actions and infrastructure
 * faults. Everything derives from LedgerError so call sites can catch the
 * family once and branch on code().
 */

#ifndef SEL_ERRORS_HPP
#define SEL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sel {

enum class ErrorCode {
    InsufficientBalance,
    InvalidEntrySet,
    AlreadyRefunded,
    CapExceeded,
    StoreUnavailable,
    NotificationFailed,
    WalletNotFound,
    NotFound,
    DuplicateIdempotencyKey
};

std::string to_string(ErrorCode code);

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InsufficientBalance : public LedgerError {
public:
    explicit InsufficientBalance(const std::string& message)
        : LedgerError(ErrorCode::InsufficientBalance, message) {}
};

class InvalidEntrySet : public LedgerError {
public:
    explicit InvalidEntrySet(const std::string& message)
        : LedgerError(ErrorCode::InvalidEntrySet, message) {}
};

class AlreadyRefunded : public LedgerError {
public:
    explicit AlreadyRefunded(const std::string& message)
        : LedgerError(ErrorCode::AlreadyRefunded, message) {}
};

class CapExceeded : public LedgerError {
public:
    explicit CapExceeded(const std::string& message)
        : LedgerError(ErrorCode::CapExceeded, message) {}
};

// Transient infrastructure failure. Safe to retry on the next scheduled run.
class StoreUnavailable : public LedgerError {
public:
    explicit StoreUnavailable(const std::string& message)
        : LedgerError(ErrorCode::StoreUnavailable, message) {}
};

// Non-fatal: never blocks or reverses the debit that triggered it.
class NotificationFailed : public LedgerError {
public:
    explicit NotificationFailed(const std::string& message)
        : LedgerError(ErrorCode::NotificationFailed, message) {}
};

class WalletNotFound : public LedgerError {
public:
    explicit WalletNotFound(const std::string& wallet_id)
        : LedgerError(ErrorCode::WalletNotFound, "Wallet not found: " + wallet_id) {}
};

class NotFound : public LedgerError {
public:
    explicit NotFound(const std::string& message)
        : LedgerError(ErrorCode::NotFound, message) {}
};

// Raised by a store session at commit when another session already
// committed the same idempotency key. The engine turns it into a replay.
class DuplicateIdempotencyKey : public LedgerError {
public:
    explicit DuplicateIdempotencyKey(const std::string& key)
        : LedgerError(ErrorCode::DuplicateIdempotencyKey, "Idempotency key already committed: " + key) {}
};

} // namespace sel

#endif // SEL_ERRORS_HPP
