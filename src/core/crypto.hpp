/**
 * SEL: Sweets Economy Ledger - Cryptographic Module Header
 * Purpose: Defines the SHA-256 hashing interface for the per-wallet entry
 * seal chain, plus identifier generation.
 */

#ifndef SEL_CRYPTO_HPP
#define SEL_CRYPTO_HPP

#include <string>
#include "types.hpp"

namespace sel {

class SELCrypto {
public:
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_entry_seal
     * Bonds an entry to the previous entry of the same wallet. The seal
     * covers the transaction and wallet ids, the direction, the amount and
     * the resulting balance.
     */
    static std::string calculate_entry_seal(const std::string& prev_seal, const LedgerEntry& entry);

    /**
     * generate_random_string
     * Alphanumeric string from a per-thread generator.
     */
    static std::string generate_random_string(int length);

    // Prefixed identifier, e.g. "tx_3fQ9...".
    static std::string generate_id(const std::string& prefix);
};

} // namespace sel

#endif
