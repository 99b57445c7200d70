#include "crypto.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <iomanip>
#include <sstream>
#include <random>
#include <stdexcept>

namespace sel {

std::string SELCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), NULL) == 1 &&
              EVP_DigestUpdate(context, str.c_str(), str.size()) == 1 &&
              EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string SELCrypto::calculate_entry_seal(const std::string& prev_seal, const LedgerEntry& entry) {
    std::stringstream data;
    data << prev_seal
         << entry.transaction_id
         << entry.wallet_id
         << to_string(entry.direction)
         << entry.amount
         << entry.balance_after;

    return generate_sha256(data.str());
}

std::string SELCrypto::generate_random_string(int length) {
    static const std::string charset = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 generator(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dist(0, charset.size() - 1);

    std::string str;
    for (int i = 0; i < length; ++i) str += charset[dist(generator)];
    return str;
}

std::string SELCrypto::generate_id(const std::string& prefix) {
    return prefix + "_" + generate_random_string(20);
}

} // namespace sel
