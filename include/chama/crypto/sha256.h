// CHAMA - SHA256 Hash Function
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Incremental SHA-256 over OpenSSL's EVP digest interface. Used to chain
// journal entries and to derive deterministic group and account addresses.

#ifndef CHAMA_CRYPTO_SHA256_H
#define CHAMA_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "chama/core/types.h"

// Forward declaration to keep OpenSSL out of the public header
struct evp_md_ctx_st;

namespace chama {

/// SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }

    /// Finalize the hash. The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// Derive a stable address from a human label (first 20 bytes of SHA-256).
/// Used by the CLI and tests to name accounts.
Address AddressFromLabel(const std::string& label);

} // namespace chama

#endif // CHAMA_CRYPTO_SHA256_H
