// CHAMA - Core Types Header
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Fundamental value types shared by the engine, registry and storage:
// amounts in base units, timestamps, fixed-size hashes and account addresses.

#ifndef CHAMA_CORE_TYPES_H
#define CHAMA_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace chama {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest indivisible units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// 1 coin = 100 million base units
constexpr Amount COIN = 100000000LL;

/// Upper bound on any single amount handled by the engine
constexpr Amount MAX_MONEY = 1000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// Format amount as a decimal coin string (e.g., "0.01000000")
std::string FormatAmount(Amount amount);

/// Parse a decimal coin string ("0.1", "12", "0.00000001") to base units
std::optional<Amount> ParseAmount(const std::string& str);

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size byte string. Zero-filled means "null".
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse hex in storage order. Returns nullopt on bad length or digit.
    static std::optional<BaseHash> FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& other) : BaseHash<256>(other) {}
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& other) : BaseHash<160>(other) {}
};

// ============================================================================
// Address
// ============================================================================

/// Account identifier for members, creators, groups and token assets.
/// The all-zero address is the null address.
class Address : public Hash160 {
public:
    Address() = default;
    explicit Address(const Hash160& h) : Hash160(h) {}
    Address(const Byte* data, size_t len) noexcept : Hash160(data, len) {}

    /// "0x"-prefixed hex form
    std::string ToString() const { return "0x" + ToHex(); }

    /// Accepts hex with or without the "0x" prefix
    static std::optional<Address> FromString(const std::string& str);

    /// The null address
    static Address Null() { return Address(); }
};

} // namespace chama

#endif // CHAMA_CORE_TYPES_H
