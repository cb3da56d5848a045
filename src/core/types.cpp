// CHAMA - Core Types Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/core/types.h"
#include "chama/core/hex.h"

#include <cctype>
#include <limits>

namespace chama {

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    bool negative = amount < 0;
    // Work in unsigned to survive INT64_MIN
    uint64_t abs = negative ? static_cast<uint64_t>(-(amount + 1)) + 1
                            : static_cast<uint64_t>(amount);
    uint64_t whole = abs / static_cast<uint64_t>(COIN);
    uint64_t frac = abs % static_cast<uint64_t>(COIN);

    std::string fracStr = std::to_string(frac);
    fracStr.insert(0, 8 - fracStr.size(), '0');

    return (negative ? "-" : "") + std::to_string(whole) + "." + fracStr;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dotPos = str.find('.');
    std::string wholePart = (dotPos != std::string::npos) ? str.substr(0, dotPos) : str;
    std::string fracPart = (dotPos != std::string::npos) ? str.substr(dotPos + 1) : "";

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (fracPart.size() > 8) {
        return std::nullopt;
    }
    for (char c : wholePart + fracPart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    fracPart.append(8 - fracPart.size(), '0');

    // Cap the whole part before multiplying
    if (wholePart.size() > 10) {
        return std::nullopt;
    }
    int64_t whole = wholePart.empty() ? 0 : std::stoll(wholePart);
    int64_t frac = std::stoll(fracPart);

    Amount amount = whole * COIN + frac;
    if (!MoneyRange(amount)) {
        return std::nullopt;
    }
    return amount;
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
std::optional<BaseHash<BITS>> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        return std::nullopt;
    }
    auto bytes = HexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return BaseHash(bytes->data(), bytes->size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Address Implementation
// ============================================================================

std::optional<Address> Address::FromString(const std::string& str) {
    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    auto parsed = BaseHash<160>::FromHex(hex);
    if (!parsed) {
        return std::nullopt;
    }
    return Address(Hash160(*parsed));
}

} // namespace chama
