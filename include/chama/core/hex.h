// CHAMA - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 CHAMA Developers
// MIT License

#ifndef CHAMA_CORE_HEX_H
#define CHAMA_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chama {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes. Returns nullopt on odd length or bad digit.
std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex);

/// Check if string is valid hex (even length, hex digits only)
bool IsValidHex(const std::string& str);

} // namespace chama

#endif // CHAMA_CORE_HEX_H
