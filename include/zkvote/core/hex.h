// ZKVOTE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_CORE_HEX_H
#define ZKVOTE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <optional>
#include <stdexcept>

namespace zkvote {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. An optional "0x" prefix is accepted.
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is valid, non-empty hex
bool IsValidHex(const std::string& str);

} // namespace zkvote

#endif // ZKVOTE_CORE_HEX_H
