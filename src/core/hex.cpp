// ZKVOTE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/core/hex.h"
#include "zkvote/core/types.h"

namespace zkvote {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline std::string StripPrefix(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return hex.substr(2);
        }
        return hex;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& input) {
    std::string hex = StripPrefix(input);
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        throw std::invalid_argument("Invalid hex string: " + hex);
    }
    return std::move(*bytes);
}

bool IsValidHex(const std::string& input) {
    std::string str = StripPrefix(input);
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// BaseHash hex conversion
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::vector<uint8_t> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Expected " + std::to_string(SIZE) +
                                    " bytes of hex, got " + std::to_string(bytes.size()));
    }
    return BaseHash<BITS>(bytes.data(), bytes.size());
}

template class BaseHash<256>;

} // namespace zkvote
