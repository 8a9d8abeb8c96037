// STAKEVOTE - Core Types Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/core/types.h"

namespace stakevote {

namespace {

int HexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

} // namespace

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
bool BaseHash<BITS>::TryParseHex(const std::string& hex, BaseHash& out) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        return false;
    }

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        int high = HexNibble(digits[i * 2]);
        int low = HexNibble(digits[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }

    out = result;
    return true;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    BaseHash result;
    if (!TryParseHex(hex, result)) {
        throw std::invalid_argument("Invalid hex string for " +
                                    std::to_string(BITS) + "-bit value: " + hex);
    }
    return result;
}

// Explicit template instantiations
template class BaseHash<160>;

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::ToShortString() const {
    std::string hex = ToHex();
    return hex.substr(0, 6) + "..." + hex.substr(hex.size() - 4);
}

} // namespace stakevote
