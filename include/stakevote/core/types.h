// STAKEVOTE - Core Types Header
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// This file defines fundamental types used throughout STAKEVOTE.

#ifndef STAKEVOTE_CORE_TYPES_H
#define STAKEVOTE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace stakevote {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest ledger units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Sequential project identifier (0 is never assigned)
using ProjectId = uint64_t;

/// Constants
constexpr Amount COIN = 100000000LL;  // 1 token = 100 million base units
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Template
// ============================================================================

/// Fixed-size opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Byte-wise ordering in storage order (stable key order for maps and db keys)
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string in storage order
    std::string ToHex() const;

    /// Parse from hex string (accepts an optional 0x prefix)
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

    /// Non-throwing parse
    static bool TryParseHex(const std::string& hex, BaseHash& out);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Address
// ============================================================================

/// 160-bit participant / account identifier
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }

    /// Short form for logs ("1a2b3c...9f")
    std::string ToShortString() const;
};

} // namespace stakevote

#endif // STAKEVOTE_CORE_TYPES_H
