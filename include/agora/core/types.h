// AGORA - Core Types Header
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// This file defines fundamental types used throughout AGORA.

#ifndef AGORA_CORE_TYPES_H
#define AGORA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace agora {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units
using Amount = int64_t;

/// Block height
using Height = int64_t;

/// Unsigned 128-bit integer for fixed-point arithmetic
__extension__ typedef unsigned __int128 uint128_t;

/// Constants
constexpr Amount COIN = 1000000LL;  // 1 token = 10^6 base units
constexpr Amount MAX_MONEY = 1000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic hash template
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
    
    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }
    
    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        // Compare in reverse order (most significant byte last in storage)
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }
    
    /// Convert to hex string (displayed in reverse byte order)
    std::string ToHex() const;
    
    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

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
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - for account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}
    
    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account address (stakers, voters, poll creators, owned contracts)
using AccountId = Hash160;

/// Format a 128-bit unsigned value as decimal
std::string Uint128ToString(uint128_t value);

} // namespace agora

#endif // AGORA_CORE_TYPES_H
