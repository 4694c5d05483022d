// AGORA - Core Types Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/types.h"
#include "agora/core/hex.h"

namespace agora {

// ============================================================================
// BaseHash Implementation
// ============================================================================

// Hashes display most significant byte first, the reverse of storage order

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::vector<Byte> reversed(data_.rbegin(), data_.rend());
    return BytesToHex(reversed);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    std::vector<Byte> bytes = HexToBytes(hex);
    BaseHash result;
    std::copy(bytes.rbegin(), bytes.rend(), result.data_.begin());
    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

std::string Uint128ToString(uint128_t value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace agora
