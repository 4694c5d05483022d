// AGORA - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_CORE_HEX_H
#define AGORA_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agora {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes (throws std::invalid_argument on bad input)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Convert hex string to bytes, nullopt on bad input
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace agora

#endif // AGORA_CORE_HEX_H
