// AGORA - Serialization Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/serialize.h"
#include "agora/core/hex.h"

namespace agora {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace agora
