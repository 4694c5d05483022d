// AGORA - SHA256 Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include "agora/core/hex.h"
#include "agora/crypto/sha256.h"

#include <string>

namespace agora {
namespace test {

// Digest bytes in computation order (Hash256::ToHex displays reversed)
std::string DigestHex(const Hash256& hash) {
    return BytesToHex(hash.data(), hash.size());
}

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(DigestHex(SHA256Hash(std::string())),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(DigestHex(SHA256Hash(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(DigestHex(SHA256Hash(std::string(
                  "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string message = "stake-weighted governance";
    
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(message.data()), 5)
          .Write(reinterpret_cast<const Byte*>(message.data()) + 5, message.size() - 5);
    Hash256 incremental;
    hasher.Finalize(incremental.data());
    
    EXPECT_EQ(incremental, SHA256Hash(message));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    std::string junk = "junk";
    hasher.Write(reinterpret_cast<const Byte*>(junk.data()), junk.size());
    hasher.Reset();
    
    std::string abc = "abc";
    hasher.Write(reinterpret_cast<const Byte*>(abc.data()), abc.size());
    Hash256 out;
    hasher.Finalize(out.data());
    
    EXPECT_EQ(out, SHA256Hash(abc));
}

} // namespace test
} // namespace agora
