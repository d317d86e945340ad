#pragma once
#include "skykernel/core/constants.hpp"
#include <array>
#include <span>
#include <string_view>
#include <cstdint>
#include <initializer_list>
namespace skykernel::crypto {
using Sha512Digest = std::array<uint8_t, Constants::SHA_512_HASH_SIZE>;
using Blake2bDigest = std::array<uint8_t, Constants::BLAKE_2B_HASH_SIZE>;
class Hashing {
public:
    static Sha512Digest Sha512(std::span<const uint8_t> data);
    static Sha512Digest Sha512(std::string_view text);
    /// Hashes the concatenation of parts without materializing it.
    static Sha512Digest Sha512(std::initializer_list<std::span<const uint8_t>> parts);

    /// Unkeyed BLAKE2b with a 32-byte digest, the content hash of the network.
    static Blake2bDigest Blake2b(std::span<const uint8_t> data);
    static Blake2bDigest Blake2b(std::initializer_list<std::span<const uint8_t>> parts);

private:
    Hashing() = delete;
};
}
