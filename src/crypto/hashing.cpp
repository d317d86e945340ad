#include "skykernel/crypto/hashing.hpp"
#include <sodium.h>

namespace skykernel::crypto {
    Sha512Digest Hashing::Sha512(const std::span<const uint8_t> data) {
        Sha512Digest digest{};
        crypto_hash_sha512(digest.data(), data.data(), data.size());
        return digest;
    }

    Sha512Digest Hashing::Sha512(const std::string_view text) {
        return Sha512(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

    Sha512Digest Hashing::Sha512(const std::initializer_list<std::span<const uint8_t>> parts) {
        crypto_hash_sha512_state state;
        crypto_hash_sha512_init(&state);
        for (const auto& part : parts) {
            crypto_hash_sha512_update(&state, part.data(), part.size());
        }
        Sha512Digest digest{};
        crypto_hash_sha512_final(&state, digest.data());
        sodium_memzero(&state, sizeof(state));
        return digest;
    }

    Blake2bDigest Hashing::Blake2b(const std::span<const uint8_t> data) {
        Blake2bDigest digest{};
        crypto_generichash(
            digest.data(),
            digest.size(),
            data.data(),
            data.size(),
            nullptr,
            0
        );
        return digest;
    }

    Blake2bDigest Hashing::Blake2b(const std::initializer_list<std::span<const uint8_t>> parts) {
        crypto_generichash_state state;
        crypto_generichash_init(&state, nullptr, 0, Constants::BLAKE_2B_HASH_SIZE);
        for (const auto& part : parts) {
            crypto_generichash_update(&state, part.data(), part.size());
        }
        Blake2bDigest digest{};
        crypto_generichash_final(&state, digest.data(), digest.size());
        return digest;
    }
}
