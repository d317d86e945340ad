#pragma once
#include "skykernel/core/constants.hpp"
#include <array>
#include <cstdint>
namespace skykernel::models {
using PublicKey = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, Constants::ED_25519_SECRET_KEY_SIZE>;
using Signature = std::array<uint8_t, Constants::ED_25519_SIGNATURE_SIZE>;

// Secret key layout follows libsodium: 32 bytes of entropy, then the public key.
class Ed25519Keypair {
public:
    Ed25519Keypair(const PublicKey& public_key, const SecretKey& secret_key);
    Ed25519Keypair(const Ed25519Keypair&) = default;
    Ed25519Keypair& operator=(const Ed25519Keypair&) = default;
    Ed25519Keypair(Ed25519Keypair&&) noexcept = default;
    Ed25519Keypair& operator=(Ed25519Keypair&&) noexcept = default;
    ~Ed25519Keypair();
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const SecretKey& GetSecretKey() const noexcept {
        return secret_key_;
    }
    [[nodiscard]] bool operator==(const Ed25519Keypair& other) const noexcept;
    [[nodiscard]] bool operator!=(const Ed25519Keypair& other) const noexcept {
        return !(*this == other);
    }
private:
    PublicKey public_key_;
    SecretKey secret_key_;
};
}
