#include "skykernel/models/ed25519_keypair.hpp"
#include <sodium.h>

namespace skykernel::models {
    Ed25519Keypair::Ed25519Keypair(
        const PublicKey& public_key,
        const SecretKey& secret_key)
        : public_key_(public_key)
          , secret_key_(secret_key) {
    }

    Ed25519Keypair::~Ed25519Keypair() {
        sodium_memzero(secret_key_.data(), secret_key_.size());
    }

    bool Ed25519Keypair::operator==(const Ed25519Keypair& other) const noexcept {
        return public_key_ == other.public_key_ &&
               sodium_memcmp(secret_key_.data(), other.secret_key_.data(), secret_key_.size()) == 0;
    }
}
