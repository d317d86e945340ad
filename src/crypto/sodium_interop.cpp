#include "skykernel/crypto/sodium_interop.hpp"

#include <fmt/core.h>
#include <string>

namespace skykernel::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    // sodium_memzero is never optimized away, even for stack temporaries
    sodium_memzero(buffer.data(), buffer.size());
}

// ============================================================================
// Ed25519
// ============================================================================

Result<models::Ed25519Keypair, KernelFailure>
SodiumInterop::Ed25519KeypairFromEntropy(std::span<const uint8_t> entropy) {
    if (entropy.size() != crypto_sign_SEEDBYTES) {
        return Result<models::Ed25519Keypair, KernelFailure>::Err(
            KernelFailure::InvalidKeyLength(
                fmt::format("keypair entropy must be {} bytes, got {}",
                            crypto_sign_SEEDBYTES, entropy.size())));
    }

    models::PublicKey pk{};
    models::SecretKey sk{};
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), entropy.data()) != 0) {
        sodium_memzero(sk.data(), sk.size());
        return Result<models::Ed25519Keypair, KernelFailure>::Err(
            KernelFailure::KeyGeneration("Failed to derive Ed25519 keypair from entropy"));
    }

    models::Ed25519Keypair keypair(pk, sk);
    sodium_memzero(sk.data(), sk.size());
    return Result<models::Ed25519Keypair, KernelFailure>::Ok(std::move(keypair));
}

Result<models::Signature, KernelFailure> SodiumInterop::Ed25519Sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) {
    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return Result<models::Signature, KernelFailure>::Err(
            KernelFailure::InvalidKeyLength(
                fmt::format("secret key must be {} bytes, got {}",
                            crypto_sign_SECRETKEYBYTES, secret_key.size())));
    }

    models::Signature signature{};
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             secret_key.data()) != 0) {
        return Result<models::Signature, KernelFailure>::Err(
            KernelFailure::Signature("Ed25519 signing failed"));
    }
    return Result<models::Signature, KernelFailure>::Ok(signature);
}

bool SodiumInterop::Ed25519Verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) noexcept {
    if (signature.size() != crypto_sign_BYTES ||
        public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       public_key.data()) == 0;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

} // namespace skykernel::crypto
