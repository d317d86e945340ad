#pragma once

#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/constants.hpp"
#include "skykernel/models/ed25519_keypair.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <cstddef>
#include <vector>

namespace skykernel::crypto {

/**
 * @brief Interop layer for the libsodium primitives the kernel consumes
 *
 * Wraps initialization, secure wiping, randomness and the Ed25519
 * signature scheme. Hash functions live in Hashing.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before random generation. Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Used on every temporary that held seed material or key entropy.
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    // ========================================================================
    // Ed25519
    // ========================================================================

    /**
     * @brief Deterministically derive an Ed25519 keypair from 32 bytes
     *
     * @param entropy Exactly 32 bytes
     * @return Ok(keypair) or Err(InvalidKeyLength / KeyGeneration)
     */
    static Result<models::Ed25519Keypair, KernelFailure> Ed25519KeypairFromEntropy(
        std::span<const uint8_t> entropy);

    /**
     * @brief Produce a detached signature over message
     *
     * @param secret_key 64-byte libsodium secret key
     */
    static Result<models::Signature, KernelFailure> Ed25519Sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key);

    /**
     * @brief Verify a detached signature
     *
     * Returns false for malformed lengths instead of failing.
     */
    static bool Ed25519Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);
private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace skykernel::crypto
