#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/models/ed25519_keypair.hpp"
#include "skykernel/models/registry_entry.hpp"
#include "skykernel/models/skylink.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace skykernel::registry {
struct TaggedKeys {
    models::Ed25519Keypair keypair;
    models::Datakey datakey;
};

/**
 * @brief Registry key derivation, entry addressing and entry signatures
 *
 * A registry entry lives at (public key, datakey). Its signature covers
 * blake2b(datakey ++ EncodePrefixedBytes(data) ++ EncodeU64(revision)).
 */
class Registry {
public:
    /**
     * @brief Derive the keypair and datakey of a tagged registry entry
     *
     * The keypair depends on the seed and keypair tag only. The datakey
     * hashes the keypair tag behind a one-byte length prefix so that
     * different (keypair tag, datakey tag) splits of the same text never
     * collide.
     *
     * @param keypair_tag At most 255 bytes of UTF-8
     * @return Ok(keys), or Err(InvalidSeedLength / TagTooLong)
     */
    static Result<TaggedKeys, KernelFailure> TaggedRegistryEntryKeys(
        std::span<const uint8_t> seed,
        std::string_view keypair_tag,
        std::string_view datakey_tag = "");

    static Result<models::EntryId, KernelFailure> DeriveRegistryEntryID(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> datakey);

    /**
     * @brief Sign registry entry fields with a 64-byte secret key
     *
     * @return Ok(signature), or Err(DataTooLarge / InvalidKeyLength)
     */
    static Result<models::Signature, KernelFailure> ComputeRegistrySignature(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> datakey,
        std::span<const uint8_t> data,
        uint64_t revision);

    /// False for any malformed input, never an error.
    static bool VerifyRegistrySignature(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> datakey,
        std::span<const uint8_t> data,
        uint64_t revision,
        std::span<const uint8_t> signature) noexcept;

    static bool VerifyRegistryEntry(const models::RegistryEntry& entry) noexcept;

    static models::SkylinkBytes EntryIDToSkylink(const models::EntryId& entry_id) noexcept;

    /// Base64 text of EntryIDToSkylink, InvalidKeyLength unless 32 bytes.
    static Result<std::string, KernelFailure> ResolverLink(std::span<const uint8_t> entry_id);

    /// Bytes to store as the data of a resolver entry pointing at skylink.
    static Result<std::vector<uint8_t>, KernelFailure> SkylinkToResolverEntryData(std::string_view skylink);
private:
    Registry() = delete;
};
}
