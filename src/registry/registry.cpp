#include "skykernel/registry/registry.hpp"
#include "skykernel/crypto/hashing.hpp"
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace skykernel::registry {
    using crypto::Hashing;
    using crypto::SodiumInterop;
    using encoding::Encoding;

    namespace {
        crypto::Blake2bDigest SignatureHash(
            const std::span<const uint8_t> datakey,
            const std::span<const uint8_t> data,
            const uint64_t revision) {
            const auto encoded_data = Encoding::EncodePrefixedBytes(data);
            const auto encoded_revision = Encoding::EncodeU64(revision);
            return Hashing::Blake2b({datakey, encoded_data, encoded_revision});
        }
    }

    Result<TaggedKeys, KernelFailure> Registry::TaggedRegistryEntryKeys(
        const std::span<const uint8_t> seed,
        const std::string_view keypair_tag,
        const std::string_view datakey_tag) {
        if (seed.size() != SeedConstants::SEED_BYTES) {
            return Result<TaggedKeys, KernelFailure>::Err(
                KernelFailure::InvalidSeedLength(std::string(ErrorMessages::SEED_WRONG_LENGTH)));
        }
        if (keypair_tag.size() > RegistryConstants::MAX_KEYPAIR_TAG_SIZE) {
            return Result<TaggedKeys, KernelFailure>::Err(
                KernelFailure::TagTooLong(fmt::format(
                    "keypairTag must be at most {} bytes, got {}",
                    RegistryConstants::MAX_KEYPAIR_TAG_SIZE, keypair_tag.size())));
        }

        const auto keypair_tag_bytes = Encoding::AsBytes(keypair_tag);
        auto keypair_entropy = Hashing::Sha512({seed, keypair_tag_bytes});

        const std::array<uint8_t, 1> keypair_tag_len = {static_cast<uint8_t>(keypair_tag.size())};
        auto datakey_entropy = Hashing::Sha512({
            seed,
            keypair_tag_len,
            keypair_tag_bytes,
            Encoding::AsBytes(datakey_tag)
        });

        auto keypair = SodiumInterop::Ed25519KeypairFromEntropy(
            std::span<const uint8_t>(keypair_entropy).first(Constants::ED_25519_ENTROPY_SIZE));
        SodiumInterop::SecureWipe(keypair_entropy);
        if (keypair.IsErr()) {
            SodiumInterop::SecureWipe(datakey_entropy);
            return Result<TaggedKeys, KernelFailure>::Err(
                keypair.UnwrapErr().WithContext("unable to derive keypair"));
        }

        models::Datakey datakey{};
        std::copy_n(datakey_entropy.begin(), datakey.size(), datakey.begin());
        SodiumInterop::SecureWipe(datakey_entropy);

        SKY_LOG_BYTES(debug::Component::Registry, "tagged_public_key", keypair.Unwrap().GetPublicKey());
        SKY_LOG_BYTES(debug::Component::Registry, "tagged_datakey", datakey);
        return Result<TaggedKeys, KernelFailure>::Ok(
            TaggedKeys{std::move(keypair).Unwrap(), datakey});
    }

    Result<models::EntryId, KernelFailure> Registry::DeriveRegistryEntryID(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> datakey) {
        if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
            return Result<models::EntryId, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength(std::string(ErrorMessages::PUBKEY_WRONG_LENGTH)));
        }
        if (datakey.size() != RegistryConstants::DATAKEY_SIZE) {
            return Result<models::EntryId, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength(std::string(ErrorMessages::DATAKEY_WRONG_LENGTH)));
        }

        // Sia encoding: 16-byte specifier, length-prefixed public key, datakey.
        std::array<uint8_t, RegistryConstants::SPECIFIER_SIZE> specifier{};
        std::copy(RegistryConstants::ED_25519_SPECIFIER.begin(),
                  RegistryConstants::ED_25519_SPECIFIER.end(),
                  specifier.begin());
        const auto key_len = Encoding::EncodeU64(Constants::ED_25519_PUBLIC_KEY_SIZE);
        return Result<models::EntryId, KernelFailure>::Ok(
            Hashing::Blake2b({specifier, key_len, public_key, datakey}));
    }

    Result<models::Signature, KernelFailure> Registry::ComputeRegistrySignature(
        const std::span<const uint8_t> secret_key,
        const std::span<const uint8_t> datakey,
        const std::span<const uint8_t> data,
        const uint64_t revision) {
        if (data.size() > RegistryConstants::MAX_DATA_SIZE) {
            return Result<models::Signature, KernelFailure>::Err(
                KernelFailure::DataTooLarge(std::string(ErrorMessages::REGISTRY_DATA_TOO_LARGE)));
        }
        if (datakey.size() != RegistryConstants::DATAKEY_SIZE) {
            return Result<models::Signature, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength(std::string(ErrorMessages::DATAKEY_WRONG_LENGTH)));
        }
        const auto sig_hash = SignatureHash(datakey, data, revision);
        return SodiumInterop::Ed25519Sign(sig_hash, secret_key)
            .Context("unable to sign registry entry");
    }

    bool Registry::VerifyRegistrySignature(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> datakey,
        const std::span<const uint8_t> data,
        const uint64_t revision,
        const std::span<const uint8_t> signature) noexcept {
        if (datakey.size() != RegistryConstants::DATAKEY_SIZE ||
            data.size() > RegistryConstants::MAX_DATA_SIZE) {
            return false;
        }
        try {
            const auto sig_hash = SignatureHash(datakey, data, revision);
            return SodiumInterop::Ed25519Verify(sig_hash, signature, public_key);
        } catch (const std::bad_alloc&) {
            return false;
        }
    }

    bool Registry::VerifyRegistryEntry(const models::RegistryEntry& entry) noexcept {
        return VerifyRegistrySignature(
            entry.public_key, entry.datakey, entry.data, entry.revision, entry.signature);
    }

    models::SkylinkBytes Registry::EntryIDToSkylink(const models::EntryId& entry_id) noexcept {
        models::SkylinkBytes skylink{};
        skylink[0] = SkylinkConstants::RESOLVER_BITFIELD_BYTE;
        skylink[1] = 0;
        std::copy(entry_id.begin(), entry_id.end(), skylink.begin() + SkylinkConstants::ROOT_OFFSET);
        return skylink;
    }

    Result<std::string, KernelFailure> Registry::ResolverLink(const std::span<const uint8_t> entry_id) {
        if (entry_id.size() != RegistryConstants::ENTRY_ID_SIZE) {
            return Result<std::string, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength("provided entry ID has the wrong length"));
        }
        models::EntryId id{};
        std::copy(entry_id.begin(), entry_id.end(), id.begin());
        return Result<std::string, KernelFailure>::Ok(Encoding::BufToB64(EntryIDToSkylink(id)));
    }

    Result<std::vector<uint8_t>, KernelFailure> Registry::SkylinkToResolverEntryData(
        const std::string_view skylink) {
        auto bytes = Encoding::B64ToBuf(skylink);
        if (bytes.IsErr()) {
            return std::move(bytes).Context("unable to decode skylink");
        }
        if (bytes.Unwrap().size() != SkylinkConstants::SKYLINK_SIZE) {
            return Result<std::vector<uint8_t>, KernelFailure>::Err(
                KernelFailure::Decode(fmt::format(
                    "skylink decodes to {} bytes, expected {}",
                    bytes.Unwrap().size(), SkylinkConstants::SKYLINK_SIZE)));
        }
        return bytes;
    }
}
