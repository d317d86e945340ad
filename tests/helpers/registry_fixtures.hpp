#pragma once

#include "skykernel/registry/registry.hpp"
#include "skykernel/seed/seed_phrase.hpp"
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/encoding/encoding.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace skykernel::test_helpers {

/// Keys of a tagged entry under a seed derived from password.
inline registry::TaggedKeys EntryKeys(std::string_view password, std::string_view keypair_tag) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto phrase = seed::SeedPhrase::GenerateSeedPhrase(password);
    REQUIRE(phrase.IsOk());
    auto seed = seed::SeedPhrase::SeedPhraseToSeed(phrase.Unwrap());
    REQUIRE(seed.IsOk());
    auto keys = registry::Registry::TaggedRegistryEntryKeys(seed.Unwrap(), keypair_tag);
    REQUIRE(keys.IsOk());
    return keys.Unwrap();
}

inline models::RegistryEntry SignedEntry(
    const registry::TaggedKeys& keys,
    const std::vector<uint8_t>& data,
    const uint64_t revision) {
    models::RegistryEntry entry;
    entry.public_key = keys.keypair.GetPublicKey();
    entry.datakey = keys.datakey;
    entry.data = data;
    entry.revision = revision;
    auto signature = registry::Registry::ComputeRegistrySignature(
        keys.keypair.GetSecretKey(), entry.datakey, entry.data, entry.revision);
    REQUIRE(signature.IsOk());
    entry.signature = signature.Unwrap();
    return entry;
}

/// Body of a portal registry read answering with entry.
inline std::string ReadResponseBody(const models::RegistryEntry& entry) {
    const nlohmann::json body = {
        {"data", encoding::Encoding::BufToHex(entry.data)},
        {"revision", entry.revision},
        {"signature", encoding::Encoding::BufToHex(entry.signature)}
    };
    return body.dump();
}

inline nlohmann::json ProofElement(const models::RegistryEntry& entry) {
    return {
        {"data", encoding::Encoding::BufToHex(entry.data)},
        {"revision", entry.revision},
        {"datakey", encoding::Encoding::BufToHex(entry.datakey)},
        {"publickey", {
            {"algorithm", "ed25519"},
            {"key", encoding::Encoding::BufToB64(entry.public_key)}
        }},
        {"signature", encoding::Encoding::BufToHex(entry.signature)}
    };
}

} // namespace skykernel::test_helpers
