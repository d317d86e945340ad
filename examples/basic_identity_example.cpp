/**
 * @file basic_identity_example.cpp
 * @brief Seed phrase, registry keys and a local skyfile, without a network
 */

#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/registry/registry.hpp"
#include "skykernel/seed/seed_phrase.hpp"
#include "skykernel/skylink/skyfile.hpp"
#include "skykernel/skylink/skylink_bitfield.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using namespace skykernel;

int main() {
    std::cout << "=== skykernel - Basic Identity Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl << std::endl;

    std::cout << "2. Generating a seed phrase..." << std::endl;
    auto phrase_result = seed::SeedPhrase::GenerateSeedPhraseRandom();
    if (phrase_result.IsErr()) {
        std::cerr << "Failed to generate phrase: " << phrase_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto phrase = std::move(phrase_result).Unwrap();
    std::cout << "   Phrase: " << phrase << std::endl;

    auto seed_result = seed::SeedPhrase::SeedPhraseToSeed(phrase);
    if (seed_result.IsErr()) {
        std::cerr << "Phrase did not validate: " << seed_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto user_seed = seed_result.Unwrap();
    std::cout << "   Seed: " << encoding::Encoding::BufToHex(user_seed) << std::endl << std::endl;

    std::cout << "3. Deriving registry keys for tag 'profile'..." << std::endl;
    auto keys_result = registry::Registry::TaggedRegistryEntryKeys(user_seed, "profile");
    if (keys_result.IsErr()) {
        std::cerr << "Failed to derive keys: " << keys_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& keys = keys_result.Unwrap();
    auto entry_id = registry::Registry::DeriveRegistryEntryID(keys.keypair.GetPublicKey(), keys.datakey);
    if (entry_id.IsErr()) {
        std::cerr << "Failed to derive entry ID: " << entry_id.UnwrapErr().message << std::endl;
        return 1;
    }
    auto resolver = registry::Registry::ResolverLink(entry_id.Unwrap());
    if (resolver.IsErr()) {
        std::cerr << "Failed to build resolver link: " << resolver.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Public key:    " << encoding::Encoding::BufToHex(keys.keypair.GetPublicKey()) << std::endl;
    std::cout << "   Resolver link: " << resolver.Unwrap() << std::endl << std::endl;

    std::cout << "4. Building a skyfile locally..." << std::endl;
    const std::string content = "hello skynet";
    auto base = skylink::Skyfile::BuildBaseSector(
        encoding::Encoding::AsBytes(content), nlohmann::json{{"Filename", "hello.txt"}});
    if (base.IsErr()) {
        std::cerr << "Failed to build base sector: " << base.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Skylink: " << base.Unwrap().skylink_text << std::endl;
    std::cout << "   Valid:   " << std::boolalpha
              << skylink::SkylinkBitfield::ValidSkylink(std::string_view(base.Unwrap().skylink_text))
              << std::endl;

    std::cout << std::endl << "=== Example completed successfully ===" << std::endl;
    return 0;
}
