#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/models/seed.hpp"
#include "skykernel/models/ed25519_keypair.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace skykernel::seed {
using ChecksumWords = std::pair<std::string_view, std::string_view>;

/**
 * @brief Seed phrase codec and seed derivation chain
 *
 * A phrase is 13 entropy words followed by 2 checksum words. The first 12
 * entropy words carry 10 bits each and the last one 8 bits, packed
 * most-significant bit first into the 16-byte seed.
 */
class SeedPhrase {
public:
    /**
     * @brief Generate a checksummed seed phrase
     *
     * Without a password the words come from 32 random bytes. With a
     * password the phrase is a pure function of it, and the last entropy
     * word is drawn from the first quarter of the dictionary.
     */
    static Result<std::string, KernelFailure> GenerateSeedPhrase(
        std::optional<std::string_view> password);

    /// Base64 of 32 random bytes run through the password generator.
    static Result<std::string, KernelFailure> GenerateSeedPhraseRandom();

    /**
     * @brief Parse a seed phrase and verify its checksum words
     *
     * @return Ok(seed), or Err(InvalidInput / WordNotFound / InvalidChecksum)
     */
    static Result<models::Seed, KernelFailure> SeedPhraseToSeed(std::string_view phrase);

    static Result<models::Seed, KernelFailure> ValidSeedPhrase(std::string_view phrase);

    static Result<ChecksumWords, KernelFailure> SeedToChecksumWords(std::span<const uint8_t> seed);

    /// Encodes a seed as its canonical 15-word phrase.
    static Result<std::string, KernelFailure> SeedToSeedPhrase(std::span<const uint8_t> seed);

    static Result<models::Seed, KernelFailure> DeriveChildSeed(
        std::span<const uint8_t> parent_seed,
        std::string_view derivation_tag);

    /**
     * @brief Derive the MySky root keypair of a user seed
     *
     * sha512(sha512("root discoverable key") ++ sha512(seed))[:32] is used
     * as keypair entropy. Existing identities depend on this exact
     * construction.
     */
    static Result<models::Ed25519Keypair, KernelFailure> DeriveLegacyRootKeypair(
        std::span<const uint8_t> seed);

private:
    static Result<models::Seed, KernelFailure> SeedWordsToSeed(
        std::span<const std::string_view> seed_words);
    static Result<std::string, KernelFailure> WordIndicesToPhrase(
        std::span<const uint16_t> word_indices);
    static Result<Unit, KernelFailure> CheckSeedLength(std::span<const uint8_t> seed);
    static std::vector<std::string_view> SplitWords(std::string_view phrase);

    SeedPhrase() = delete;
};
}
