#include "skykernel/seed/seed_phrase.hpp"
#include "skykernel/seed/dictionary.hpp"
#include "skykernel/crypto/hashing.hpp"
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <array>

namespace skykernel::seed {
    using crypto::Hashing;
    using crypto::SodiumInterop;
    using encoding::Encoding;

    namespace {
        using WordIndices = std::array<uint16_t, SeedConstants::SEED_ENTROPY_WORDS>;

        // Random entropy: word i is the little-endian u16 at offset 2i.
        WordIndices RandomWordIndices(const crypto::Sha512Digest& digest) {
            WordIndices indices{};
            for (size_t i = 0; i < indices.size(); ++i) {
                const auto value = static_cast<uint16_t>(digest[2 * i] | (digest[2 * i + 1] << 8));
                indices[i] = static_cast<uint16_t>(value % SeedConstants::DICTIONARY_SIZE);
            }
            return indices;
        }

        // Password entropy: word i is digest byte i, the last word limited to
        // a quarter of the dictionary. Phrases derived from a password are
        // shared with existing clients and must not change.
        WordIndices PasswordWordIndices(const crypto::Sha512Digest& digest) {
            WordIndices indices{};
            for (size_t i = 0; i < indices.size(); ++i) {
                indices[i] = static_cast<uint16_t>(digest[i] % SeedConstants::DICTIONARY_SIZE);
            }
            indices.back() = static_cast<uint16_t>(
                indices.back() % (SeedConstants::DICTIONARY_SIZE / 4));
            return indices;
        }
    }

    Result<std::string, KernelFailure> SeedPhrase::GenerateSeedPhrase(
        const std::optional<std::string_view> password) {
        crypto::Sha512Digest digest{};
        if (password.has_value()) {
            digest = Hashing::Sha512(*password);
        } else {
            if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
                return Result<std::string, KernelFailure>::Err(
                    KernelFailure::FromSodiumFailure(init.UnwrapErr()));
            }
            auto random = SodiumInterop::GetRandomBytes(SeedConstants::GENERATOR_RANDOM_BYTES);
            digest = Hashing::Sha512(std::span<const uint8_t>(random));
            SodiumInterop::SecureWipe(random);
        }
        const auto indices = password.has_value() ? PasswordWordIndices(digest) : RandomWordIndices(digest);
        SodiumInterop::SecureWipe(digest);
        return WordIndicesToPhrase(indices);
    }

    Result<std::string, KernelFailure> SeedPhrase::GenerateSeedPhraseRandom() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::string, KernelFailure>::Err(
                KernelFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto random = SodiumInterop::GetRandomBytes(SeedConstants::GENERATOR_RANDOM_BYTES);
        auto text = Encoding::BufToB64(random);
        SodiumInterop::SecureWipe(random);
        auto phrase = GenerateSeedPhrase(std::string_view(text));
        SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(text.data()), text.size()));
        return std::move(phrase).Context("unable to generate seed from string");
    }

    Result<models::Seed, KernelFailure> SeedPhrase::SeedPhraseToSeed(const std::string_view phrase) {
        const auto words = SplitWords(phrase);
        if (words.size() != SeedConstants::SEED_PHRASE_WORDS) {
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::InvalidInput(fmt::format(
                    "seed phrase should have {} words but has {}",
                    SeedConstants::SEED_PHRASE_WORDS, words.size())));
        }

        auto seed_result = SeedWordsToSeed(
            std::span<const std::string_view>(words).first(SeedConstants::SEED_ENTROPY_WORDS));
        if (seed_result.IsErr()) {
            return std::move(seed_result).Context("unable to parse seed phrase");
        }
        auto seed = std::move(seed_result).Unwrap();

        auto checksum_result = SeedToChecksumWords(seed);
        if (checksum_result.IsErr()) {
            return Result<models::Seed, KernelFailure>::Err(
                checksum_result.UnwrapErr().WithContext("could not compute checksum words"));
        }
        const auto [checksum_one, checksum_two] = checksum_result.Unwrap();
        if (Dictionary::Prefix(words[SeedConstants::SEED_ENTROPY_WORDS]) != Dictionary::Prefix(checksum_one)) {
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::InvalidChecksum("first checksum word is invalid"));
        }
        if (Dictionary::Prefix(words[SeedConstants::SEED_ENTROPY_WORDS + 1]) != Dictionary::Prefix(checksum_two)) {
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::InvalidChecksum("second checksum word is invalid"));
        }
        return Result<models::Seed, KernelFailure>::Ok(seed);
    }

    Result<models::Seed, KernelFailure> SeedPhrase::ValidSeedPhrase(const std::string_view phrase) {
        return SeedPhraseToSeed(phrase);
    }

    Result<ChecksumWords, KernelFailure> SeedPhrase::SeedToChecksumWords(const std::span<const uint8_t> seed) {
        if (auto check = CheckSeedLength(seed); check.IsErr()) {
            return Result<ChecksumWords, KernelFailure>::Err(check.UnwrapErr());
        }
        const auto h = Hashing::Sha512(seed);
        uint32_t word_one = static_cast<uint32_t>(h[0]) << 8;
        word_one += h[1];
        word_one >>= 6;
        uint32_t word_two = (static_cast<uint32_t>(h[1]) << 10) & 0xFFFF;
        word_two += static_cast<uint32_t>(h[2]) << 2;
        word_two >>= 6;
        return Result<ChecksumWords, KernelFailure>::Ok({
            Dictionary::WordAt(static_cast<uint16_t>(word_one)),
            Dictionary::WordAt(static_cast<uint16_t>(word_two))
        });
    }

    Result<std::string, KernelFailure> SeedPhrase::SeedToSeedPhrase(const std::span<const uint8_t> seed) {
        if (auto check = CheckSeedLength(seed); check.IsErr()) {
            return Result<std::string, KernelFailure>::Err(check.UnwrapErr());
        }
        std::array<uint16_t, SeedConstants::SEED_ENTROPY_WORDS> indices{};
        size_t bit = 0;
        for (size_t i = 0; i < indices.size(); ++i) {
            const unsigned word_bits = i == indices.size() - 1
                ? SeedConstants::FINAL_ENTROPY_WORD_BITS
                : SeedConstants::ENTROPY_WORD_BITS;
            uint16_t word = 0;
            for (unsigned j = 0; j < word_bits; ++j, ++bit) {
                const bool bit_set = (seed[bit / 8] >> (7 - bit % 8)) & 1;
                word = static_cast<uint16_t>((word << 1) | (bit_set ? 1 : 0));
            }
            indices[i] = word;
        }
        return WordIndicesToPhrase(indices);
    }

    Result<models::Seed, KernelFailure> SeedPhrase::DeriveChildSeed(
        const std::span<const uint8_t> parent_seed,
        const std::string_view derivation_tag) {
        if (auto check = CheckSeedLength(parent_seed); check.IsErr()) {
            return Result<models::Seed, KernelFailure>::Err(check.UnwrapErr());
        }
        auto hash = Hashing::Sha512({
            parent_seed,
            Encoding::AsBytes(SeedConstants::CHILD_SEED_SEPARATOR),
            Encoding::AsBytes(derivation_tag)
        });
        models::Seed child{};
        std::copy_n(hash.begin(), child.size(), child.begin());
        SodiumInterop::SecureWipe(hash);
        return Result<models::Seed, KernelFailure>::Ok(child);
    }

    Result<models::Ed25519Keypair, KernelFailure> SeedPhrase::DeriveLegacyRootKeypair(
        const std::span<const uint8_t> seed) {
        if (auto check = CheckSeedLength(seed); check.IsErr()) {
            return Result<models::Ed25519Keypair, KernelFailure>::Err(check.UnwrapErr());
        }
        const auto salt_hash = Hashing::Sha512(SeedConstants::LEGACY_ROOT_SALT);
        auto seed_hash = Hashing::Sha512(seed);
        auto merged = Hashing::Sha512({salt_hash, seed_hash});
        auto keypair = SodiumInterop::Ed25519KeypairFromEntropy(
            std::span<const uint8_t>(merged).first(Constants::ED_25519_ENTROPY_SIZE));
        SodiumInterop::SecureWipe(seed_hash);
        SodiumInterop::SecureWipe(merged);
        if (keypair.IsOk()) {
            SKY_LOG_BYTES(debug::Component::Seed, "legacy_root_public", keypair.Unwrap().GetPublicKey());
        }
        return std::move(keypair).Context("unable to derive legacy root keypair");
    }

    Result<models::Seed, KernelFailure> SeedPhrase::SeedWordsToSeed(
        const std::span<const std::string_view> seed_words) {
        if (seed_words.size() != SeedConstants::SEED_ENTROPY_WORDS) {
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::InvalidInput(fmt::format(
                    "seed words should have length {} but has length {}",
                    SeedConstants::SEED_ENTROPY_WORDS, seed_words.size())));
        }

        models::Seed bytes{};
        size_t cur_byte = 0;
        unsigned cur_bit = 0;
        for (size_t i = 0; i < seed_words.size(); ++i) {
            auto index = Dictionary::IndexOf(seed_words[i]);
            if (index.IsErr()) {
                return Result<models::Seed, KernelFailure>::Err(
                    KernelFailure::WordNotFound(fmt::format(
                        "word '{}' at index {} not found in dictionary", seed_words[i], i)));
            }
            const uint16_t word = index.Unwrap();
            const unsigned word_bits = i == seed_words.size() - 1
                ? SeedConstants::FINAL_ENTROPY_WORD_BITS
                : SeedConstants::ENTROPY_WORD_BITS;

            for (unsigned j = 0; j < word_bits; ++j) {
                if ((word >> (word_bits - j - 1)) & 1) {
                    bytes[cur_byte] |= static_cast<uint8_t>(1 << (8 - cur_bit - 1));
                }
                if (++cur_bit >= 8) {
                    ++cur_byte;
                    cur_bit = 0;
                }
            }
        }
        return Result<models::Seed, KernelFailure>::Ok(bytes);
    }

    Result<std::string, KernelFailure> SeedPhrase::WordIndicesToPhrase(
        const std::span<const uint16_t> word_indices) {
        std::vector<std::string_view> words;
        words.reserve(SeedConstants::SEED_PHRASE_WORDS);
        for (const auto index : word_indices) {
            words.push_back(Dictionary::WordAt(index));
        }

        auto seed = SeedWordsToSeed(words);
        if (seed.IsErr()) {
            return Result<std::string, KernelFailure>::Err(seed.UnwrapErr());
        }
        auto checksum = SeedToChecksumWords(seed.Unwrap());
        SodiumInterop::SecureWipe(seed.Unwrap());
        if (checksum.IsErr()) {
            return Result<std::string, KernelFailure>::Err(checksum.UnwrapErr());
        }
        words.push_back(checksum.Unwrap().first);
        words.push_back(checksum.Unwrap().second);

        std::string phrase;
        for (size_t i = 0; i < words.size(); ++i) {
            if (i > 0) {
                phrase += ' ';
            }
            phrase += words[i];
        }
        return Result<std::string, KernelFailure>::Ok(std::move(phrase));
    }

    Result<Unit, KernelFailure> SeedPhrase::CheckSeedLength(const std::span<const uint8_t> seed) {
        if (seed.size() != SeedConstants::SEED_BYTES) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::InvalidSeedLength(fmt::format(
                    "{}: {}", ErrorMessages::SEED_WRONG_LENGTH, seed.size())));
        }
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    std::vector<std::string_view> SeedPhrase::SplitWords(const std::string_view phrase) {
        std::vector<std::string_view> words;
        size_t pos = 0;
        while (pos < phrase.size()) {
            const auto start = phrase.find_first_not_of(" \t\r\n", pos);
            if (start == std::string_view::npos) {
                break;
            }
            auto end = phrase.find_first_of(" \t\r\n", start);
            if (end == std::string_view::npos) {
                end = phrase.size();
            }
            words.push_back(phrase.substr(start, end - start));
            pos = end;
        }
        return words;
    }
}
