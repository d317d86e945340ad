#include <catch2/catch_test_macros.hpp>
#include "skykernel/seed/seed_phrase.hpp"
#include "skykernel/seed/dictionary.hpp"
#include "skykernel/crypto/hashing.hpp"
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/encoding/encoding.hpp"
#include <algorithm>
#include <sstream>
#include <vector>
using namespace skykernel;
using namespace skykernel::seed;
using skykernel::encoding::Encoding;

namespace {
    std::vector<std::string> Split(const std::string& phrase) {
        std::istringstream stream(phrase);
        std::vector<std::string> words;
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }

    std::string Join(const std::vector<std::string>& words) {
        std::string phrase;
        for (size_t i = 0; i < words.size(); ++i) {
            if (i > 0) {
                phrase += ' ';
            }
            phrase += words[i];
        }
        return phrase;
    }
}

TEST_CASE("SeedPhrase - password generation is deterministic", "[seed][phrase]") {
    auto first = SeedPhrase::GenerateSeedPhrase(std::string_view("correct horse battery staple"));
    auto second = SeedPhrase::GenerateSeedPhrase(std::string_view("correct horse battery staple"));
    auto other = SeedPhrase::GenerateSeedPhrase(std::string_view("correct horse battery stapler"));
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(other.IsOk());
    REQUIRE(first.Unwrap() == second.Unwrap());
    REQUIRE(first.Unwrap() != other.Unwrap());
    REQUIRE(Split(first.Unwrap()).size() == 15);

    SECTION("Password phrases are canonical") {
        auto seed = SeedPhrase::SeedPhraseToSeed(first.Unwrap());
        REQUIRE(seed.IsOk());
        auto phrase = SeedPhrase::SeedToSeedPhrase(seed.Unwrap());
        REQUIRE(phrase.IsOk());
        REQUIRE(phrase.Unwrap() == first.Unwrap());
    }
    SECTION("The last entropy word stays within the first 256 dictionary words") {
        const auto words = Split(first.Unwrap());
        auto index = Dictionary::IndexOf(words[12]);
        REQUIRE(index.IsOk());
        REQUIRE(index.Unwrap() < 256);
    }
}

TEST_CASE("SeedPhrase - password phrase known answer", "[seed][phrase][vectors]") {
    auto phrase = SeedPhrase::GenerateSeedPhrase(std::string_view("Test"));
    REQUIRE(phrase.IsOk());
    REQUIRE(phrase.Unwrap() ==
        "dash dude cease angled depth aztec bawled afraid cement devoid aspire edgy bias ankle future");

    SECTION("Entropy words are the first thirteen digest bytes") {
        const auto digest = crypto::Hashing::Sha512(std::string_view("Test"));
        const auto words = Split(phrase.Unwrap());
        for (size_t i = 0; i < 13; ++i) {
            REQUIRE(words[i] == Dictionary::WordAt(digest[i]));
        }
    }
    SECTION("The phrase decodes to the expected seed") {
        auto seed = SeedPhrase::SeedPhraseToSeed(phrase.Unwrap());
        REQUIRE(seed.IsOk());
        REQUIRE(Encoding::BufToHex(seed.Unwrap()) == "318ee2783333c5c19c15284d1120fd73");
    }
}

TEST_CASE("SeedPhrase - random generation always validates", "[seed][phrase]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    for (int i = 0; i < 20; ++i) {
        auto random = SeedPhrase::GenerateSeedPhraseRandom();
        REQUIRE(random.IsOk());
        REQUIRE(SeedPhrase::ValidSeedPhrase(random.Unwrap()).IsOk());

        auto unseeded = SeedPhrase::GenerateSeedPhrase(std::nullopt);
        REQUIRE(unseeded.IsOk());
        REQUIRE(SeedPhrase::ValidSeedPhrase(unseeded.Unwrap()).IsOk());
    }
}

TEST_CASE("SeedPhrase - seed to phrase round trip", "[seed][phrase]") {
    SECTION("Zero seed encodes to the first dictionary word") {
        const models::Seed zero{};
        auto phrase = SeedPhrase::SeedToSeedPhrase(zero);
        REQUIRE(phrase.IsOk());
        const auto words = Split(phrase.Unwrap());
        REQUIRE(words.size() == 15);
        for (size_t i = 0; i < 13; ++i) {
            REQUIRE(words[i] == "abbey");
        }
        auto checksum = SeedPhrase::SeedToChecksumWords(zero);
        REQUIRE(checksum.IsOk());
        REQUIRE(words[13] == checksum.Unwrap().first);
        REQUIRE(words[14] == checksum.Unwrap().second);

        auto seed = SeedPhrase::SeedPhraseToSeed(phrase.Unwrap());
        REQUIRE(seed.IsOk());
        REQUIRE(seed.Unwrap() == zero);
    }
    SECTION("Arbitrary seeds survive the round trip") {
        models::Seed seed{};
        for (size_t i = 0; i < seed.size(); ++i) {
            seed[i] = static_cast<uint8_t>(0x3B * i + 0x11);
        }
        auto phrase = SeedPhrase::SeedToSeedPhrase(seed);
        REQUIRE(phrase.IsOk());
        auto decoded = SeedPhrase::SeedPhraseToSeed(phrase.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == seed);
    }
    SECTION("Wrong seed length is rejected") {
        std::vector<uint8_t> seed(15, 0);
        auto phrase = SeedPhrase::SeedToSeedPhrase(seed);
        REQUIRE(phrase.IsErr());
        REQUIRE(phrase.UnwrapErr().type == KernelFailureType::InvalidSeedLength);
        REQUIRE(phrase.UnwrapErr().message == "seed has the wrong length: 15");
    }
}

TEST_CASE("SeedPhrase - parsing", "[seed][phrase]") {
    auto generated = SeedPhrase::GenerateSeedPhrase(std::string_view("parsing"));
    REQUIRE(generated.IsOk());
    const auto phrase = generated.Unwrap();
    auto expected = SeedPhrase::SeedPhraseToSeed(phrase);
    REQUIRE(expected.IsOk());

    SECTION("Only the first three letters of a word matter") {
        auto words = Split(phrase);
        for (auto& word : words) {
            word = word.substr(0, 3);
        }
        auto seed = SeedPhrase::SeedPhraseToSeed(Join(words));
        REQUIRE(seed.IsOk());
        REQUIRE(seed.Unwrap() == expected.Unwrap());
    }
    SECTION("Extra whitespace is ignored") {
        auto seed = SeedPhrase::SeedPhraseToSeed("  " + Join(Split(phrase)) + "\n");
        REQUIRE(seed.IsOk());
        REQUIRE(seed.Unwrap() == expected.Unwrap());
    }
    SECTION("Wrong word count is rejected") {
        auto words = Split(phrase);
        words.pop_back();
        auto seed = SeedPhrase::SeedPhraseToSeed(Join(words));
        REQUIRE(seed.IsErr());
        REQUIRE(seed.UnwrapErr().type == KernelFailureType::InvalidInput);
    }
    SECTION("Unknown words are reported with their position") {
        auto words = Split(phrase);
        words[4] = "qqqq";
        auto seed = SeedPhrase::SeedPhraseToSeed(Join(words));
        REQUIRE(seed.IsErr());
        REQUIRE(seed.UnwrapErr().type == KernelFailureType::WordNotFound);
        REQUIRE(seed.UnwrapErr().message ==
                "unable to parse seed phrase: word 'qqqq' at index 4 not found in dictionary");
    }
    SECTION("A wrong checksum word is rejected") {
        auto words = Split(phrase);
        auto index = Dictionary::IndexOf(words[13]);
        REQUIRE(index.IsOk());
        words[13] = std::string(Dictionary::WordAt(static_cast<uint16_t>(index.Unwrap() + 1)));
        auto seed = SeedPhrase::SeedPhraseToSeed(Join(words));
        REQUIRE(seed.IsErr());
        REQUIRE(seed.UnwrapErr().type == KernelFailureType::InvalidChecksum);
        REQUIRE(seed.UnwrapErr().message == "first checksum word is invalid");
    }
}

TEST_CASE("SeedPhrase - child seeds", "[seed][derivation]") {
    models::Seed parent{};
    parent.fill(0x42);

    auto child = SeedPhrase::DeriveChildSeed(parent, "mysky");
    REQUIRE(child.IsOk());

    SECTION("Child is the first sixteen bytes of sha512(parent || \" - \" || tag)") {
        std::vector<uint8_t> preimage(parent.begin(), parent.end());
        const std::string suffix = " - mysky";
        preimage.insert(preimage.end(), suffix.begin(), suffix.end());
        const auto digest = crypto::Hashing::Sha512(std::span<const uint8_t>(preimage));
        REQUIRE(std::equal(child.Unwrap().begin(), child.Unwrap().end(), digest.begin()));
    }
    SECTION("Different tags give different seeds") {
        auto other = SeedPhrase::DeriveChildSeed(parent, "mysky2");
        REQUIRE(other.IsOk());
        REQUIRE(other.Unwrap() != child.Unwrap());
    }
    SECTION("Parent must be a full seed") {
        std::vector<uint8_t> short_parent(8, 0);
        auto bad = SeedPhrase::DeriveChildSeed(short_parent, "mysky");
        REQUIRE(bad.IsErr());
        REQUIRE(bad.UnwrapErr().type == KernelFailureType::InvalidSeedLength);
    }
}

TEST_CASE("SeedPhrase - legacy root keypair", "[seed][derivation]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    models::Seed seed{};
    seed.fill(0x07);

    auto first = SeedPhrase::DeriveLegacyRootKeypair(seed);
    auto second = SeedPhrase::DeriveLegacyRootKeypair(seed);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap() == second.Unwrap());

    SECTION("Keypair entropy is sha512(sha512(salt) || sha512(seed)) truncated to 32 bytes") {
        const auto salt_hash = crypto::Hashing::Sha512(std::string_view("root discoverable key"));
        const auto seed_hash = crypto::Hashing::Sha512(std::span<const uint8_t>(seed));
        std::vector<uint8_t> joined(salt_hash.begin(), salt_hash.end());
        joined.insert(joined.end(), seed_hash.begin(), seed_hash.end());
        const auto merged = crypto::Hashing::Sha512(std::span<const uint8_t>(joined));
        auto expected = crypto::SodiumInterop::Ed25519KeypairFromEntropy(
            std::span<const uint8_t>(merged).first(32));
        REQUIRE(expected.IsOk());
        REQUIRE(expected.Unwrap().GetPublicKey() == first.Unwrap().GetPublicKey());
    }

    seed[0] ^= 1;
    auto changed = SeedPhrase::DeriveLegacyRootKeypair(seed);
    REQUIRE(changed.IsOk());
    REQUIRE(changed.Unwrap().GetPublicKey() != first.Unwrap().GetPublicKey());

    std::vector<uint8_t> bad_seed(17, 0);
    auto bad = SeedPhrase::DeriveLegacyRootKeypair(bad_seed);
    REQUIRE(bad.IsErr());
    REQUIRE(bad.UnwrapErr().type == KernelFailureType::InvalidSeedLength);
    REQUIRE(bad.UnwrapErr().message == "seed has the wrong length: 17");
}
