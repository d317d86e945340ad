#include <catch2/catch_test_macros.hpp>
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/crypto/hashing.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/core/constants.hpp"
#include <algorithm>
using namespace skykernel;
using namespace skykernel::crypto;
using skykernel::encoding::Encoding;

namespace {
    std::vector<uint8_t> FromHex(std::string_view hex) {
        auto bytes = Encoding::HexToBuf(hex);
        REQUIRE(bytes.IsOk());
        return bytes.Unwrap();
    }
}

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(buffer.empty());
    }
    SECTION("Wipe zeroes every byte") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Ed25519 matches RFC 8032 test vector 1", "[sodium][crypto][ed25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto entropy = FromHex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    const auto expected_pk = FromHex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    const auto expected_sig = FromHex(
        "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
        "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

    auto keypair = SodiumInterop::Ed25519KeypairFromEntropy(entropy);
    REQUIRE(keypair.IsOk());
    const auto& kp = keypair.Unwrap();
    REQUIRE(std::equal(kp.GetPublicKey().begin(), kp.GetPublicKey().end(), expected_pk.begin()));

    SECTION("Secret key is entropy followed by public key") {
        REQUIRE(std::equal(entropy.begin(), entropy.end(), kp.GetSecretKey().begin()));
        REQUIRE(std::equal(expected_pk.begin(), expected_pk.end(), kp.GetSecretKey().begin() + 32));
    }
    SECTION("Signature of the empty message") {
        auto signature = SodiumInterop::Ed25519Sign({}, kp.GetSecretKey());
        REQUIRE(signature.IsOk());
        REQUIRE(std::equal(expected_sig.begin(), expected_sig.end(), signature.Unwrap().begin()));
        REQUIRE(SodiumInterop::Ed25519Verify({}, signature.Unwrap(), kp.GetPublicKey()));
    }
    SECTION("Verify rejects malformed lengths") {
        std::vector<uint8_t> short_sig(10, 0);
        REQUIRE_FALSE(SodiumInterop::Ed25519Verify({}, short_sig, kp.GetPublicKey()));
    }
}

TEST_CASE("SodiumInterop - Ed25519 input validation", "[sodium][crypto][ed25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> entropy(31, 1);
    auto keypair = SodiumInterop::Ed25519KeypairFromEntropy(entropy);
    REQUIRE(keypair.IsErr());
    REQUIRE(keypair.UnwrapErr().type == KernelFailureType::InvalidKeyLength);

    std::vector<uint8_t> short_key(32, 1);
    auto signature = SodiumInterop::Ed25519Sign({}, short_key);
    REQUIRE(signature.IsErr());
    REQUIRE(signature.UnwrapErr().type == KernelFailureType::InvalidKeyLength);
}

TEST_CASE("Hashing - known digests", "[hashing][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SHA-512 of abc") {
        const auto digest = Hashing::Sha512(std::string_view("abc"));
        REQUIRE(Encoding::BufToHex(digest) ==
                "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    }
    SECTION("BLAKE2b-256 of the empty input") {
        const auto digest = Hashing::Blake2b(std::span<const uint8_t>());
        REQUIRE(Encoding::BufToHex(digest) ==
                "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    }
    SECTION("Multi-part hashing equals hashing the concatenation") {
        const auto whole = Hashing::Sha512(std::string_view("hello world"));
        const auto parts = Hashing::Sha512({Encoding::AsBytes("hello"), Encoding::AsBytes(" world")});
        REQUIRE(whole == parts);
    }
}

TEST_CASE("SodiumInterop - Random bytes", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto a = SodiumInterop::GetRandomBytes(32);
    const auto b = SodiumInterop::GetRandomBytes(32);
    REQUIRE(a.size() == 32);
    REQUIRE(a != b);
}
