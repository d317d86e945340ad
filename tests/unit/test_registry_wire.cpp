#include <catch2/catch_test_macros.hpp>
#include "skykernel/registry/registry_wire.hpp"
#include "skykernel/encoding/encoding.hpp"
#include <nlohmann/json.hpp>
#include <string>
using namespace skykernel;
using namespace skykernel::registry;
using skykernel::encoding::Encoding;
using json = nlohmann::json;

namespace {
    const std::string kSignatureHex(128, 'a');

    std::string ReadBody(const std::string& revision_literal) {
        return R"({"data":"0102ff","revision":)" + revision_literal +
               R"(,"signature":")" + kSignatureHex + R"("})";
    }
}

TEST_CASE("RegistryWire - read endpoint", "[registry][wire]") {
    const std::vector<uint8_t> pk(32, 0xAB);
    const std::vector<uint8_t> dk(32, 0x01);
    const auto endpoint = RegistryWire::BuildReadEndpoint(pk, dk);
    std::string expected = "/skynet/registry?publickey=ed25519%3A";
    for (int i = 0; i < 32; ++i) {
        expected += "ab";
    }
    expected += "&datakey=";
    for (int i = 0; i < 32; ++i) {
        expected += "01";
    }
    REQUIRE(endpoint == expected);
}

TEST_CASE("RegistryWire - read responses", "[registry][wire]") {
    SECTION("Numeric revision") {
        auto parsed = RegistryWire::ParseReadResponse(ReadBody("7"));
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().revision == 7);
        REQUIRE(parsed.Unwrap().data == std::vector<uint8_t>{0x01, 0x02, 0xFF});
        REQUIRE(parsed.Unwrap().signature[0] == 0xAA);
    }
    SECTION("Revisions above 2^53 keep full precision") {
        auto number = RegistryWire::ParseReadResponse(ReadBody("18446744073709551615"));
        REQUIRE(number.IsOk());
        REQUIRE(number.Unwrap().revision == 18446744073709551615ULL);
        auto text = RegistryWire::ParseReadResponse(ReadBody(R"("9007199254740993")"));
        REQUIRE(text.IsOk());
        REQUIRE(text.Unwrap().revision == 9007199254740993ULL);
    }
    SECTION("Negative and fractional revisions are rejected") {
        auto negative = RegistryWire::ParseReadResponse(ReadBody("-1"));
        REQUIRE(negative.IsErr());
        REQUIRE(negative.UnwrapErr().type == KernelFailureType::Range);
        REQUIRE(RegistryWire::ParseReadResponse(ReadBody("1.5")).IsErr());
        REQUIRE(RegistryWire::ParseReadResponse(ReadBody("true")).IsErr());
    }
    SECTION("Malformed bodies are decode errors") {
        for (const std::string body : {"", "[]", "not json", R"({"revision":1})",
                                       R"({"data":"zz","revision":1,"signature":""})"}) {
            auto parsed = RegistryWire::ParseReadResponse(body);
            REQUIRE(parsed.IsErr());
            REQUIRE(parsed.UnwrapErr().type == KernelFailureType::Decode);
        }
    }
    SECTION("Signature must be 64 bytes") {
        const std::string body = R"({"data":"","revision":1,"signature":"abcd"})";
        REQUIRE(RegistryWire::ParseReadResponse(body).IsErr());
    }
    SECTION("Data larger than a registry entry is rejected") {
        const std::string body = R"({"data":")" + std::string(87 * 2, '0') +
                                 R"(","revision":1,"signature":")" + kSignatureHex + R"("})";
        auto parsed = RegistryWire::ParseReadResponse(body);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == KernelFailureType::DataTooLarge);
    }
}

TEST_CASE("RegistryWire - write body", "[registry][wire]") {
    models::RegistryEntry entry;
    entry.public_key.fill(3);
    entry.datakey.fill(4);
    entry.data = {9, 8, 7};
    entry.revision = 42;
    entry.signature.fill(5);

    const auto body = RegistryWire::BuildWriteBody(entry);
    const auto parsed = json::parse(body);
    REQUIRE(parsed["publickey"]["algorithm"] == "ed25519");
    REQUIRE(parsed["publickey"]["key"].size() == 32);
    REQUIRE(parsed["datakey"] == Encoding::BufToHex(entry.datakey));
    REQUIRE(parsed["revision"] == 42);
    REQUIRE(parsed["data"] == json::array({9, 8, 7}));
    REQUIRE(parsed["signature"].size() == 64);

    auto decoded = RegistryWire::ParseWriteBody(body);
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap().public_key == entry.public_key);
    REQUIRE(decoded.Unwrap().datakey == entry.datakey);
    REQUIRE(decoded.Unwrap().data == entry.data);
    REQUIRE(decoded.Unwrap().revision == entry.revision);
    REQUIRE(decoded.Unwrap().signature == entry.signature);
}

TEST_CASE("RegistryWire - proof chains", "[registry][wire]") {
    json element = {
        {"data", "00112233"},
        {"revision", 3},
        {"datakey", std::string(64, '1')},
        {"publickey", {{"algorithm", "ed25519"}, {"key", Encoding::BufToB64(std::vector<uint8_t>(32, 2))}}},
        {"signature", kSignatureHex}
    };

    SECTION("Elements decode with base64 keys") {
        auto chain = RegistryWire::ParseProofChain(json::array({element, element}).dump());
        REQUIRE(chain.IsOk());
        REQUIRE(chain.Unwrap().size() == 2);
        REQUIRE(chain.Unwrap()[0].revision == 3);
        REQUIRE(chain.Unwrap()[0].public_key[0] == 2);
        REQUIRE(chain.Unwrap()[0].datakey[0] == 0x11);
    }
    SECTION("Elements decode with byte array keys") {
        element["publickey"]["key"] = std::vector<uint8_t>(32, 6);
        auto chain = RegistryWire::ParseProofChain(json::array({element}).dump());
        REQUIRE(chain.IsOk());
        REQUIRE(chain.Unwrap()[0].public_key[31] == 6);
    }
    SECTION("Errors name the failing element") {
        json broken = element;
        broken["publickey"]["algorithm"] = "rsa";
        auto chain = RegistryWire::ParseProofChain(json::array({element, broken}).dump());
        REQUIRE(chain.IsErr());
        REQUIRE(chain.UnwrapErr().message.rfind("proof element 1: ", 0) == 0);
    }
    SECTION("Non-array proofs are rejected") {
        REQUIRE(RegistryWire::ParseProofChain(element.dump()).IsErr());
        REQUIRE(RegistryWire::ParseProofChain("garbage").IsErr());
    }
}
