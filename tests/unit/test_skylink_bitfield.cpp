#include <catch2/catch_test_macros.hpp>
#include "skykernel/skylink/skylink_bitfield.hpp"
#include "skykernel/encoding/encoding.hpp"
#include <utility>
using namespace skykernel;
using namespace skykernel::skylink;
using skykernel::encoding::Encoding;

TEST_CASE("SkylinkBitfield - v1 size classes", "[skylink][bitfield]") {
    const std::vector<std::pair<uint64_t, uint64_t>> cases = {
        {0, 4096}, {1, 4096}, {100, 4096}, {200, 4096}, {4095, 4096}, {4096, 4096},
        {4097, 8192}, {8191, 8192}, {8192, 8192}, {8193, 12288}, {12287, 12288},
        {12288, 12288}, {12289, 16384}, {16384, 16384}, {32767, 32768}, {32768, 32768},
        {32769, 36864}, {36863, 36864}, {36864, 36864}, {36865, 40960}, {45056, 45056},
        {45057, 49152}, {65536, 65536}, {65537, 73728}, {106496, 106496}, {106497, 114688},
        {163840, 163840}, {163841, 180224}, {491520, 491520}, {491521, 524288},
        {720896, 720896}, {720897, 786432}, {1572864, 1572864}, {1572865, 1703936},
        {3407872, 3407872}, {3407873, 3670016},
    };

    models::SkylinkBytes skylink{};
    for (const auto& [size, expected_fetch] : cases) {
        auto bitfield = SkylinkBitfield::SkylinkV1Bitfield(size);
        REQUIRE(bitfield.IsOk());
        skylink[0] = bitfield.Unwrap()[0];
        skylink[1] = bitfield.Unwrap()[1];

        auto parsed = SkylinkBitfield::ParseSkylinkBitfield(skylink);
        REQUIRE(parsed.IsOk());
        CHECK(parsed.Unwrap().version == 1);
        CHECK(parsed.Unwrap().offset == 0);
        CHECK(parsed.Unwrap().fetch_size == expected_fetch);
    }
}

TEST_CASE("SkylinkBitfield - full sector", "[skylink][bitfield]") {
    auto bitfield = SkylinkBitfield::SkylinkV1Bitfield(1ULL << 22);
    REQUIRE(bitfield.IsOk());
    REQUIRE(bitfield.Unwrap()[0] == 0xfc);
    REQUIRE(bitfield.Unwrap()[1] == 0x1d);

    models::SkylinkBytes skylink{};
    skylink[0] = 0xfc;
    skylink[1] = 0x1d;
    auto parsed = SkylinkBitfield::ParseSkylinkBitfield(skylink);
    REQUIRE(parsed.IsOk());
    REQUIRE(parsed.Unwrap().fetch_size == (1ULL << 22));

    auto too_big = SkylinkBitfield::SkylinkV1Bitfield((1ULL << 22) + 1);
    REQUIRE(too_big.IsErr());
    REQUIRE(too_big.UnwrapErr().type == KernelFailureType::InvalidBitfield);
}

TEST_CASE("SkylinkBitfield - parse rejects invalid bitfields", "[skylink][bitfield]") {
    models::SkylinkBytes skylink{};

    SECTION("Versions above 2") {
        skylink[0] = 0x02;
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(skylink).IsErr());
        skylink[0] = 0x03;
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(skylink).IsErr());
    }
    SECTION("v2 links with extra bits") {
        skylink[0] = 0x01;
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(skylink).IsOk());
        skylink[1] = 0x01;
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(skylink).IsErr());
    }
    SECTION("All mode bits set") {
        skylink[0] = 0xfc;
        skylink[1] = 0x03;
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(skylink).IsErr());
    }
    SECTION("Offset past the end of the sector") {
        // mode 7 with the largest offset
        skylink[0] = 0xfc;
        skylink[1] = 0xe1;
        auto parsed = SkylinkBitfield::ParseSkylinkBitfield(skylink);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == KernelFailureType::InvalidBitfield);
    }
    SECTION("Wrong length") {
        std::vector<uint8_t> short_link(33, 0);
        REQUIRE(SkylinkBitfield::ParseSkylinkBitfield(short_link).IsErr());
    }
}

TEST_CASE("SkylinkBitfield - ValidSkylink", "[skylink][bitfield]") {
    models::SkylinkBytes skylink{};
    REQUIRE(SkylinkBitfield::ValidSkylink(std::span<const uint8_t>(skylink)));
    const auto text = Encoding::BufToB64(skylink);
    REQUIRE(text.size() == 46);
    REQUIRE(SkylinkBitfield::ValidSkylink(std::string_view(text)));

    REQUIRE_FALSE(SkylinkBitfield::ValidSkylink(std::string_view("not a skylink")));
    REQUIRE_FALSE(SkylinkBitfield::ValidSkylink(std::string_view(text).substr(0, 45)));

    skylink[0] = 0x03;
    REQUIRE_FALSE(SkylinkBitfield::ValidSkylink(std::span<const uint8_t>(skylink)));
}
