#include <catch2/catch_test_macros.hpp>
#include "skykernel/skylink/skyfile_validation.hpp"
#include <nlohmann/json.hpp>
#include <utility>
using namespace skykernel;
using namespace skykernel::skylink;
using json = nlohmann::json;

TEST_CASE("SkyfileValidation - paths", "[skylink][validation]") {
    const std::vector<std::pair<std::string, bool>> cases = {
        {"test", true},
        {"test/subtrial", true},
        {"test/subtrial.ext", true},
        {"test/trial.ext/subtrial.ext", true},
        {"", false},
        {".", false},
        {"..", false},
        {"./", false},
        {"a//b", false},
        {"a/./b", false},
        {"a/../b", false},
        {"../a/b", false},
        {"/sometrial", false},
        {"sometrial/", false},
    };
    for (const auto& [path, valid] : cases) {
        INFO("path: '" << path << "'");
        const auto result = SkyfileValidation::ValidateSkyfilePath(path);
        CHECK(result.IsOk() == valid);
        if (!valid) {
            CHECK(result.UnwrapErr().type == KernelFailureType::InvalidPath);
        }
    }
}

TEST_CASE("SkyfileValidation - metadata", "[skylink][validation]") {
    SECTION("A plain filename is accepted") {
        REQUIRE(SkyfileValidation::ValidateSkyfileMetadata(json{{"Filename", "notes.txt"}}).IsOk());
        REQUIRE(SkyfileValidation::ValidateSkyfileMetadataJson(R"({"Filename":"a/b.txt"})").IsOk());
    }
    SECTION("Filename must exist and be a valid path") {
        auto missing = SkyfileValidation::ValidateSkyfileMetadata(json::object());
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().message == "metadata.Filename does not exist");

        auto number = SkyfileValidation::ValidateSkyfileMetadata(json{{"Filename", 5}});
        REQUIRE(number.IsErr());
        REQUIRE(number.UnwrapErr().message == "metadata.Filename is not a string");

        auto bad_path = SkyfileValidation::ValidateSkyfileMetadata(json{{"Filename", "/etc"}});
        REQUIRE(bad_path.IsErr());
        REQUIRE(bad_path.UnwrapErr().type == KernelFailureType::InvalidMetadata);
        REQUIRE(bad_path.UnwrapErr().message ==
                "metadata.Filename does not have a valid path: metadata.Filename cannot start with /");
    }
    SECTION("Unsupported fields are rejected") {
        const std::vector<json> rejected = {
            json{{"Filename", "a"}, {"Subfiles", json::object()}},
            json{{"Filename", "a"}, {"DefaultPath", "index.html"}},
            json{{"Filename", "a"}, {"DefaultPath", "x"}, {"DisableDefaultPath", true}},
            json{{"Filename", "a"}, {"TryFiles", json::array({"index.html"})}},
            json{{"Filename", "a"}, {"TryFiles", json::array()}},
            json{{"Filename", "a"}, {"TryFiles", "index.html"}},
            json{{"Filename", "a"}, {"ErrorPages", json::object()}},
        };
        for (const auto& metadata : rejected) {
            INFO(metadata.dump());
            const auto result = SkyfileValidation::ValidateSkyfileMetadata(metadata);
            CHECK(result.IsErr());
        }
    }
    SECTION("Non-object and invalid JSON metadata") {
        REQUIRE(SkyfileValidation::ValidateSkyfileMetadata(json::array()).IsErr());
        auto garbage = SkyfileValidation::ValidateSkyfileMetadataJson("{not json");
        REQUIRE(garbage.IsErr());
        REQUIRE(garbage.UnwrapErr().type == KernelFailureType::InvalidMetadata);
    }
}
