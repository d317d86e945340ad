#include <catch2/catch_test_macros.hpp>
#include "helpers/mock_http_transport.hpp"
#include "helpers/registry_fixtures.hpp"
#include "skykernel/registry/registry_client.hpp"
#include "skykernel/skylink/skyfile.hpp"
#include "skykernel/skylink/skyfile_transfer.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
using namespace skykernel;
using namespace skykernel::test_helpers;
using registry::RegistryClient;

TEST_CASE("Untrusted portals - forged registry entries are skipped", "[security][portals]") {
    const auto keys = EntryKeys("untrusted portals", "profile");
    const auto honest = SignedEntry(keys, {1, 1, 1}, 5);

    auto forged = honest;
    forged.data = {6, 6, 6};
    forged.revision = 99;

    auto transport = std::make_shared<MockHttpTransport>();
    transport->SetStatus("evil.example", 200, ReadResponseBody(forged));
    transport->SetStatus("good.example", 200, ReadResponseBody(honest));

    const RegistryClient client(transport, {"evil.example", "good.example"});
    auto read = client.ReadEntry(keys.keypair.GetPublicKey(), keys.datakey);
    REQUIRE(read.IsOk());
    REQUIRE(read.Unwrap().exists);
    REQUIRE(read.Unwrap().host == "good.example");
    REQUIRE(read.Unwrap().entry.data == honest.data);
    REQUIRE(read.Unwrap().entry.revision == 5);
}

TEST_CASE("Untrusted portals - an entry signed by another key is rejected", "[security][portals]") {
    const auto keys = EntryKeys("untrusted portals", "profile");
    const auto impostor = EntryKeys("untrusted portals", "impostor");
    auto entry = SignedEntry(impostor, {4, 2}, 1);

    auto transport = std::make_shared<MockHttpTransport>();
    transport->SetStatus("evil.example", 200, ReadResponseBody(entry));

    const RegistryClient client(transport, {"evil.example"});
    auto read = client.ReadEntry(keys.keypair.GetPublicKey(), keys.datakey);
    REQUIRE(read.IsErr());
    REQUIRE(read.UnwrapErr().type == KernelFailureType::Transport);
    REQUIRE(read.UnwrapErr().message.find("signature mismatch") != std::string::npos);
}

TEST_CASE("Untrusted portals - a hidden entry is not reported absent while another portal disagrees", "[security][portals]") {
    const auto keys = EntryKeys("untrusted portals", "profile");
    const auto honest = SignedEntry(keys, {7}, 2);

    auto transport = std::make_shared<MockHttpTransport>();
    transport->SetStatus("hiding.example", 404);
    transport->SetStatus("good.example", 200, ReadResponseBody(honest));

    const RegistryClient client(transport, {"hiding.example", "good.example"});
    auto read = client.ReadEntry(keys.keypair.GetPublicKey(), keys.datakey);
    REQUIRE(read.IsOk());
    REQUIRE(read.Unwrap().exists);
    REQUIRE(read.Unwrap().host == "good.example");
}

TEST_CASE("Untrusted portals - uploads only trust a matching skylink", "[security][portals]") {
    const std::vector<uint8_t> file = {'h', 'e', 'l', 'l', 'o'};
    const nlohmann::json metadata = {{"Filename", "hello.txt"}};
    const auto expected = skylink::Skyfile::BuildBaseSector(file, metadata).Unwrap().skylink_text;

    MockHttpTransport transport;
    transport.SetStatus("liar.example", 200, nlohmann::json({{"skylink", std::string(46, 'A')}}).dump());
    transport.SetStatus("good.example", 200, nlohmann::json({{"skylink", expected}}).dump());

    auto uploaded = skylink::UploadSkyfile(transport, {"liar.example", "good.example"}, file, metadata);
    REQUIRE(uploaded.IsOk());
    REQUIRE(uploaded.Unwrap() == expected);
    REQUIRE(transport.RequestCount() == 2);
}

TEST_CASE("Untrusted portals - tampered downloads are skipped", "[security][portals]") {
    const std::vector<uint8_t> file = {'d', 'a', 't', 'a'};
    const auto base = skylink::Skyfile::BuildBaseSector(file, nlohmann::json{{"Filename", "data.bin"}}).Unwrap();

    auto tampered = base.sector;
    tampered[SkyfileConstants::LAYOUT_SIZE + 20] ^= 0x01;

    MockHttpTransport transport;
    transport.SetHost("evil.example", [tampered](const HttpRequest&) {
        return Result<HttpResponse, KernelFailure>::Ok(MockHttpTransport::MakeResponse(200, tampered));
    });
    transport.SetHost("good.example", [sector = base.sector](const HttpRequest&) {
        return Result<HttpResponse, KernelFailure>::Ok(MockHttpTransport::MakeResponse(200, sector));
    });

    SECTION("The honest portal is used") {
        auto download = skylink::DownloadSkylink(transport, {"evil.example", "good.example"}, base.skylink_text);
        REQUIRE(download.IsOk());
        REQUIRE(download.Unwrap().host == "good.example");
        REQUIRE(download.Unwrap().data == file);
    }
    SECTION("Only a dishonest portal fails the download") {
        auto download = skylink::DownloadSkylink(transport, {"evil.example"}, base.skylink_text);
        REQUIRE(download.IsErr());
        REQUIRE(download.UnwrapErr().message.find("merkle root") != std::string::npos);
    }
}
