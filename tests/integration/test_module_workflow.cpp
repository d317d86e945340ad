#include <catch2/catch_test_macros.hpp>
#include "helpers/mock_http_transport.hpp"
#include "helpers/registry_fixtures.hpp"
#include "skykernel/kmodule/module_router.hpp"
#include "skykernel/kmodule/query_session.hpp"
#include "skykernel/registry/registry_client.hpp"
#include <memory>
#include <string>
#include <vector>
using namespace skykernel;
using namespace skykernel::kmodule;
using namespace skykernel::test_helpers;

namespace {
    /// Sends one query through the router the way a module host would.
    QueryResponse RoundTrip(QuerySession& session, const ModuleRouter& router,
                            const std::string& method, const std::string& data) {
        auto query = session.NewQuery(method, data);
        std::string wire;
        REQUIRE(query.message.SerializeToString(&wire));

        auto response = router.HandleMessageBytes(wire);
        REQUIRE(response.IsOk());
        const std::vector<uint8_t> response_bytes(response.Unwrap().begin(), response.Unwrap().end());
        REQUIRE(session.HandleResponseBytes(response_bytes).IsOk());
        return query.response.get();
    }

    std::string ReadRequest(const registry::TaggedKeys& keys) {
        proto::ReadEntryRequest request;
        request.set_public_key(std::string(keys.keypair.GetPublicKey().begin(), keys.keypair.GetPublicKey().end()));
        request.set_datakey(std::string(keys.datakey.begin(), keys.datakey.end()));
        std::string serialized;
        REQUIRE(request.SerializeToString(&serialized));
        return serialized;
    }
}

TEST_CASE("Module workflow - readEntry through the router", "[integration][kmodule]") {
    const auto keys = EntryKeys("module workflow", "module entry");
    const auto entry = SignedEntry(keys, {'m', 'o', 'd'}, 8);

    auto transport = std::make_shared<MockHttpTransport>();
    auto client = std::make_shared<const registry::RegistryClient>(
        transport, std::vector<std::string>{"portal.example"});

    ModuleRouter router;
    REQUIRE(RegisterReadEntry(router, client).IsOk());
    REQUIRE(router.HasMethod(ModuleRouter::READ_ENTRY_METHOD));
    QuerySession session;

    SECTION("An existing entry") {
        transport->SetStatus("portal.example", 200, ReadResponseBody(entry));

        auto response = RoundTrip(session, router, "readEntry", ReadRequest(keys));
        REQUIRE(response.IsOk());

        proto::ReadEntryResponse decoded;
        REQUIRE(decoded.ParseFromString(response.Unwrap()));
        REQUIRE(decoded.exists());
        REQUIRE(decoded.data() == "mod");
        REQUIRE(decoded.revision() == 8);
        REQUIRE(decoded.signature() == std::string(entry.signature.begin(), entry.signature.end()));
    }
    SECTION("A missing entry") {
        transport->SetStatus("portal.example", 404);

        auto response = RoundTrip(session, router, "readEntry", ReadRequest(keys));
        REQUIRE(response.IsOk());

        proto::ReadEntryResponse decoded;
        REQUIRE(decoded.ParseFromString(response.Unwrap()));
        REQUIRE_FALSE(decoded.exists());
        REQUIRE(decoded.data().empty());
    }
    SECTION("Registry failures come back as query errors") {
        transport->SetStatus("portal.example", 500);

        auto response = RoundTrip(session, router, "readEntry", ReadRequest(keys));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().message.rfind("unable to read registry entry", 0) == 0);
    }
    SECTION("Malformed requests come back as query errors") {
        proto::ReadEntryRequest short_key;
        short_key.set_public_key("short");
        short_key.set_datakey(std::string(32, '\0'));
        std::string serialized;
        REQUIRE(short_key.SerializeToString(&serialized));

        auto response = RoundTrip(session, router, "readEntry", serialized);
        REQUIRE(response.IsErr());
        REQUIRE(transport->RequestCount() == 0);
    }
    SECTION("Unknown methods are answered") {
        auto response = RoundTrip(session, router, "writeEntry", "");
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().message == "unrecognized method 'writeEntry'");
    }
    REQUIRE(session.OpenQueries() == 0);
}
