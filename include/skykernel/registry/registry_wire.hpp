#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/models/registry_entry.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace skykernel::registry {
/// Fields of a portal registry read response, decoded once at the boundary.
struct RegistryReadResponse {
    std::vector<uint8_t> data;
    uint64_t revision = 0;
    models::Signature signature{};
};

/**
 * @brief JSON and query-string formats of the portal registry API
 *
 * Revisions are decoded as 64-bit integers whether the portal sends a JSON
 * number or a decimal string.
 */
class RegistryWire {
public:
    /// /skynet/registry?publickey=ed25519%3A<hex>&datakey=<hex>
    static std::string BuildReadEndpoint(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> datakey);

    static Result<RegistryReadResponse, KernelFailure> ParseReadResponse(std::string_view body);

    static std::string BuildWriteBody(const models::RegistryEntry& entry);

    static Result<models::RegistryEntry, KernelFailure> ParseWriteBody(std::string_view body);

    /**
     * @brief Parse the registry entry chain of a skynet-proof header
     *
     * Each element carries data, revision, datakey, publickey and signature.
     */
    static Result<std::vector<models::RegistryEntry>, KernelFailure> ParseProofChain(
        std::string_view header);
private:
    RegistryWire() = delete;
};
}
