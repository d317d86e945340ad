#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/configuration/kernel_config.hpp"
#include "skykernel/fetch/progressive_fetch.hpp"
#include "skykernel/interfaces/i_http_transport.hpp"
#include "skykernel/models/ed25519_keypair.hpp"
#include "skykernel/models/registry_entry.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace skykernel::registry {
struct ReadEntryResult {
    bool exists = false;
    models::RegistryEntry entry;
    std::string host;
};

/**
 * @brief Reads and writes registry entries through untrusted portals
 *
 * A read is only accepted when the returned entry carries a valid signature
 * for the requested public key and datakey. A 404 counts as "no entry" only
 * after every portal has been tried without a verified answer.
 */
class RegistryClient {
public:
    RegistryClient(
        std::shared_ptr<interfaces::IHttpTransport> transport,
        std::vector<std::string> portals);

    /// Client over the portals of a kernel configuration, tried in order.
    [[nodiscard]] static RegistryClient FromConfig(
        std::shared_ptr<interfaces::IHttpTransport> transport,
        const configuration::KernelConfig& config);

    [[nodiscard]] Result<ReadEntryResult, KernelFailure> ReadEntry(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> datakey,
        const fetch::CancellationToken& cancel = fetch::CancellationToken()) const;

    /// Signs locally and posts the entry. Only a 2xx counts as accepted.
    [[nodiscard]] Result<Unit, KernelFailure> WriteEntry(
        const models::Ed25519Keypair& keypair,
        std::span<const uint8_t> datakey,
        std::span<const uint8_t> data,
        uint64_t revision,
        const fetch::CancellationToken& cancel = fetch::CancellationToken()) const;

    [[nodiscard]] const std::vector<std::string>& Portals() const noexcept {
        return portals_;
    }
private:
    std::shared_ptr<interfaces::IHttpTransport> transport_;
    std::vector<std::string> portals_;
};

/// Failure describing an exhausted or cancelled fetch, with its trail.
KernelFailure FetchFailure(const fetch::FetchResult& result, std::string_view operation);
}
