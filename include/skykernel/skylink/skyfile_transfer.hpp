#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/fetch/progressive_fetch.hpp"
#include "skykernel/models/skylink.hpp"
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace skykernel::skylink {
struct DownloadResult {
    std::string host;
    /// The v1 link the content was verified against, after resolving v2 links.
    models::SkylinkBytes resolved_skylink{};
    std::string metadata;
    std::vector<uint8_t> data;
};

/**
 * @brief Download and verify the file behind a skylink
 *
 * v1 links: the body must be the full base sector and hash to the link's
 * Merkle root. v2 links: the skynet-proof header must hold a chain of
 * correctly signed registry entries from the link's entry ID to a v1 link
 * matching the body.
 */
Result<DownloadResult, KernelFailure> DownloadSkylink(
    interfaces::IHttpTransport& transport,
    const std::vector<std::string>& hosts,
    std::string_view skylink,
    const fetch::CancellationToken& cancel = fetch::CancellationToken());

/**
 * @brief Upload a small file, trusting no portal with its skylink
 *
 * The skylink is computed locally and a portal's answer is only accepted if
 * it returns the same link.
 *
 * @return Ok(skylink text) or Err(DataTooLarge / InvalidMetadata / Transport)
 */
Result<std::string, KernelFailure> UploadSkyfile(
    interfaces::IHttpTransport& transport,
    const std::vector<std::string>& hosts,
    std::span<const uint8_t> file_data,
    const nlohmann::json& metadata,
    const fetch::CancellationToken& cancel = fetch::CancellationToken());

/// Checks a fetched base sector against a v1 skylink and extracts its file.
Result<DownloadResult, KernelFailure> VerifyBaseSector(
    const models::SkylinkBytes& skylink,
    std::span<const uint8_t> sector);

/**
 * @brief Follow a skynet-proof chain from a v2 link to the v1 link it names
 */
Result<models::SkylinkBytes, KernelFailure> ResolveProofChain(
    const models::SkylinkBytes& skylink,
    std::string_view proof_header);
}
