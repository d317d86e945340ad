#include "skykernel/skylink/skyfile_transfer.hpp"
#include "skykernel/skylink/skyfile.hpp"
#include "skykernel/skylink/skylink_bitfield.hpp"
#include "skykernel/skylink/merkle.hpp"
#include "skykernel/registry/registry.hpp"
#include "skykernel/registry/registry_client.hpp"
#include "skykernel/registry/registry_wire.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <optional>

namespace skykernel::skylink {
    using encoding::Encoding;
    using registry::Registry;

    namespace {
        Result<models::SkylinkBytes, KernelFailure> DecodeSkylink(const std::string_view text) {
            auto bytes = Encoding::B64ToBuf(text);
            if (bytes.IsErr()) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    bytes.UnwrapErr().WithContext("unable to decode skylink"));
            }
            if (bytes.Unwrap().size() != SkylinkConstants::SKYLINK_SIZE) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    KernelFailure::InvalidInput(fmt::format(
                        "skylink decodes to {} bytes, expected {}",
                        bytes.Unwrap().size(), SkylinkConstants::SKYLINK_SIZE)));
            }
            models::SkylinkBytes skylink{};
            std::copy(bytes.Unwrap().begin(), bytes.Unwrap().end(), skylink.begin());
            return Result<models::SkylinkBytes, KernelFailure>::Ok(skylink);
        }

        std::span<const uint8_t> LinkRoot(const models::SkylinkBytes& skylink) {
            return std::span<const uint8_t>(skylink).subspan(SkylinkConstants::ROOT_OFFSET);
        }
    }

    Result<DownloadResult, KernelFailure> VerifyBaseSector(
        const models::SkylinkBytes& skylink,
        const std::span<const uint8_t> sector) {
        auto parsed = SkylinkBitfield::ParseSkylinkBitfield(skylink);
        if (parsed.IsErr()) {
            return Result<DownloadResult, KernelFailure>::Err(parsed.UnwrapErr());
        }
        const auto bitfield = parsed.Unwrap();
        if (bitfield.version != 1) {
            return Result<DownloadResult, KernelFailure>::Err(
                KernelFailure::Verification("base sector can only be checked against a v1 skylink"));
        }
        if (sector.size() != SkylinkConstants::SECTOR_SIZE) {
            return Result<DownloadResult, KernelFailure>::Err(
                KernelFailure::Verification(fmt::format(
                    "expected a {} byte base sector, got {} bytes", SkylinkConstants::SECTOR_SIZE, sector.size())));
        }
        auto root = Merkle::BlakeMerkleRoot(sector);
        if (root.IsErr()) {
            return Result<DownloadResult, KernelFailure>::Err(root.UnwrapErr());
        }
        const auto expected = LinkRoot(skylink);
        if (!std::equal(expected.begin(), expected.end(), root.Unwrap().begin(), root.Unwrap().end())) {
            return Result<DownloadResult, KernelFailure>::Err(
                KernelFailure::Verification("base sector does not match the skylink merkle root"));
        }

        auto content = Skyfile::ExtractContent(sector.subspan(bitfield.offset, bitfield.fetch_size));
        if (content.IsErr()) {
            return Result<DownloadResult, KernelFailure>::Err(content.UnwrapErr());
        }
        DownloadResult result;
        result.resolved_skylink = skylink;
        result.metadata = std::move(content.Unwrap().metadata);
        result.data = std::move(content.Unwrap().data);
        return Result<DownloadResult, KernelFailure>::Ok(std::move(result));
    }

    Result<models::SkylinkBytes, KernelFailure> ResolveProofChain(
        const models::SkylinkBytes& skylink,
        const std::string_view proof_header) {
        auto chain = registry::RegistryWire::ParseProofChain(proof_header);
        if (chain.IsErr()) {
            return Result<models::SkylinkBytes, KernelFailure>::Err(
                chain.UnwrapErr().WithContext("unable to parse registry proof"));
        }
        if (chain.Unwrap().empty()) {
            return Result<models::SkylinkBytes, KernelFailure>::Err(
                KernelFailure::Verification("registry proof is empty"));
        }

        models::SkylinkBytes current = skylink;
        const auto& entries = chain.Unwrap();
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            auto entry_id = Registry::DeriveRegistryEntryID(entry.public_key, entry.datakey);
            if (entry_id.IsErr()) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(entry_id.UnwrapErr());
            }
            const auto expected = LinkRoot(current);
            if (!std::equal(expected.begin(), expected.end(), entry_id.Unwrap().begin(), entry_id.Unwrap().end())) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    KernelFailure::Verification(fmt::format("proof element {} is for a different entry", i)));
            }
            if (!Registry::VerifyRegistryEntry(entry)) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    KernelFailure::Verification(fmt::format("proof element {} has an invalid signature", i)));
            }
            if (entry.data.size() != SkylinkConstants::SKYLINK_SIZE) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    KernelFailure::Verification(fmt::format("proof element {} does not hold a skylink", i)));
            }
            std::copy(entry.data.begin(), entry.data.end(), current.begin());

            auto parsed = SkylinkBitfield::ParseSkylinkBitfield(current);
            if (parsed.IsErr()) {
                return Result<models::SkylinkBytes, KernelFailure>::Err(
                    parsed.UnwrapErr().WithContext(fmt::format("proof element {}", i)));
            }
            if (parsed.Unwrap().version == 1) {
                if (i + 1 != entries.size()) {
                    return Result<models::SkylinkBytes, KernelFailure>::Err(
                        KernelFailure::Verification("registry proof continues past a v1 skylink"));
                }
                return Result<models::SkylinkBytes, KernelFailure>::Ok(current);
            }
        }
        return Result<models::SkylinkBytes, KernelFailure>::Err(
            KernelFailure::Verification("registry proof does not end in a v1 skylink"));
    }

    Result<DownloadResult, KernelFailure> DownloadSkylink(
        interfaces::IHttpTransport& transport,
        const std::vector<std::string>& hosts,
        const std::string_view skylink,
        const fetch::CancellationToken& cancel) {
        auto decoded = DecodeSkylink(skylink);
        if (decoded.IsErr()) {
            return Result<DownloadResult, KernelFailure>::Err(decoded.UnwrapErr());
        }
        const auto link = decoded.Unwrap();
        auto parsed = SkylinkBitfield::ParseSkylinkBitfield(link);
        if (parsed.IsErr()) {
            return Result<DownloadResult, KernelFailure>::Err(
                parsed.UnwrapErr().WithContext("skylink is not valid"));
        }
        const bool is_v2 = parsed.Unwrap().version == 2;

        std::optional<DownloadResult> verified;
        const fetch::ResponseVerifier verify =
            [&verified, &link, is_v2](const interfaces::HttpResponse& response) {
                models::SkylinkBytes target = link;
                if (is_v2) {
                    const auto proof = response.Header(SkyfileConstants::PROOF_HEADER);
                    if (!proof.has_value()) {
                        return Result<Unit, KernelFailure>::Err(
                            KernelFailure::Verification("response is missing the skynet-proof header"));
                    }
                    auto resolved = ResolveProofChain(link, *proof);
                    if (resolved.IsErr()) {
                        return Result<Unit, KernelFailure>::Err(resolved.UnwrapErr());
                    }
                    target = resolved.Unwrap();
                }
                auto content = VerifyBaseSector(target, response.body);
                if (content.IsErr()) {
                    return Result<Unit, KernelFailure>::Err(content.UnwrapErr());
                }
                verified = std::move(content).Unwrap();
                return Result<Unit, KernelFailure>::Ok(unit);
            };

        const auto endpoint = fmt::format("{}{}", SkyfileConstants::BASE_SECTOR_ENDPOINT, skylink);
        const auto result = fetch::ProgressiveFetch(transport, endpoint, {}, hosts, verify, cancel);
        if (!result.success || !verified.has_value()) {
            return Result<DownloadResult, KernelFailure>::Err(
                registry::FetchFailure(result, "unable to download skylink"));
        }
        verified->host = result.host;
        SKY_LOG_MSG(debug::Component::Skylink, "download verified from " + result.host);
        return Result<DownloadResult, KernelFailure>::Ok(std::move(*verified));
    }

    Result<std::string, KernelFailure> UploadSkyfile(
        interfaces::IHttpTransport& transport,
        const std::vector<std::string>& hosts,
        const std::span<const uint8_t> file_data,
        const nlohmann::json& metadata,
        const fetch::CancellationToken& cancel) {
        auto base = Skyfile::BuildBaseSector(file_data, metadata);
        if (base.IsErr()) {
            return Result<std::string, KernelFailure>::Err(base.UnwrapErr());
        }
        const auto& sector = base.Unwrap();
        auto header = Skyfile::BuildUploadHeader(sector.skylink_text);
        if (header.IsErr()) {
            return Result<std::string, KernelFailure>::Err(header.UnwrapErr());
        }

        fetch::FetchOptions options;
        options.method = "POST";
        options.body.reserve(header.Unwrap().size() + sector.sector.size());
        options.body.insert(options.body.end(), header.Unwrap().begin(), header.Unwrap().end());
        options.body.insert(options.body.end(), sector.sector.begin(), sector.sector.end());

        const std::string expected = sector.skylink_text;
        const fetch::ResponseVerifier verify = [&expected](const interfaces::HttpResponse& response) {
            const auto body = nlohmann::json::parse(response.Text(), nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                return Result<Unit, KernelFailure>::Err(
                    KernelFailure::Verification("unable to read response body"));
            }
            const auto skylink = body.find("skylink");
            if (skylink == body.end() || !skylink->is_string()) {
                return Result<Unit, KernelFailure>::Err(
                    KernelFailure::Verification("response is missing the skylink field"));
            }
            if (skylink->get<std::string>() != expected) {
                return Result<Unit, KernelFailure>::Err(KernelFailure::Verification(fmt::format(
                    "wrong skylink was returned, expecting {} but got {}",
                    expected, skylink->get<std::string>())));
            }
            return Result<Unit, KernelFailure>::Ok(unit);
        };

        const auto result = fetch::ProgressiveFetch(
            transport, SkyfileConstants::RESTORE_ENDPOINT, options, hosts, verify, cancel);
        if (!result.success) {
            return Result<std::string, KernelFailure>::Err(
                registry::FetchFailure(result, "unable to upload skyfile"));
        }
        return Result<std::string, KernelFailure>::Ok(expected);
    }
}
