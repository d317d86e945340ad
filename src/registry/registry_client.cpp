#include "skykernel/registry/registry_client.hpp"
#include "skykernel/registry/registry.hpp"
#include "skykernel/registry/registry_wire.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace skykernel::registry {
    namespace {
        constexpr int HTTP_OK = 200;
        constexpr int HTTP_NOT_FOUND = 404;
    }

    KernelFailure FetchFailure(const fetch::FetchResult& result, const std::string_view operation) {
        if (result.cancelled) {
            return KernelFailure::Cancelled(fmt::format("{}: cancelled", operation));
        }
        std::string message = fmt::format("{}: {} portals failed", operation, result.failed_hosts.size());
        for (const auto& log : result.logs) {
            message += "\n";
            message += log;
        }
        return KernelFailure::Transport(std::move(message));
    }

    RegistryClient::RegistryClient(
        std::shared_ptr<interfaces::IHttpTransport> transport,
        std::vector<std::string> portals)
        : transport_(std::move(transport))
        , portals_(std::move(portals)) {
        if (!transport_) {
            throw std::invalid_argument("RegistryClient requires a transport");
        }
    }

    RegistryClient RegistryClient::FromConfig(
        std::shared_ptr<interfaces::IHttpTransport> transport,
        const configuration::KernelConfig& config) {
        return RegistryClient(std::move(transport), config.Portals());
    }

    Result<ReadEntryResult, KernelFailure> RegistryClient::ReadEntry(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> datakey,
        const fetch::CancellationToken& cancel) const {
        if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
            return Result<ReadEntryResult, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength(std::string(ErrorMessages::PUBKEY_WRONG_LENGTH)));
        }
        if (datakey.size() != RegistryConstants::DATAKEY_SIZE) {
            return Result<ReadEntryResult, KernelFailure>::Err(
                KernelFailure::InvalidKeyLength(std::string(ErrorMessages::DATAKEY_WRONG_LENGTH)));
        }

        std::optional<RegistryReadResponse> accepted;
        const fetch::ResponseVerifier verify =
            [&accepted, public_key, datakey](const interfaces::HttpResponse& response) {
                if (response.status != HTTP_OK) {
                    return Result<Unit, KernelFailure>::Err(KernelFailure::Verification(
                        fmt::format("expected 200 response status, got: {}", response.status)));
                }
                auto parsed = RegistryWire::ParseReadResponse(response.Text());
                if (parsed.IsErr()) {
                    return Result<Unit, KernelFailure>::Err(
                        parsed.UnwrapErr().WithContext("unable to decode response"));
                }
                const auto& entry = parsed.Unwrap();
                if (!Registry::VerifyRegistrySignature(
                        public_key, datakey, entry.data, entry.revision, entry.signature)) {
                    return Result<Unit, KernelFailure>::Err(
                        KernelFailure::Verification("response failed verification: signature mismatch"));
                }
                accepted = std::move(parsed).Unwrap();
                return Result<Unit, KernelFailure>::Ok(unit);
            };

        const auto endpoint = RegistryWire::BuildReadEndpoint(public_key, datakey);
        const auto result = fetch::ProgressiveFetch(*transport_, endpoint, {}, portals_, verify, cancel);

        ReadEntryResult read;
        std::copy(public_key.begin(), public_key.end(), read.entry.public_key.begin());
        std::copy(datakey.begin(), datakey.end(), read.entry.datakey.begin());
        if (result.success && accepted.has_value()) {
            read.exists = true;
            read.host = result.host;
            read.entry.data = std::move(accepted->data);
            read.entry.revision = accepted->revision;
            read.entry.signature = accepted->signature;
            debug::LogRegistryEntry(read.entry.public_key, read.entry.datakey, read.entry.revision);
            return Result<ReadEntryResult, KernelFailure>::Ok(std::move(read));
        }
        if (!result.cancelled && result.HasFailedStatus(HTTP_NOT_FOUND)) {
            SKY_LOG_MSG(debug::Component::Registry, "no portal had the entry, reporting it as absent");
            return Result<ReadEntryResult, KernelFailure>::Ok(std::move(read));
        }
        return Result<ReadEntryResult, KernelFailure>::Err(
            FetchFailure(result, "unable to read registry entry"));
    }

    Result<Unit, KernelFailure> RegistryClient::WriteEntry(
        const models::Ed25519Keypair& keypair,
        const std::span<const uint8_t> datakey,
        const std::span<const uint8_t> data,
        const uint64_t revision,
        const fetch::CancellationToken& cancel) const {
        auto signature = Registry::ComputeRegistrySignature(keypair.GetSecretKey(), datakey, data, revision);
        if (signature.IsErr()) {
            return Result<Unit, KernelFailure>::Err(
                signature.UnwrapErr().WithContext("unable to write registry entry"));
        }

        models::RegistryEntry entry;
        entry.public_key = keypair.GetPublicKey();
        std::copy(datakey.begin(), datakey.end(), entry.datakey.begin());
        entry.data.assign(data.begin(), data.end());
        entry.revision = revision;
        entry.signature = signature.Unwrap();

        fetch::FetchOptions options;
        options.method = "POST";
        options.headers.emplace_back("Content-Type", "application/json");
        const auto body = RegistryWire::BuildWriteBody(entry);
        options.body.assign(body.begin(), body.end());

        const fetch::ResponseVerifier accept_any = [](const interfaces::HttpResponse&) {
            return Result<Unit, KernelFailure>::Ok(unit);
        };
        const auto result = fetch::ProgressiveFetch(
            *transport_, RegistryConstants::ENDPOINT, options, portals_, accept_any, cancel);
        if (!result.success) {
            return Result<Unit, KernelFailure>::Err(
                FetchFailure(result, "unable to write registry entry"));
        }
        debug::LogRegistryEntry(entry.public_key, entry.datakey, entry.revision);
        return Result<Unit, KernelFailure>::Ok(unit);
    }
}
