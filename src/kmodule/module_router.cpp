#include "skykernel/kmodule/module_router.hpp"
#include "skykernel/registry/registry_client.hpp"
#include "skykernel/debug/trace_logger.hpp"

#include <fmt/core.h>
#include <climits>
#include <exception>
#include <stdexcept>
#include <utility>

namespace skykernel::kmodule {
    namespace {
        proto::ModuleMessage ErrorResponse(const proto::ModuleMessage& query, std::string message) {
            proto::ModuleMessage response;
            response.set_method(query.method());
            response.set_nonce(query.nonce());
            response.set_err(std::move(message));
            return response;
        }
    }

    Result<Unit, KernelFailure> ModuleRouter::RegisterMethod(std::string method, MethodHandler handler) {
        if (method.empty() || !handler) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::InvalidInput("method name and handler must be set"));
        }
        if (handlers_.contains(method)) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::InvalidInput(fmt::format("method '{}' is already registered", method)));
        }
        handlers_.emplace(std::move(method), std::move(handler));
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    bool ModuleRouter::HasMethod(const std::string_view method) const {
        return handlers_.find(method) != handlers_.end();
    }

    proto::ModuleMessage ModuleRouter::HandleMessage(const proto::ModuleMessage& query) const {
        const auto it = handlers_.find(query.method());
        if (it == handlers_.end()) {
            SKY_LOG_MSG(debug::Component::Module, "unrecognized method " + query.method());
            return ErrorResponse(query, fmt::format("unrecognized method '{}'", query.method()));
        }

        try {
            auto result = it->second(query.data());
            if (result.IsErr()) {
                return ErrorResponse(query, result.UnwrapErr().message);
            }
            proto::ModuleMessage response;
            response.set_method(query.method());
            response.set_nonce(query.nonce());
            response.set_data(std::move(result).Unwrap());
            return response;
        } catch (const std::exception& ex) {
            return ErrorResponse(query, fmt::format("method '{}' threw: {}", query.method(), ex.what()));
        }
    }

    Result<std::string, KernelFailure> ModuleRouter::HandleMessageBytes(const std::string_view bytes) const {
        if (bytes.size() > static_cast<size_t>(INT_MAX)) {
            return Result<std::string, KernelFailure>::Err(
                KernelFailure::DataTooLarge("module message is too large"));
        }
        proto::ModuleMessage query;
        if (!query.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<std::string, KernelFailure>::Err(
                KernelFailure::Decode("unable to parse module message"));
        }
        const auto response = HandleMessage(query);
        std::string serialized;
        if (!response.SerializeToString(&serialized)) {
            return Result<std::string, KernelFailure>::Err(
                KernelFailure::Generic("unable to serialize module response"));
        }
        return Result<std::string, KernelFailure>::Ok(std::move(serialized));
    }

    Result<Unit, KernelFailure> RegisterReadEntry(
        ModuleRouter& router,
        std::shared_ptr<const registry::RegistryClient> client) {
        if (!client) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::InvalidInput("registry client must not be null"));
        }
        return router.RegisterMethod(
            std::string(ModuleRouter::READ_ENTRY_METHOD),
            [client = std::move(client)](const std::string& data) {
                proto::ReadEntryRequest request;
                if (!request.ParseFromString(data)) {
                    return Result<std::string, KernelFailure>::Err(
                        KernelFailure::Decode("unable to parse readEntry request"));
                }
                const auto* pk = reinterpret_cast<const uint8_t*>(request.public_key().data());
                const auto* dk = reinterpret_cast<const uint8_t*>(request.datakey().data());
                auto read = client->ReadEntry(
                    std::span<const uint8_t>(pk, request.public_key().size()),
                    std::span<const uint8_t>(dk, request.datakey().size()));
                if (read.IsErr()) {
                    return Result<std::string, KernelFailure>::Err(read.UnwrapErr());
                }

                const auto& entry = read.Unwrap();
                proto::ReadEntryResponse response;
                response.set_exists(entry.exists);
                if (entry.exists) {
                    response.set_data(std::string(entry.entry.data.begin(), entry.entry.data.end()));
                    response.set_revision(entry.entry.revision);
                    response.set_signature(std::string(entry.entry.signature.begin(), entry.entry.signature.end()));
                }
                std::string serialized;
                if (!response.SerializeToString(&serialized)) {
                    return Result<std::string, KernelFailure>::Err(
                        KernelFailure::Generic("unable to serialize readEntry response"));
                }
                return Result<std::string, KernelFailure>::Ok(std::move(serialized));
            });
    }
}
