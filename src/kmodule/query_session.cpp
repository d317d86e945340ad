#include "skykernel/kmodule/query_session.hpp"
#include "skykernel/debug/trace_logger.hpp"

#include <fmt/core.h>
#include <climits>
#include <utility>

namespace skykernel::kmodule {
    QuerySession::~QuerySession() {
        CancelAll("query session closed");
    }

    OutboundQuery QuerySession::NewQuery(std::string method, std::string data) {
        std::promise<QueryResponse> promise;
        OutboundQuery query;
        query.response = promise.get_future();
        query.message.set_method(std::move(method));
        query.message.set_data(std::move(data));

        std::lock_guard lock(mutex_);
        const uint64_t nonce = next_nonce_++;
        query.message.set_nonce(nonce);
        open_.emplace(nonce, std::move(promise));
        SKY_LOG_MSG(debug::Component::Module,
                    fmt::format("opened query {} for '{}'", nonce, query.message.method()));
        return query;
    }

    Result<Unit, KernelFailure> QuerySession::HandleResponse(const proto::ModuleMessage& response) {
        std::promise<QueryResponse> promise;
        {
            std::lock_guard lock(mutex_);
            const auto it = open_.find(response.nonce());
            if (it == open_.end()) {
                return Result<Unit, KernelFailure>::Err(
                    KernelFailure::NotFound(fmt::format(
                        "received a response for unknown nonce {}", response.nonce())));
            }
            if (response.payload_case() == proto::ModuleMessage::PAYLOAD_NOT_SET) {
                return Result<Unit, KernelFailure>::Err(
                    KernelFailure::InvalidInput(fmt::format(
                        "response for nonce {} has neither data nor err", response.nonce())));
            }
            promise = std::move(it->second);
            open_.erase(it);
        }

        if (response.payload_case() == proto::ModuleMessage::kErr) {
            promise.set_value(QueryResponse::Err(KernelFailure::Generic(response.err())));
        } else {
            promise.set_value(QueryResponse::Ok(response.data()));
        }
        SKY_LOG_MSG(debug::Component::Module, fmt::format("resolved query {}", response.nonce()));
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    Result<Unit, KernelFailure> QuerySession::HandleResponseBytes(const std::span<const uint8_t> bytes) {
        if (bytes.size() > static_cast<size_t>(INT_MAX)) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::DataTooLarge("module message is too large"));
        }
        proto::ModuleMessage response;
        if (!response.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::Decode("unable to parse module message"));
        }
        return HandleResponse(response);
    }

    void QuerySession::CancelAll(const std::string_view reason) {
        std::unordered_map<uint64_t, std::promise<QueryResponse>> pending;
        {
            std::lock_guard lock(mutex_);
            pending.swap(open_);
        }
        for (auto& [nonce, promise] : pending) {
            promise.set_value(QueryResponse::Err(
                KernelFailure::Cancelled(fmt::format("query {} cancelled: {}", nonce, reason))));
        }
    }

    size_t QuerySession::OpenQueries() const {
        std::lock_guard lock(mutex_);
        return open_.size();
    }
}
