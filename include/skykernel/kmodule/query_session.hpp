#pragma once

#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/kmodule/messages.pb.h"

#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace skykernel::kmodule {

using QueryResponse = Result<std::string, KernelFailure>;

struct OutboundQuery {
    proto::ModuleMessage message;
    std::future<QueryResponse> response;
};

/**
 * @brief Table of queries sent to a module and not yet answered
 *
 * Nonces increase monotonically per session. Responses may be delivered from
 * any thread; each open query is resolved exactly once.
 */
class QuerySession {
public:
    QuerySession() = default;
    ~QuerySession();

    QuerySession(const QuerySession&) = delete;
    QuerySession& operator=(const QuerySession&) = delete;

    /// Registers a query and returns the message to send with its future.
    [[nodiscard]] OutboundQuery NewQuery(std::string method, std::string data);

    /**
     * @brief Resolve the open query matching the response nonce
     *
     * @return Err(NotFound) for a nonce with no open query,
     *         Err(InvalidInput) for a response with neither data nor err
     */
    [[nodiscard]] Result<Unit, KernelFailure> HandleResponse(const proto::ModuleMessage& response);

    /// Parses a serialized ModuleMessage, then behaves as HandleResponse.
    [[nodiscard]] Result<Unit, KernelFailure> HandleResponseBytes(std::span<const uint8_t> bytes);

    /// Resolves every open query with a Cancelled failure.
    void CancelAll(std::string_view reason);

    [[nodiscard]] size_t OpenQueries() const;

private:
    mutable std::mutex mutex_;
    uint64_t next_nonce_ = 0;
    std::unordered_map<uint64_t, std::promise<QueryResponse>> open_;
};

} // namespace skykernel::kmodule
