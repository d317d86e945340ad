#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/option.hpp"
#include "skykernel/interfaces/i_http_transport.hpp"
#include "skykernel/fetch/cancellation_token.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace skykernel::fetch {
using interfaces::HttpRequest;
using interfaces::HttpResponse;
using interfaces::IHttpTransport;

/// Everything of a request except the URL, which is built per host.
struct FetchOptions {
    std::string method = "GET";
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<uint8_t> body;
};

/// A host that was tried and not trusted: its response, or the transport error.
struct FailedResponse {
    std::string host;
    Option<HttpResponse> response;
    std::string error;
};

struct FetchResult {
    bool success = false;
    bool cancelled = false;
    std::string host;
    Option<HttpResponse> response;
    std::vector<std::string> failed_hosts;
    std::vector<FailedResponse> failed_responses;
    std::vector<std::string> remaining_hosts;
    std::vector<std::string> logs;

    /// Status of the first failed host that answered at all.
    [[nodiscard]] Option<int> FirstFailedStatus() const;
    [[nodiscard]] bool HasFailedStatus(int status) const;
};

/// Judges a 2xx response. Err means the host is not trusted for this request.
using ResponseVerifier = std::function<Result<Unit, KernelFailure>(const HttpResponse&)>;

/**
 * @brief Query hosts in order until one returns a verified 2xx response
 *
 * Transport errors, non-2xx statuses and verifier rejections all move on to
 * the next host and are recorded in the trail. Only running out of hosts
 * ends the fetch unsuccessfully. The token is checked before each request.
 */
FetchResult ProgressiveFetch(
    IHttpTransport& transport,
    std::string_view endpoint,
    const FetchOptions& options,
    const std::vector<std::string>& hosts,
    const ResponseVerifier& verify,
    const CancellationToken& cancel = CancellationToken());
}
