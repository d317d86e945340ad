#include "skykernel/fetch/progressive_fetch.hpp"
#include "skykernel/core/constants.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <fmt/core.h>
#include <exception>

namespace skykernel::fetch {
    Option<int> FetchResult::FirstFailedStatus() const {
        for (const auto& failed : failed_responses) {
            if (failed.response.has_value()) {
                return Some(failed.response->status);
            }
        }
        return None<int>();
    }

    bool FetchResult::HasFailedStatus(const int status) const {
        for (const auto& failed : failed_responses) {
            if (failed.response.has_value() && failed.response->status == status) {
                return true;
            }
        }
        return false;
    }

    namespace {
        void RecordFailure(
            FetchResult& result,
            const std::string& host,
            Option<HttpResponse> response,
            std::string error,
            std::string log) {
            result.failed_hosts.push_back(host);
            result.failed_responses.push_back(FailedResponse{host, std::move(response), std::move(error)});
            result.logs.push_back(std::move(log));
        }

        Result<HttpResponse, KernelFailure> SendGuarded(IHttpTransport& transport, const HttpRequest& request) {
            try {
                return transport.Send(request);
            } catch (const std::exception& e) {
                return Result<HttpResponse, KernelFailure>::Err(
                    KernelFailure::Transport(fmt::format("transport threw: {}", e.what())));
            }
        }

        Result<Unit, KernelFailure> VerifyGuarded(const ResponseVerifier& verify, const HttpResponse& response) {
            try {
                return verify(response);
            } catch (const std::exception& e) {
                return Result<Unit, KernelFailure>::Err(
                    KernelFailure::Verification(fmt::format("verifier threw: {}", e.what())));
            }
        }
    }

    FetchResult ProgressiveFetch(
        IHttpTransport& transport,
        const std::string_view endpoint,
        const FetchOptions& options,
        const std::vector<std::string>& hosts,
        const ResponseVerifier& verify,
        const CancellationToken& cancel) {
        FetchResult result;

        for (size_t i = 0; i < hosts.size(); ++i) {
            const auto& host = hosts[i];
            if (cancel.IsCancelled()) {
                result.cancelled = true;
                result.remaining_hosts.assign(hosts.begin() + static_cast<std::ptrdiff_t>(i), hosts.end());
                result.logs.push_back(fmt::format(
                    "query cancelled before contacting {}, {} hosts not tried",
                    host, result.remaining_hosts.size()));
                return result;
            }

            HttpRequest request;
            request.method = options.method;
            request.url = fmt::format("https://{}{}", host, endpoint);
            request.headers = options.headers;
            request.body = options.body;
            debug::LogFetchAttempt(host, endpoint, i);

            auto sent = SendGuarded(transport, request);
            if (sent.IsErr()) {
                const auto& error = sent.UnwrapErr().message;
                RecordFailure(result, host, None<HttpResponse>(), error,
                              fmt::format("fetch returned an error: {} ({})", error, request.url));
                continue;
            }

            auto response = std::move(sent).Unwrap();
            if (!response.IsSuccess()) {
                debug::LogFetchOutcome(host, response.status, false);
                auto log = fmt::format("portal has returned error status {} ({})", response.status, request.url);
                RecordFailure(result, host, Some(std::move(response)), "error status", std::move(log));
                continue;
            }

            auto verified = VerifyGuarded(verify, response);
            if (verified.IsErr()) {
                debug::LogFetchOutcome(host, response.status, false);
                auto error = verified.UnwrapErr().message;
                auto log = fmt::format("portal response failed verification: {} ({})", error, request.url);
                RecordFailure(result, host, Some(std::move(response)), std::move(error), std::move(log));
                continue;
            }

            debug::LogFetchOutcome(host, response.status, true);
            result.success = true;
            result.host = host;
            result.response = std::move(response);
            result.remaining_hosts.assign(hosts.begin() + static_cast<std::ptrdiff_t>(i) + 1, hosts.end());
            return result;
        }

        result.logs.push_back(fmt::format(
            "{}: {} hosts failed", ErrorMessages::ALL_HOSTS_FAILED, result.failed_hosts.size()));
        return result;
    }
}
