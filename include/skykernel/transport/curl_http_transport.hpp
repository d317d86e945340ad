#pragma once
#include "skykernel/interfaces/i_http_transport.hpp"
#include <chrono>
#include <cstddef>
namespace skykernel::transport {
namespace detail {
/// CURLOPT_WRITEFUNCTION: appends to the std::vector<uint8_t> at userdata.
/// Returns 0 when the buffer cannot grow, which aborts the transfer.
size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
/// CURLOPT_HEADERFUNCTION: stores "Name: value" lines with lowercased names.
size_t AppendHeader(char* buffer, size_t size, size_t nitems, void* userdata) noexcept;
}

/// IHttpTransport over a libcurl easy handle per request.
class CurlHttpTransport final : public interfaces::IHttpTransport {
public:
    explicit CurlHttpTransport(
        std::chrono::seconds timeout = std::chrono::seconds(30),
        std::chrono::seconds connect_timeout = std::chrono::seconds(10));

    [[nodiscard]] Result<interfaces::HttpResponse, KernelFailure> Send(
        const interfaces::HttpRequest& request) override;
private:
    std::chrono::seconds timeout_;
    std::chrono::seconds connect_timeout_;
};
}
