#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/option.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace skykernel::interfaces {
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<uint8_t> body;
};

struct HttpResponse {
    int status = 0;
    /// Header names are stored lowercase.
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] std::string Text() const {
        return {body.begin(), body.end()};
    }

    [[nodiscard]] Option<std::string> Header(std::string_view name) const {
        std::string key(name);
        for (auto& c : key) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        const auto it = headers.find(key);
        if (it == headers.end()) {
            return None<std::string>();
        }
        return Some(it->second);
    }

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief One HTTP round trip to an untrusted host
 *
 * Err means the exchange itself failed (connection, TLS, malformed reply).
 * Any HTTP status, including errors, is an Ok response. Implementations own
 * timeout policy.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    [[nodiscard]] virtual Result<HttpResponse, KernelFailure> Send(const HttpRequest& request) = 0;
};
}
