#include "skykernel/transport/curl_http_transport.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <exception>
#include <map>
#include <memory>
#include <string>

namespace skykernel::transport {
    using interfaces::HttpRequest;
    using interfaces::HttpResponse;

    namespace detail {
        size_t AppendBody(char* ptr, const size_t size, const size_t nmemb, void* userdata) noexcept {
            auto* body = static_cast<std::vector<uint8_t>*>(userdata);
            try {
                body->insert(body->end(), ptr, ptr + size * nmemb);
            } catch (const std::exception&) {
                return 0;
            }
            return size * nmemb;
        }

        size_t AppendHeader(char* buffer, const size_t size, const size_t nitems, void* userdata) noexcept {
            auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
            try {
                const std::string line(buffer, size * nitems);
                const auto colon = line.find(':');
                if (colon != std::string::npos) {
                    std::string name = line.substr(0, colon);
                    for (auto& c : name) {
                        if (c >= 'A' && c <= 'Z') {
                            c = static_cast<char>(c - 'A' + 'a');
                        }
                    }
                    const auto first = line.find_first_not_of(" \t", colon + 1);
                    const auto last = line.find_last_not_of(" \t\r\n");
                    std::string value;
                    if (first != std::string::npos && last != std::string::npos && last >= first) {
                        value = line.substr(first, last - first + 1);
                    }
                    (*headers)[name] = std::move(value);
                }
            } catch (const std::exception&) {
                return 0;
            }
            return size * nitems;
        }
    }

    namespace {
        bool GlobalInit() {
            static const bool ready = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
            return ready;
        }

        struct CurlDeleter {
            void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct SlistDeleter {
            void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
        };
    }

    CurlHttpTransport::CurlHttpTransport(
        const std::chrono::seconds timeout,
        const std::chrono::seconds connect_timeout)
        : timeout_(timeout)
        , connect_timeout_(connect_timeout) {
    }

    Result<HttpResponse, KernelFailure> CurlHttpTransport::Send(const HttpRequest& request) {
        if (!GlobalInit()) {
            return Result<HttpResponse, KernelFailure>::Err(
                KernelFailure::Transport("Unable to initialize libcurl"));
        }
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl) {
            return Result<HttpResponse, KernelFailure>::Err(
                KernelFailure::Transport("Unable to allocate curl handle"));
        }

        HttpResponse response;
        std::unique_ptr<curl_slist, SlistDeleter> header_list;
        for (const auto& [name, value] : request.headers) {
            const auto line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (appended == nullptr) {
                return Result<HttpResponse, KernelFailure>::Err(
                    KernelFailure::Transport("Unable to build request headers"));
            }
            static_cast<void>(header_list.release());
            header_list.reset(appended);
        }

        CURL* handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
        curl_easy_setopt(handle, CURLOPT_USERAGENT, "skykernel/1.0");
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, detail::AppendBody);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, detail::AppendHeader);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
        if (header_list) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        }
        if (!request.body.empty()) {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }

        const CURLcode rc = curl_easy_perform(handle);
        if (rc != CURLE_OK) {
            return Result<HttpResponse, KernelFailure>::Err(
                KernelFailure::Transport(fmt::format("{}: {}", request.url, curl_easy_strerror(rc))));
        }
        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
        return Result<HttpResponse, KernelFailure>::Ok(std::move(response));
    }
}
