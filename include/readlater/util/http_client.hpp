#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "readlater/common.hpp"

namespace readlater::util {

struct HttpResponse {
    int status_code = 0;
    // Header name/value pairs in the order received
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Case-insensitive header lookup, first match wins
    std::optional<std::string> header(const std::string& name) const;
};

// POST-only transport seam. A failure means no HTTP response was obtained.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<std::string>& headers) = 0;
};

// libcurl transport. Owns one easy handle; not safe to share between threads.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(60));
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    std::chrono::seconds timeout_;
};

} // namespace readlater::util
