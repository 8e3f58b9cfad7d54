#include "readlater/util/http_client.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace readlater::util {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Called once per header line, status line and trailing blank line included
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HttpResponse* response) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    // A new status line starts a new response (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        response->headers.clear();
        return total_size;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        response->headers.emplace_back(trim(line.substr(0, colon)),
                                       trim(line.substr(colon + 1)));
    }
    return total_size;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

struct HttpClient::Impl {
    CURL* curl = nullptr;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

HttpClient::HttpClient(std::chrono::seconds timeout)
    : pImpl(std::make_unique<Impl>()), timeout_(timeout) {
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<std::string>& headers) {
    if (!pImpl || !pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    HttpResponse response;
    long response_code = 0;

    // Reset curl handle
    curl_easy_reset(pImpl->curl);

    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    // Set headers
    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(pImpl->curl, CURLOPT_HTTPHEADER, header_list);
    }

    // Collect body and headers
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(pImpl->curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_HEADERDATA, &response);

    curl_easy_setopt(pImpl->curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    // Perform the request
    CURLcode res = curl_easy_perform(pImpl->curl);

    // Clean up headers
    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        return std::unexpected(makeError(ErrorCode::kNetworkError,
                                       "HTTP request failed: " + std::string(curl_easy_strerror(res))));
    }

    curl_easy_getinfo(pImpl->curl, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);

    return response;
}

} // namespace readlater::util
