#pragma once

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "readlater/common.hpp"
#include "readlater/util/http_client.hpp"

namespace readlater::api {

// Headers the API uses to report why a request failed
inline constexpr const char* kErrorCodeHeader = "X-Error-Code";
inline constexpr const char* kErrorMessageHeader = "X-Error";

// Value used when an error header is absent
inline constexpr const char* kUnknownErrorValue = "unknown";

/**
 * @brief Failure of a remote call
 *
 * kTransport: no HTTP response was obtained (status_code is empty).
 * kApi: the server rejected the request (non-2xx, or a 2xx body with status 0).
 * kDecode: a 2xx response whose body could not be decoded.
 */
struct ApiError {
  enum class Kind {
    kTransport,
    kApi,
    kDecode
  };

  Kind kind = Kind::kApi;
  std::optional<int> status_code;
  std::string error_code = kUnknownErrorValue;
  std::string message = kUnknownErrorValue;
  std::string body;

  // error_code as a number, nullopt when absent or not numeric
  std::optional<int> numericErrorCode() const;

  // One-line description for logs and terminal output
  std::string describe() const;
};

std::string_view apiErrorKindToString(ApiError::Kind kind);

// Thrown by the *OrThrow convenience wrappers
class ApiException : public std::runtime_error {
 public:
  explicit ApiException(ApiError error);

  const ApiError& error() const noexcept { return error_; }

 private:
  ApiError error_;
};

template <typename T>
using ApiResult = std::expected<T, ApiError>;

// Classify a transport outcome and parse the JSON body of a successful response.
ApiResult<nlohmann::json> classifyResponse(const Result<util::HttpResponse>& response);

// Classify, then decode the body with an endpoint-specific decoder
// returning Result<T>. A decoder error becomes a kDecode failure.
template <typename T, typename Decoder>
ApiResult<T> classifyResponse(const Result<util::HttpResponse>& response, Decoder&& decode) {
  auto json = classifyResponse(response);
  if (!json.has_value()) {
    return std::unexpected(json.error());
  }

  Result<T> decoded = decode(*json);
  if (!decoded.has_value()) {
    ApiError error;
    error.kind = ApiError::Kind::kDecode;
    error.status_code = response->status_code;
    error.message = decoded.error().message();
    error.body = response->body;
    return std::unexpected(std::move(error));
  }
  return std::move(*decoded);
}

}  // namespace readlater::api
