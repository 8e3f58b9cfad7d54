#include "readlater/api/response.hpp"

#include <charconv>
#include <cstdint>
#include <sstream>

namespace readlater::api {

namespace {

bool isSuccessStatus(int status_code) {
  return status_code >= 200 && status_code < 300;
}

// The API answers 200 with {"status": 0} when it accepted the request but
// failed to carry it out.
bool hasFailureFlag(const nlohmann::json& body) {
  if (!body.is_object()) {
    return false;
  }
  auto it = body.find("status");
  return it != body.end() && it->is_number_integer() && it->get<std::int64_t>() == 0;
}

ApiError errorFromHeaders(const util::HttpResponse& response) {
  ApiError error;
  error.kind = ApiError::Kind::kApi;
  error.status_code = response.status_code;
  error.error_code = response.header(kErrorCodeHeader).value_or(kUnknownErrorValue);
  error.message = response.header(kErrorMessageHeader).value_or(kUnknownErrorValue);
  error.body = response.body;
  return error;
}

}  // namespace

std::optional<int> ApiError::numericErrorCode() const {
  int value = 0;
  const char* begin = error_code.data();
  const char* end = begin + error_code.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::string ApiError::describe() const {
  std::ostringstream oss;
  oss << apiErrorKindToString(kind);
  if (status_code) {
    oss << " (HTTP " << *status_code << ")";
  }
  oss << ": " << message;
  if (error_code != kUnknownErrorValue) {
    oss << " [code " << error_code << "]";
  }
  return oss.str();
}

std::string_view apiErrorKindToString(ApiError::Kind kind) {
  switch (kind) {
    case ApiError::Kind::kTransport:
      return "Transport error";
    case ApiError::Kind::kApi:
      return "API error";
    case ApiError::Kind::kDecode:
      return "Decode error";
  }
  return "Unknown error";
}

ApiException::ApiException(ApiError error)
    : std::runtime_error(error.describe()), error_(std::move(error)) {}

ApiResult<nlohmann::json> classifyResponse(const Result<util::HttpResponse>& response) {
  if (!response.has_value()) {
    ApiError error;
    error.kind = ApiError::Kind::kTransport;
    error.message = response.error().message();
    return std::unexpected(std::move(error));
  }

  if (!isSuccessStatus(response->status_code)) {
    return std::unexpected(errorFromHeaders(*response));
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(response->body);
  } catch (const nlohmann::json::parse_error& e) {
    ApiError error;
    error.kind = ApiError::Kind::kDecode;
    error.status_code = response->status_code;
    error.message = "Invalid JSON in response body: " + std::string(e.what());
    error.body = response->body;
    return std::unexpected(std::move(error));
  }

  if (hasFailureFlag(body)) {
    return std::unexpected(errorFromHeaders(*response));
  }

  return body;
}

}  // namespace readlater::api
