#include "readlater/cli/command_error_handler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace readlater::cli {

int CommandErrorHandler::handleError(const Error& error, const std::string& operation) {
  // Shown to the user below, so only kept in the log file
  spdlog::debug("[{}] {}: {}", operation, errorCodeToString(error.code()), error.message());

  if (options_.json) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = static_cast<int>(error.code());
    error_json["message"] = error.message();
    if (!operation.empty()) {
      error_json["operation"] = operation;
    }
    std::cout << error_json.dump() << std::endl;
  } else {
    std::cerr << "\033[31mError\033[0m: " << error.message() << std::endl;
  }

  return 1;
}

int CommandErrorHandler::handleApiError(const api::ApiError& error, const std::string& operation) {
  spdlog::debug("[{}] {}", operation, error.describe());
  if (!error.body.empty()) {
    spdlog::debug("[{}] response body: {}", operation, error.body);
  }

  if (options_.json) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["kind"] = std::string(api::apiErrorKindToString(error.kind));
    if (error.status_code) {
      error_json["status"] = *error.status_code;
    }
    error_json["code"] = error.error_code;
    error_json["message"] = error.message;
    if (!operation.empty()) {
      error_json["operation"] = operation;
    }
    std::cout << error_json.dump() << std::endl;
  } else {
    std::cerr << "\033[31mError\033[0m: " << error.describe() << std::endl;

    // Show the raw body in very verbose mode (-vv)
    if (options_.verbose > 1 && !error.body.empty()) {
      std::cerr << "\nResponse body:\n" << error.body << std::endl;
    }
  }

  return 1;
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.quiet) {
    return;
  }
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else {
    std::cout << "\033[32m✓\033[0m " << message << std::endl;
  }
}

void CommandErrorHandler::displayWarning(const std::string& message) {
  if (options_.json) {
    nlohmann::json warning_json;
    warning_json["warning"] = true;
    warning_json["message"] = message;
    std::cout << warning_json.dump() << std::endl;
  } else {
    std::cerr << "\033[33m⚠\033[0m " << message << std::endl;
  }
}

} // namespace readlater::cli
