#pragma once

#include <iostream>
#include <string>

#include "readlater/api/response.hpp"
#include "readlater/cli/application.hpp"

namespace readlater::cli {

// Formats errors and notices for CLI output and logs them
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Handle and display local errors, returns the exit code
  int handleError(const Error& error, const std::string& operation = "");

  // Handle and display failures of API calls, returns the exit code
  int handleApiError(const api::ApiError& error, const std::string& operation = "");

  void displaySuccess(const std::string& message);
  void displayWarning(const std::string& message);

private:
  const GlobalOptions& options_;
};

} // namespace readlater::cli
