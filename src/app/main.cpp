#include <iostream>
#include <cstdlib>

#include <curl/curl.h>

#include "readlater/cli/application.hpp"

int main(int argc, char* argv[]) {
  curl_global_init(CURL_GLOBAL_DEFAULT);

  int exit_code = 1;
  try {
    readlater::cli::Application app;
    exit_code = app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "Fatal error: Unknown exception" << std::endl;
  }

  curl_global_cleanup();
  return exit_code;
}
