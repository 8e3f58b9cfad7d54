#include "test_helpers.hpp"

#include <fstream>
#include <random>

namespace readlater::test {

namespace {

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "readlater_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  if (std::filesystem::exists(temp_dir_)) {
    std::filesystem::remove_all(temp_dir_);
  }
}

std::filesystem::path TempDirTest::writeFile(const std::string& name, const std::string& content) {
  auto path = temp_dir_ / name;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path);
  out << content;
  return path;
}

util::HttpResponse jsonResponse(int status, const nlohmann::json& body,
                                std::vector<std::pair<std::string, std::string>> headers) {
  return rawResponse(status, body.dump(), std::move(headers));
}

util::HttpResponse rawResponse(int status, const std::string& body,
                               std::vector<std::pair<std::string, std::string>> headers) {
  util::HttpResponse response;
  response.status_code = status;
  response.headers = std::move(headers);
  response.body = body;
  return response;
}

}  // namespace readlater::test
