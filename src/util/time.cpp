#include "readlater/util/time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace readlater::util {

namespace {

// Relative times further back than this are rejected
constexpr std::chrono::minutes kMaxRelativeOffset = std::chrono::hours(24 * 366 * 100);

}  // namespace

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm = {};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::int64_t Time::toUnixSeconds(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point Time::fromUnixSeconds(std::int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

std::string Time::formatDuration(std::chrono::nanoseconds duration) {
  auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration);
  duration -= minutes;
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
  duration -= seconds;
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration);

  std::ostringstream oss;

  if (minutes.count() > 0) {
    oss << minutes.count() << "m ";
  }
  if (seconds.count() > 0 || minutes.count() == 0) {
    oss << seconds.count();
    if (milliseconds.count() > 0 && minutes.count() == 0) {
      oss << "." << std::setfill('0') << std::setw(3) << milliseconds.count();
    }
    oss << "s";
  }

  std::string result = oss.str();
  if (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result.empty() ? "0s" : result;
}

Result<std::chrono::system_clock::time_point> Time::parseRelativeTime(const std::string& str) {
  std::regex relative_regex(R"((\d+)\s*(minute|hour|day|week|month)s?\s*ago)");

  std::smatch match;
  if (!std::regex_match(str, match, relative_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid relative time format: " + str));
  }

  const std::string digits = match[1];
  std::int64_t amount = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), amount);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Relative time out of range: " + str));
  }

  const std::string unit = match[2];
  std::chrono::minutes unit_length{0};
  if (unit == "minute") {
    unit_length = std::chrono::minutes(1);
  } else if (unit == "hour") {
    unit_length = std::chrono::hours(1);
  } else if (unit == "day") {
    unit_length = std::chrono::hours(24);
  } else if (unit == "week") {
    unit_length = std::chrono::hours(24 * 7);
  } else if (unit == "month") {
    unit_length = std::chrono::hours(24 * 30);  // Approximate
  } else {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Unknown time unit: " + unit));
  }

  if (amount > kMaxRelativeOffset / unit_length) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Relative time out of range: " + str));
  }

  return std::chrono::system_clock::now() - unit_length * amount;
}

}  // namespace readlater::util
