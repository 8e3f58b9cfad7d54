#include <gtest/gtest.h>

#include <set>
#include <string>

#include "readlater/common.hpp"

namespace readlater {

TEST(CommonTest, EveryErrorCodeHasItsOwnName) {
  std::set<std::string> names;
  for (auto code : {ErrorCode::kInvalidArgument, ErrorCode::kFileWriteError,
                    ErrorCode::kParseError, ErrorCode::kValidationError,
                    ErrorCode::kNetworkError, ErrorCode::kConfigError}) {
    auto name = std::string(errorCodeToString(code));
    EXPECT_NE(name, "Unknown error");
    names.insert(name);
  }
  EXPECT_EQ(names.size(), 6u);
}

TEST(CommonTest, MakeErrorResultCarriesCodeAndMessage) {
  Result<int> result = makeErrorResult<int>(ErrorCode::kParseError, "bad input");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kParseError);
  EXPECT_EQ(result.error().message(), "bad input");
}

}  // namespace readlater
