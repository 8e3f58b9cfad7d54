#include "readlater/core/tags.hpp"

#include <type_traits>

namespace readlater::core {

namespace {

constexpr std::string_view kTagSeparator = ", ";

std::string joinTags(const std::vector<std::string>& tags) {
  std::string joined;
  for (size_t i = 0; i < tags.size(); ++i) {
    if (i > 0) {
      joined += kTagSeparator;
    }
    joined += tags[i];
  }
  return joined;
}

}  // namespace

std::string normalizeTags(const TagValue& tags) {
  return std::visit([](const auto& value) -> std::string {
    using T = std::decay_t<decltype(value)>;
    if constexpr (std::is_same_v<T, std::string>) {
      return value;
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
      return joinTags(value);
    } else {
      return value == TagSentinel::kUntagged ? std::string(kUntaggedToken)
                                             : std::string(kAnyTagToken);
    }
  }, tags);
}

std::string normalizeTags(const nlohmann::json& tags) {
  if (tags.is_string()) {
    return tags.get<std::string>();
  }

  if (tags.is_array()) {
    std::vector<std::string> parts;
    parts.reserve(tags.size());
    for (const auto& tag : tags) {
      parts.push_back(tag.is_string() ? tag.get<std::string>() : tag.dump());
    }
    return joinTags(parts);
  }

  return tags.dump();
}

}  // namespace readlater::core
