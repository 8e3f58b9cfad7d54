#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace readlater::core {

// Reserved tag markers understood by the API
enum class TagSentinel {
  kUntagged,  // items without any tag
  kAny        // items with at least one tag
};

// Protocol tokens the sentinels are sent as
inline constexpr std::string_view kUntaggedToken = "_untagged_";
inline constexpr std::string_view kAnyTagToken = "_any_";

// A tag argument: one tag, an ordered list of tags, or a sentinel
using TagValue = std::variant<std::string, std::vector<std::string>, TagSentinel>;

// Convert a tag argument into the string the API expects.
// Lists are joined with ", " in input order; tags are not trimmed or deduplicated.
std::string normalizeTags(const TagValue& tags);

// Same conversion for a tags value taken from a JSON option map.
// Strings pass through, arrays are joined, anything else is serialized as-is.
std::string normalizeTags(const nlohmann::json& tags);

}  // namespace readlater::core
