// thingtalk/basic/string_utils.hpp - Small string helpers shared by the core
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace thingtalk
{

// C++17 compatible starts_with/ends_with
[[nodiscard]] inline bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

[[nodiscard]] inline bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Turn an identifier into a lower case display label.
 *
 * Drops a `v_`, `w_`, `g_` or `p_` prefix, replaces underscores with
 * spaces and splits camelCase words: "userName" -> "user name".
 */
[[nodiscard]] std::string clean(std::string_view name);

/**
 * Display label for a class kind, without the well-known vendor prefixes:
 * "org.thingpedia.weather" -> "weather", "com.xkcd" -> "xkcd".
 */
[[nodiscard]] std::string clean_kind(std::string_view kind);

/// Split on a single character; empty pieces are kept.
[[nodiscard]] std::vector<std::string> split(std::string_view s, char sep);

/// Join with a separator.
[[nodiscard]] std::string join(const std::vector<std::string> & parts, std::string_view sep);

}  // namespace thingtalk
