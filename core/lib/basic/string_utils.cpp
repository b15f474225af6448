// thingtalk/basic/string_utils.cpp - Display-name helpers
#include "thingtalk/basic/string_utils.hpp"

#include <cctype>

namespace thingtalk
{

std::string clean(std::string_view name)
{
  if (
    name.size() >= 2 && name[1] == '_' &&
    (name[0] == 'v' || name[0] == 'w' || name[0] == 'g' || name[0] == 'p')) {
    name.remove_prefix(2);
  }

  std::string out;
  out.reserve(name.size() + 4);
  char prev = '\0';
  for (const char c : name) {
    const char ch = (c == '_') ? ' ' : c;
    // insert a space between a non-upper, non-space char and an upper one
    if (
      std::isupper(static_cast<unsigned char>(ch)) && prev != '\0' && prev != ' ' &&
      !std::isupper(static_cast<unsigned char>(prev))) {
      out += ' ';
    }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    prev = ch;
  }
  return out;
}

std::string clean_kind(std::string_view kind)
{
  static constexpr std::string_view k_prefixes[] = {
    "org.thingpedia.builtin.thingengine.",
    "org.thingpedia.builtin.",
    "org.thingpedia.",
    "io.home-assistant.",
    "com.",
    "gov.",
    "org.",
    "uk.co.",
  };
  for (const auto prefix : k_prefixes) {
    if (starts_with(kind, prefix)) {
      kind.remove_prefix(prefix.size());
    }
  }

  std::string spaced(kind);
  for (char & c : spaced) {
    if (c == '.' || c == '-') {
      c = ' ';
    }
  }
  return clean(spaced);
}

std::vector<std::string> split(std::string_view s, char sep)
{
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(s.substr(start));
      break;
    }
    parts.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

}  // namespace thingtalk
