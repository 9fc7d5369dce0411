#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace string_util
{
static auto start_with(::std::string_view s, ::std::string_view match) noexcept(true)
  -> bool {
  return s.size() >= match.size() && s.compare(0, match.size(), match) == 0;
}

static auto trim(::std::string_view s, ::std::string_view delim = " \n\t\r\v\f") noexcept(true)
  -> ::std::string_view {
  auto first = s.find_first_not_of(delim);
  if (first == ::std::string_view::npos) return {};
  auto last = s.find_last_not_of(delim);
  return s.substr(first, last - first + 1);
}

static auto to_upper(::std::string_view s) -> std::string {
  std::string r(s);
  std::transform(r.begin(), r.end(), r.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return r;
}

static auto basename(::std::string_view path) noexcept(true) -> ::std::string_view {
  auto p = path.find_last_of("/\\");
  return p == ::std::string_view::npos ? path : path.substr(p + 1);
}
} // namespace string_util
