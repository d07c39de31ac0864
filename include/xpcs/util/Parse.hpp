#pragma once

#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>

namespace xpcs::util {

inline bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Advance `p` past the next whitespace-delimited token and return it in `tok`.
inline bool next_token(const char*& p, const char* end, std::string_view& tok) {
  while (p < end && is_blank(*p)) ++p;
  if (p >= end) {
    tok = std::string_view{};
    return false;
  }
  const char* start = p;
  while (p < end && !is_blank(*p)) ++p;
  tok = std::string_view(start, static_cast<std::size_t>(p - start));
  return true;
}

// Whole-token numeric parse (no trailing characters accepted).
template <typename T>
inline bool parse_number(std::string_view tok, T& value) {
  const char* b = tok.data();
  const char* e = b + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// True for empty lines and '#' comments.
inline bool is_skippable_line(std::string_view line) {
  std::size_t i = 0;
  while (i < line.size() && is_blank(line[i])) ++i;
  return i == line.size() || line[i] == '#';
}

} // namespace xpcs::util
