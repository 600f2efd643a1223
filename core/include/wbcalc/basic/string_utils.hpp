// wbcalc/basic/string_utils.hpp - ASCII and UTF-8 helpers shared by the scanners
#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace wbcalc
{

[[nodiscard]] inline char ascii_lower(char c) noexcept
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] inline char ascii_upper(char c) noexcept
{
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

[[nodiscard]] inline bool is_ident_start(char c) noexcept
{
  return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

[[nodiscard]] inline bool is_ident_continue(char c) noexcept
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

[[nodiscard]] inline bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return ascii_lower(x) == ascii_lower(y);
         });
}

/// Case-insensitive substring test.
[[nodiscard]] inline bool icontains(std::string_view haystack, std::string_view needle) noexcept
{
  if (needle.empty()) return true;
  const auto it = std::search(
    haystack.begin(), haystack.end(), needle.begin(), needle.end(),
    [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
  return it != haystack.end();
}

[[nodiscard]] inline std::string to_upper(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), ascii_upper);
  return out;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

/**
 * Cut `text` to at most `limit` bytes and append "..." when anything was
 * removed. The cut never splits a UTF-8 sequence: it moves back to the
 * nearest code point boundary, so the result may be shorter than `limit`.
 */
[[nodiscard]] inline std::string truncate_utf8(std::string_view text, size_t limit)
{
  if (text.size() <= limit) {
    return std::string(text);
  }
  size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  std::string out(text.substr(0, cut));
  out += "...";
  return out;
}

}  // namespace wbcalc
