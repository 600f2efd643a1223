// wbcalc/syntax/scope_parser.hpp - Scoped-aggregation ("level of detail") blocks
//
// Recognizes blocks of the shape
//
//   { KIND [dim1], [dim2] : aggregated-expression }
//
// where KIND is FIXED, INCLUDE or EXCLUDE, and decomposes them. Braces are
// balanced by a hand-written scanner, so blocks nested inside the aggregated
// expression are captured whole and parsed recursively.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wbcalc::syntax
{

/**
 * Kind of a scoped-aggregation block.
 */
enum class ScopeKind : uint8_t {
  Fixed,    ///< table-wide: fixed at the listed dimensions, whole table if none
  Include,  ///< widen: adds dimensions to the view's level of detail
  Exclude,  ///< narrow: removes dimensions from the view's level of detail
};

[[nodiscard]] constexpr std::string_view to_string(ScopeKind k) noexcept
{
  switch (k) {
    case ScopeKind::Fixed:
      return "FIXED";
    case ScopeKind::Include:
      return "INCLUDE";
    case ScopeKind::Exclude:
      return "EXCLUDE";
  }
  return "";
}

/**
 * One parsed scoped-aggregation block.
 */
struct ScopedAggregation
{
  ScopeKind kind = ScopeKind::Fixed;

  /// Dimension field names without brackets; empty means "entire result set".
  std::vector<std::string> dimensions;

  /// Upper-cased aggregation function name, absent when the expression does
  /// not start with a known aggregation call.
  std::optional<std::string> aggregation;

  /// Text between the colon and the closing brace, trimmed.
  std::string expression;

  /// Full block text including the braces.
  std::string source_text;

  /// Byte offsets of the block in the text it was parsed from, [begin, end).
  uint32_t begin = 0;
  uint32_t end = 0;

  bool has_nested_scope = false;
  std::vector<ScopedAggregation> nested;
};

/**
 * Scanner over one formula that yields its top-level scoped-aggregation blocks.
 *
 * String literals, bracketed field names and `//` comments are skipped, so a
 * brace inside them never opens or closes a block. A `{` that does not start a
 * well-formed block is stepped over and scanning continues inside it.
 * Malformed blocks (missing colon or closing brace) are ignored, never reported.
 */
class ScopeParser
{
public:
  explicit ScopeParser(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<ScopedAggregation> parse_all();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();
  void skip_string_literal();
  void skip_line_comment();
  /// Consumes `[...]` (with `]]` escapes) and returns the unescaped interior.
  std::string read_field_name();

  /// Skips a token that may contain braces. Returns false if nothing was skipped.
  bool skip_opaque_token();

  [[nodiscard]] std::optional<ScopeKind> read_scope_keyword();
  [[nodiscard]] std::optional<ScopedAggregation> parse_block();

  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper: ScopeParser(formula).parse_all().
[[nodiscard]] std::vector<ScopedAggregation> parse_scoped_aggregations(std::string_view formula);

/// True if `text` contains a `{` followed (after optional whitespace) by a scope keyword.
[[nodiscard]] bool contains_scope_opening(std::string_view text);

/// Upper-cased aggregation function that `expression` starts with, if any.
[[nodiscard]] std::optional<std::string> leading_aggregation(std::string_view expression);

}  // namespace wbcalc::syntax
