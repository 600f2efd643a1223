#include "wbcalc/syntax/scope_parser.hpp"

#include <algorithm>

#include "wbcalc/basic/string_utils.hpp"
#include "wbcalc/syntax/keywords.hpp"
#include "wbcalc/syntax/reference_scanner.hpp"

namespace wbcalc::syntax
{
namespace
{

std::optional<ScopeKind> keyword_to_kind(std::string_view ident)
{
  if (iequals(ident, k_scope_keywords[0])) return ScopeKind::Fixed;
  if (iequals(ident, k_scope_keywords[1])) return ScopeKind::Include;
  if (iequals(ident, k_scope_keywords[2])) return ScopeKind::Exclude;
  return std::nullopt;
}

/// Length of the identifier starting at `at` (0 if none).
size_t ident_length(std::string_view s, size_t at)
{
  if (at >= s.size() || !is_ident_start(s[at])) {
    return 0;
  }
  size_t end = at + 1;
  while (end < s.size() && is_ident_continue(s[end])) {
    ++end;
  }
  return end - at;
}

}  // namespace

bool ScopeParser::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void ScopeParser::skip_whitespace()
{
  while (!eof() && is_space(peek())) {
    advance(1);
  }
}

void ScopeParser::skip_string_literal()
{
  const char quote = peek();
  advance(1);
  while (!eof()) {
    if (peek() == quote) {
      // Doubled quote is an escaped quote character.
      if (peek(1) == quote) {
        advance(2);
        continue;
      }
      advance(1);
      return;
    }
    advance(1);
  }
}

void ScopeParser::skip_line_comment()
{
  while (!eof() && peek() != '\n') {
    advance(1);
  }
}

std::string ScopeParser::read_field_name()
{
  // opening bracket
  advance(1);

  std::string name;
  while (!eof()) {
    const char c = peek();
    if (c == ']') {
      if (peek(1) == ']') {
        name += ']';
        advance(2);
        continue;
      }
      advance(1);
      return name;
    }
    name += c;
    advance(1);
  }
  return name;
}

bool ScopeParser::skip_opaque_token()
{
  const char c = peek();
  if (c == '"' || c == '\'') {
    skip_string_literal();
    return true;
  }
  if (c == '[') {
    (void)read_field_name();
    return true;
  }
  if (starts_with("//")) {
    skip_line_comment();
    return true;
  }
  return false;
}

std::optional<ScopeKind> ScopeParser::read_scope_keyword()
{
  const size_t len = ident_length(src_, pos_);
  if (len == 0) {
    return std::nullopt;
  }
  const auto kind = keyword_to_kind(src_.substr(pos_, len));
  if (kind) {
    advance(len);
  }
  return kind;
}

std::optional<ScopedAggregation> ScopeParser::parse_block()
{
  const size_t open = pos_;

  // opening brace
  advance(1);
  skip_whitespace();

  const auto kind = read_scope_keyword();
  if (!kind) {
    return std::nullopt;
  }

  ScopedAggregation agg;
  agg.kind = *kind;

  // Dimension list up to the first colon outside brackets.
  while (true) {
    skip_whitespace();
    if (eof()) {
      return std::nullopt;
    }

    const char c = peek();
    if (c == ':') {
      advance(1);
      break;
    }
    if (c == '{' || c == '}') {
      return std::nullopt;
    }
    if (c == '[') {
      std::string dim = read_field_name();
      // Qualified dimension: [datasource].[prefix:Field:suffix]
      if (peek() == '.' && peek(1) == '[') {
        advance(1);
        const std::string field = read_field_name();
        dim = field_display_name("[" + dim + "].[" + field + "]");
      }
      if (!dim.empty()) {
        agg.dimensions.push_back(std::move(dim));
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      skip_string_literal();
      continue;
    }
    // Separators and anything else between dimensions.
    advance(1);
  }

  // Aggregated expression up to the matching closing brace.
  const size_t expr_start = pos_;
  int depth = 1;
  while (!eof()) {
    if (skip_opaque_token()) {
      continue;
    }
    const char c = peek();
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0) {
        break;
      }
    }
    advance(1);
  }
  if (eof()) {
    return std::nullopt;
  }

  const size_t expr_end = pos_;
  advance(1);  // closing brace

  agg.expression = std::string(trim(src_.substr(expr_start, expr_end - expr_start)));
  agg.source_text = std::string(src_.substr(open, pos_ - open));
  agg.begin = static_cast<uint32_t>(open);
  agg.end = static_cast<uint32_t>(pos_);
  agg.aggregation = leading_aggregation(agg.expression);
  if (contains_scope_opening(agg.expression)) {
    agg.nested = parse_scoped_aggregations(agg.expression);
  }
  // A "{FIXED" inside a string literal or comment is not a nested block.
  agg.has_nested_scope = !agg.nested.empty();

  return agg;
}

std::vector<ScopedAggregation> ScopeParser::parse_all()
{
  std::vector<ScopedAggregation> out;

  while (!eof()) {
    if (skip_opaque_token()) {
      continue;
    }

    if (peek() == '{') {
      const size_t open = pos_;
      if (auto block = parse_block()) {
        out.push_back(std::move(*block));
        continue;
      }
      // Not a scope block: look inside it.
      pos_ = open + 1;
      continue;
    }

    advance(1);
  }

  return out;
}

std::vector<ScopedAggregation> parse_scoped_aggregations(std::string_view formula)
{
  ScopeParser parser(formula);
  return parser.parse_all();
}

bool contains_scope_opening(std::string_view text)
{
  size_t pos = text.find('{');
  while (pos != std::string_view::npos) {
    size_t p = pos + 1;
    while (p < text.size() && is_space(text[p])) {
      ++p;
    }
    const size_t len = ident_length(text, p);
    if (len > 0 && keyword_to_kind(text.substr(p, len))) {
      return true;
    }
    pos = text.find('{', pos + 1);
  }
  return false;
}

std::optional<std::string> leading_aggregation(std::string_view expression)
{
  const std::string_view expr = trim(expression);
  const size_t len = ident_length(expr, 0);
  if (len == 0) {
    return std::nullopt;
  }

  const std::string_view ident = expr.substr(0, len);
  const bool known = std::any_of(
    k_aggregation_functions.begin(), k_aggregation_functions.end(),
    [&](std::string_view fn) { return iequals(ident, fn); });
  if (!known) {
    return std::nullopt;
  }

  size_t p = len;
  while (p < expr.size() && is_space(expr[p])) {
    ++p;
  }
  if (p >= expr.size() || expr[p] != '(') {
    return std::nullopt;
  }
  return to_upper(ident);
}

}  // namespace wbcalc::syntax
