// wbcalc/syntax/reference_scanner.hpp - Bracketed field references in formula text
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wbcalc::syntax
{

/**
 * Decomposed form of a qualified reference `[Datasource].[prefix:FieldName:suffix]`.
 *
 * For a bare `[FieldName]` only field_name is set.
 */
struct FieldReference
{
  std::optional<std::string> datasource;
  std::optional<std::string> prefix;
  std::string field_name;
  std::optional<std::string> suffix;

  [[nodiscard]] bool is_qualified() const noexcept { return datasource.has_value(); }
};

/**
 * Extract the bracket-delimited tokens of a formula in first-occurrence order,
 * de-duplicated, without the brackets.
 *
 * The `Parameters` qualifier is never returned. Scanning is single-level and
 * left to right: each `[` is paired with the next `]`. Unbalanced input never
 * fails; an unterminated `[` simply ends the scan.
 */
[[nodiscard]] std::vector<std::string> extract_references(std::string_view formula);

/**
 * Split a qualified reference into datasource, prefix, field name and suffix.
 *
 * Accepts the token with or without its outer brackets. When the text does not
 * have the `[ds].[field]` shape, the whole text is the field name.
 */
[[nodiscard]] FieldReference parse_field_reference(std::string_view reference);

/// Shorthand for parse_field_reference(reference).field_name.
[[nodiscard]] std::string field_display_name(std::string_view reference);

}  // namespace wbcalc::syntax
