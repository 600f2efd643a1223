#include "wbcalc/syntax/reference_scanner.hpp"

#include <algorithm>

#include "wbcalc/syntax/keywords.hpp"

namespace wbcalc::syntax
{
namespace
{

std::string_view strip_outer_brackets(std::string_view s)
{
  if (!s.empty() && s.front() == '[') {
    s.remove_prefix(1);
  }
  if (!s.empty() && s.back() == ']') {
    s.remove_suffix(1);
  }
  return s;
}

std::optional<std::string> non_empty(std::string_view s)
{
  if (s.empty()) {
    return std::nullopt;
  }
  return std::string(s);
}

}  // namespace

std::vector<std::string> extract_references(std::string_view formula)
{
  std::vector<std::string> refs;

  size_t pos = 0;
  while (pos < formula.size()) {
    const size_t open = formula.find('[', pos);
    if (open == std::string_view::npos) {
      break;
    }
    const size_t close = formula.find(']', open + 1);
    if (close == std::string_view::npos) {
      // No later '[' can be closed either.
      break;
    }
    if (close == open + 1) {
      // "[]" carries no name; resume right after the '['.
      pos = open + 1;
      continue;
    }

    const std::string_view ref = formula.substr(open + 1, close - open - 1);
    if (ref != k_parameters_qualifier && std::find(refs.begin(), refs.end(), ref) == refs.end()) {
      refs.emplace_back(ref);
    }
    pos = close + 1;
  }

  return refs;
}

FieldReference parse_field_reference(std::string_view reference)
{
  const std::string_view cleaned = strip_outer_brackets(reference);

  FieldReference out;

  // Qualified shape: ds].[field  (outer brackets already removed)
  const size_t sep = cleaned.find("].");
  if (sep != std::string_view::npos && sep > 0) {
    std::string_view ds = cleaned.substr(0, sep);
    std::string_view field = cleaned.substr(sep + 2);
    if (!field.empty() && field.front() == '[') {
      field.remove_prefix(1);
    }
    const bool well_formed = !ds.empty() && !field.empty() &&
                             ds.find(']') == std::string_view::npos &&
                             field.find(']') == std::string_view::npos;
    if (well_formed) {
      out.datasource = std::string(ds);

      // prefix:FieldName:suffix
      const size_t c1 = field.find(':');
      const size_t c2 = (c1 == std::string_view::npos) ? c1 : field.find(':', c1 + 1);
      const bool three_parts = c2 != std::string_view::npos &&
                               field.find(':', c2 + 1) == std::string_view::npos;
      if (three_parts) {
        out.prefix = non_empty(field.substr(0, c1));
        out.field_name = std::string(field.substr(c1 + 1, c2 - c1 - 1));
        out.suffix = non_empty(field.substr(c2 + 1));
      } else {
        out.field_name = std::string(field);
      }
      return out;
    }
  }

  out.field_name = std::string(cleaned);
  return out;
}

std::string field_display_name(std::string_view reference)
{
  return parse_field_reference(reference).field_name;
}

}  // namespace wbcalc::syntax
