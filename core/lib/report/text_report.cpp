// wbcalc/report/text_report.cpp - Plain-text summaries

#include "wbcalc/report/text_report.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

namespace wbcalc
{

void write_text(std::ostream & os, const DependencyReport & report)
{
  const auto & s = report.summary;
  if (report.message) {
    fmt::print(os, "{}\n", *report.message);
    fmt::print(os, "  parameters:    {}\n", s.parameter_count);
    fmt::print(os, "  source fields: {}\n", s.source_field_count);
    return;
  }

  fmt::print(os, "Calculations:  {}\n", s.total_calculations);
  fmt::print(os, "  max depth:     {}\n", s.max_dependency_depth);
  fmt::print(os, "  roots:         {}\n", s.root_calculations);
  fmt::print(os, "  leaves:        {}\n", s.leaf_calculations);
  fmt::print(os, "  intermediate:  {}\n", s.intermediate_calculations);
  fmt::print(os, "  cycles:        {}\n", s.circular_dependencies);
  fmt::print(os, "Parameters:    {}\n", s.parameter_count);
  fmt::print(os, "Source fields: {}\n", s.source_field_count);

  if (!report.cycles.empty()) {
    fmt::print(os, "\nCircular dependencies:\n");
    for (const auto & c : report.cycles) {
      fmt::print(os, "  {}\n", fmt::join(c.cycle, " -> "));
    }
  }

  fmt::print(os, "\n{}\n", report.dependency_tree);
}

void write_text(std::ostream & os, const ScopeReport & report)
{
  const auto & s = report.summary;
  if (report.message) {
    fmt::print(os, "{} ({} calculations scanned)\n", *report.message, s.total_calculations);
    return;
  }

  fmt::print(
    os, "Scoped aggregations: {} (FIXED {}, INCLUDE {}, EXCLUDE {})\n", s.total_expressions,
    s.fixed_count, s.include_count, s.exclude_count);
  fmt::print(os, "  nested:               {}\n", s.nested_count);
  fmt::print(os, "  FIXED, no dimensions: {}\n", s.table_wide_fixed_count);
  fmt::print(os, "  hidden:               {}\n", s.hidden_count);

  for (const auto & e : report.expressions) {
    fmt::print(os, "\n{} [{}]\n", e.caption, to_string(e.pattern));
    fmt::print(os, "  {}\n", e.details.source_text);
    fmt::print(os, "  {}\n", e.explanation.brief);
    if (e.used_in_calculations && !e.used_in_calculations->empty()) {
      fmt::print(os, "  used by: {}\n", fmt::join(*e.used_in_calculations, ", "));
    }
  }

  fmt::print(os, "\nPatterns:\n");
  for (size_t i = 0; i < k_scope_pattern_count; ++i) {
    const auto & captions = report.patterns.at(i);
    if (!captions.empty()) {
      fmt::print(
        os, "  {}: {}\n", to_string(static_cast<ScopePattern>(i)), fmt::join(captions, ", "));
    }
  }
}

}  // namespace wbcalc
