// wbcalc/report/json_report.cpp - JSON serialization implementation
//
#include "wbcalc/report/json_report.hpp"

#include <string_view>

namespace wbcalc
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

json j_summary(const DependencySummary & s)
{
  return json{
    {"totalCalculations", s.total_calculations},
    {"maxDependencyDepth", s.max_dependency_depth},
    {"rootCalculations", s.root_calculations},
    {"leafCalculations", s.leaf_calculations},
    {"intermediateCalculations", s.intermediate_calculations},
    {"circularDependencies", s.circular_dependencies},
    {"parameterCount", s.parameter_count},
    {"sourceFieldCount", s.source_field_count},
  };
}

json j_calculation(const CalculationOutput & c)
{
  return json{
    {"name", c.name},
    {"caption", c.caption},
    {"formula", c.formula},
    {"datasource", c.datasource},
    {"depth", c.depth},
    {"hidden", c.hidden},
    {"dependsOn",
     {
       {"calculations", c.depends_on_calcs},
       {"sourceFields", c.depends_on_source},
       {"parameters", c.depends_on_params},
     }},
    {"usedBy", c.used_by},
    {"isRoot", c.is_root},
    {"isLeaf", c.is_leaf},
    {"isCircular", c.is_circular},
  };
}

json j_depth_levels(const std::vector<DepthLevel> & levels)
{
  json out = json::object();
  for (const auto & level : levels) {
    json entries = json::array();
    for (const auto & e : level.entries) {
      entries.push_back(
        json{{"caption", e.caption}, {"formula", e.formula_preview}, {"usedBy", e.used_by}});
    }
    out[level.key] = std::move(entries);
  }
  return out;
}

json j_scope_summary(const ScopeSummary & s)
{
  return json{
    {"totalExpressions", s.total_expressions},
    {"byKind", {{"fixed", s.fixed_count}, {"include", s.include_count}, {"exclude", s.exclude_count}}},
    {"nestedCount", s.nested_count},
    {"tableWideFixedCount", s.table_wide_fixed_count},
    {"hiddenCount", s.hidden_count},
    {"totalCalculations", s.total_calculations},
  };
}

json j_scope_guide(const ScopeGuide & g)
{
  return json{
    {"introduction", g.introduction},
    {"byKind", {{"fixed", g.fixed}, {"include", g.include}, {"exclude", g.exclude}}},
    {"tips", g.tips},
  };
}

json j_scope_expression(const ScopeExpressionOutput & e)
{
  json out{
    {"name", e.name},
    {"caption", e.caption},
    {"fullFormula", e.full_formula},
    {"datasource", e.datasource},
    {"hidden", e.hidden},
    {"details", to_json(e.details)},
    {"pattern", to_string(e.pattern)},
    {"explanation",
     {
       {"brief", e.explanation.brief},
       {"detailed", e.explanation.detailed},
       {"useCase", e.explanation.use_case},
     }},
  };
  if (e.used_in_calculations) {
    out["usageContext"] = json{{"usedInCalculations", *e.used_in_calculations}, {"isHidden", e.hidden}};
  }
  return out;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json to_json(const syntax::ScopedAggregation & agg)
{
  json out{
    {"kind", syntax::to_string(agg.kind)},
    {"dimensions", agg.dimensions},
    {"aggregation", agg.aggregation ? json(*agg.aggregation) : json(nullptr)},
    {"aggregatedExpression", agg.expression},
    {"hasNestedScope", agg.has_nested_scope},
  };
  if (!agg.nested.empty()) {
    json nested = json::array();
    for (const auto & n : agg.nested) {
      nested.push_back(to_json(n));
    }
    out["nestedExpressions"] = std::move(nested);
  }
  return out;
}

json to_json(const DependencyReport & report)
{
  json out{{"summary", j_summary(report.summary)}};
  if (report.message) {
    out["message"] = *report.message;
    return out;
  }

  out["depthLevels"] = j_depth_levels(report.depth_levels);

  json calcs = json::array();
  for (const auto & c : report.calculations) {
    calcs.push_back(j_calculation(c));
  }
  out["calculations"] = std::move(calcs);

  if (!report.cycles.empty()) {
    json cycles = json::array();
    for (const auto & c : report.cycles) {
      cycles.push_back(json{{"cycle", c.cycle}, {"explanation", c.explanation}});
    }
    out["circularDependencies"] = std::move(cycles);
  }

  out["dependencyTree"] = json{{"text", report.dependency_tree}};
  return out;
}

json to_json(const ScopeReport & report)
{
  json out{{"summary", j_scope_summary(report.summary)}};
  out["learningResources"] = j_scope_guide(scope_guide());
  if (report.message) {
    out["message"] = *report.message;
    return out;
  }

  json expressions = json::array();
  for (const auto & e : report.expressions) {
    expressions.push_back(j_scope_expression(e));
  }
  out["expressions"] = std::move(expressions);

  json patterns = json::object();
  for (size_t i = 0; i < k_scope_pattern_count; ++i) {
    const auto & captions = report.patterns.at(i);
    if (!captions.empty()) {
      patterns[std::string(to_string(static_cast<ScopePattern>(i)))] = captions;
    }
  }
  out["patterns"] = std::move(patterns);
  return out;
}

json to_json(const DiagnosticBag & diagnostics)
{
  json out = json::array();
  for (const auto & d : diagnostics) {
    json item{
      {"severity", severity_name(d.severity)},
      {"code", d.code},
      {"message", d.message},
    };
    const DocumentLocation loc = d.primary_location();
    if (loc.is_valid()) {
      item["line"] = loc.line();
    }
    if (!d.notes.empty()) {
      item["notes"] = d.notes;
    }
    if (d.help_message) {
      item["help"] = *d.help_message;
    }
    out.push_back(std::move(item));
  }
  return out;
}

}  // namespace wbcalc
