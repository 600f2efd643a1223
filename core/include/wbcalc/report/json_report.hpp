// wbcalc/report/json_report.hpp - JSON serialization for analysis reports
//
// Key names are camelCase. Optional parts (message, cycles, usage context,
// empty pattern groups) are omitted rather than written as null.
//
#pragma once

#include <nlohmann/json.hpp>

#include "wbcalc/basic/diagnostic.hpp"
#include "wbcalc/report/reports.hpp"
#include "wbcalc/syntax/scope_parser.hpp"

namespace wbcalc
{

[[nodiscard]] nlohmann::json to_json(const DependencyReport & report);

[[nodiscard]] nlohmann::json to_json(const ScopeReport & report);

/// kind, dimensions, aggregation (null if absent), aggregatedExpression and nesting.
[[nodiscard]] nlohmann::json to_json(const syntax::ScopedAggregation & agg);

/// Array of {severity, code, message, line?, notes?, help?}.
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diagnostics);

}  // namespace wbcalc
