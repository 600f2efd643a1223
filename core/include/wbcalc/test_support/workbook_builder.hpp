// wbcalc/test_support/workbook_builder.hpp - helpers for unit tests
//
// Fluent construction of input trees, plus a one-call graph build that keeps
// the diagnostics next to the result.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "wbcalc/basic/diagnostic.hpp"
#include "wbcalc/driver/analyzer.hpp"
#include "wbcalc/model/workbook.hpp"

namespace wbcalc::test_support
{

class WorkbookBuilder
{
public:
  /// Start a new datasource; later calc()/field() calls add to it.
  WorkbookBuilder & datasource(std::string name, std::string caption = "")
  {
    Datasource ds;
    ds.name = std::move(name);
    ds.caption = std::move(caption);
    wb_.datasources.push_back(std::move(ds));
    return *this;
  }

  /// Calculated field. The internal name defaults to the caption.
  WorkbookBuilder & calc(std::string caption, std::string formula, std::string name = "")
  {
    Column col;
    col.name = name.empty() ? caption : std::move(name);
    col.caption = std::move(caption);
    col.formula = std::move(formula);
    current().columns.push_back(std::move(col));
    return *this;
  }

  WorkbookBuilder & hidden_calc(std::string caption, std::string formula)
  {
    calc(std::move(caption), std::move(formula));
    current().columns.back().hidden = true;
    return *this;
  }

  /// Source field (no formula).
  WorkbookBuilder & field(std::string caption, std::string name = "")
  {
    Column col;
    col.name = name.empty() ? caption : std::move(name);
    col.caption = std::move(caption);
    current().columns.push_back(std::move(col));
    return *this;
  }

  /// Parameter in the Parameters datasource (created on first use).
  WorkbookBuilder & parameter(
    std::string caption, std::string name, std::string value = "",
    std::vector<std::string> members = {})
  {
    Column col;
    col.name = std::move(name);
    col.caption = std::move(caption);
    col.value = std::move(value);
    col.allowed_values = std::move(members);
    parameters().columns.push_back(std::move(col));
    return *this;
  }

  [[nodiscard]] Workbook build() const { return wb_; }

private:
  Datasource & current()
  {
    if (wb_.datasources.empty() || wb_.datasources.back().is_parameters()) {
      datasource("Data");
    }
    return wb_.datasources.back();
  }

  Datasource & parameters()
  {
    for (auto & ds : wb_.datasources) {
      if (ds.is_parameters()) return ds;
    }
    Datasource ds;
    ds.name = std::string(k_parameters_datasource);
    wb_.datasources.push_back(std::move(ds));
    return wb_.datasources.back();
  }

  Workbook wb_;
};

struct TestGraph
{
  DiagnosticBag diags;
  DependencyGraph graph;

  [[nodiscard]] const CalculationField & calc(const std::string & caption) const
  {
    const auto id = graph.fields.find_by_caption(caption);
    if (!id) {
      throw std::out_of_range("no calculation with caption '" + caption + "'");
    }
    return graph.fields.calculation(*id);
  }

  [[nodiscard]] std::vector<std::string> captions(const std::vector<CalcId> & ids) const
  {
    return graph.fields.captions_of(ids);
  }
};

[[nodiscard]] inline TestGraph build_graph(const Workbook & wb)
{
  TestGraph out;
  out.graph = Analyzer::build_graph(wb, out.diags);
  return out;
}

}  // namespace wbcalc::test_support
