// wbcalc/sema/resolution/field_extractor.cpp - Field extraction from the workbook tree

#include "wbcalc/sema/resolution/field_extractor.hpp"

#include <algorithm>

#include "wbcalc/syntax/reference_scanner.hpp"

namespace wbcalc
{

FieldTable FieldExtractor::extract(const Workbook & workbook)
{
  FieldTable table;
  for (const auto & ds : workbook.datasources) {
    if (ds.is_parameters()) {
      extract_parameters(ds, table);
    } else {
      extract_columns(ds, table);
    }
  }
  return table;
}

void FieldExtractor::extract_parameters(const Datasource & ds, FieldTable & table)
{
  for (const auto & col : ds.columns) {
    if (col.display_name().empty()) {
      continue;
    }

    Parameter param;
    param.name = col.name;
    param.caption = col.display_name();
    param.datatype = col.datatype;
    param.current_value = col.value;
    param.location = col.location;
    for (const auto & v : col.allowed_values) {
      if (std::find(param.allowed_values.begin(), param.allowed_values.end(), v) ==
          param.allowed_values.end()) {
        param.allowed_values.push_back(v);
      }
    }
    table.add_parameter(std::move(param));
  }
}

void FieldExtractor::extract_columns(const Datasource & ds, FieldTable & table)
{
  for (const auto & col : ds.columns) {
    if (!col.is_calculation() || col.formula->empty()) {
      SourceField field;
      field.name = col.name;
      field.caption = col.display_name();
      field.datatype = col.datatype;
      field.role = col.role;
      field.datasource = ds.name;
      table.add_source_field(std::move(field));
      continue;
    }

    CalculationField calc;
    calc.name = col.name;
    calc.caption = col.display_name();
    calc.formula = *col.formula;
    calc.datasource = ds.name;
    calc.hidden = col.hidden;
    calc.location = col.location;
    calc.all_references = syntax::extract_references(calc.formula);

    const std::string caption = calc.caption;
    if (table.add_calculation(std::move(calc))) {
      continue;
    }

    if (diagnostics_) {
      const CalcId first = *table.find_by_caption(caption);
      const auto & kept = table.calculation(first);
      diagnostics_
        ->report_warning(
          col.location, "duplicate calculation caption '" + caption + "'",
          "ignored: a calculation with this caption already exists")
        .with_code(diag_code::k_duplicate_caption)
        .with_secondary_label(kept.location, "first defined here")
        .with_note("datasource '" + ds.name + "' column '" + col.name + "' is not analyzed")
        .with_help("give each calculation a unique caption");
    }
  }
}

}  // namespace wbcalc
