// wbcalc/sema/resolution/field_extractor.hpp - Separate columns into calculations, parameters and fields
#pragma once

#include "wbcalc/basic/diagnostic.hpp"
#include "wbcalc/model/workbook.hpp"
#include "wbcalc/sema/resolution/field_table.hpp"

namespace wbcalc
{

/**
 * Walks every datasource of a workbook and fills a FieldTable.
 *
 * Columns of the Parameters datasource become parameters. Elsewhere a column
 * with a formula becomes a calculation and any other column a source field.
 * Calculations are keyed by caption; a second calculation with an existing
 * caption is dropped with a W102 warning.
 */
class FieldExtractor
{
public:
  explicit FieldExtractor(DiagnosticBag * diagnostics = nullptr) : diagnostics_(diagnostics) {}

  [[nodiscard]] FieldTable extract(const Workbook & workbook);

private:
  void extract_parameters(const Datasource & ds, FieldTable & table);
  void extract_columns(const Datasource & ds, FieldTable & table);

  DiagnosticBag * diagnostics_;
};

}  // namespace wbcalc
