// wbcalc/model/workbook.hpp - Decoded workbook tree consumed by the analyzer
//
// This is the hand-off point from the document loaders: datasources, their
// ordered column lists, and the optional formula attached to a column.
// The analysis passes only read this tree.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbcalc/basic/source_location.hpp"

namespace wbcalc
{

/// Name of the datasource that holds workbook parameters instead of fields.
inline constexpr std::string_view k_parameters_datasource = "Parameters";

/**
 * A single column of a datasource.
 *
 * A column carrying a formula is a calculation; otherwise it is a source
 * field (or, inside the Parameters datasource, a parameter).
 */
struct Column
{
  /// Internal name with surrounding brackets removed (e.g. "Calculation_12").
  std::string name;

  /// Display caption; empty when the document did not provide one.
  std::string caption;

  bool hidden = false;

  std::string datatype;
  std::string role;

  /// Formula text (entities already decoded), present for calculations.
  std::optional<std::string> formula;

  /// Current value (parameters only).
  std::string value;

  /// Allowed member values (parameters only); empty means unconstrained.
  std::vector<std::string> allowed_values;

  DocumentLocation location;

  /// Caption if present, else the internal name.
  [[nodiscard]] const std::string & display_name() const noexcept
  {
    return caption.empty() ? name : caption;
  }

  [[nodiscard]] bool is_calculation() const noexcept { return formula.has_value(); }
};

struct Datasource
{
  std::string name;
  std::string caption;
  std::vector<Column> columns;
  DocumentLocation location;

  [[nodiscard]] bool is_parameters() const noexcept { return name == k_parameters_datasource; }
};

struct Workbook
{
  std::vector<Datasource> datasources;
};

}  // namespace wbcalc
