// wbcalc/sema/resolution/field_table.hpp - Symbol table for calculations, parameters and fields
//
// Calculations live in an arena (std::vector) and are referred to by CalcId.
// Every cross-reference between calculations goes through this table, so no
// pass matches names against each other directly.
//
#pragma once

#include <cstdint>
#include <functional>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "wbcalc/basic/source_location.hpp"

namespace wbcalc
{

// ============================================================================
// Identifiers
// ============================================================================

/// Index of a calculation in its FieldTable.
using CalcId = uint32_t;

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

using NameSet = std::unordered_set<std::string, StringViewHash, StringViewEqual>;

// ============================================================================
// Field Records
// ============================================================================

/**
 * A calculated field and its place in the dependency graph.
 */
struct CalculationField
{
  CalcId id = 0;

  std::string name;     ///< internal symbol name
  std::string caption;  ///< display caption; identity key within the table
  std::string formula;
  std::string datasource;
  bool hidden = false;
  DocumentLocation location;

  /// Bracketed tokens of the formula, in first-occurrence order.
  std::vector<std::string> all_references;

  // Resolved forward edges (each de-duplicated, in reference order)
  std::vector<CalcId> depends_on_calcs;
  std::vector<std::string> depends_on_source;
  std::vector<std::string> depends_on_params;

  /// Reverse edges: calculations that list this one in depends_on_calcs.
  std::vector<CalcId> used_by;

  /// -1 = not yet computed, 0 = no calculation dependencies, N = 1 + deepest dependency.
  /// Circular calculations report 0.
  int depth = -1;
  bool is_circular = false;

  [[nodiscard]] bool is_root() const noexcept { return depends_on_calcs.empty(); }
  [[nodiscard]] bool is_leaf() const noexcept { return used_by.empty(); }
};

/**
 * A workbook parameter (column of the Parameters datasource).
 */
struct Parameter
{
  std::string name;
  std::string caption;
  std::string datatype;
  std::string current_value;
  std::vector<std::string> allowed_values;  ///< empty = unconstrained
  DocumentLocation location;
};

/**
 * A column without a formula.
 */
struct SourceField
{
  std::string name;
  std::string caption;
  std::string datatype;
  std::string role;
  std::string datasource;
};

// ============================================================================
// FieldTable
// ============================================================================

class FieldTable
{
public:
  FieldTable() = default;

  // ===========================================================================
  // Definition
  // ===========================================================================

  /**
   * Add a calculation keyed by its caption.
   *
   * @return the new id, or std::nullopt if the caption is already taken (the
   *         table keeps the first definition).
   */
  std::optional<CalcId> add_calculation(CalculationField field);

  /// Add a parameter; both its caption and internal name become referable.
  void add_parameter(Parameter param);

  /// Add a source field; both its caption and internal name are recorded.
  void add_source_field(SourceField field);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Find the calculation a reference token names, matching caption or
   * internal name. When both match different calculations the one defined
   * first wins.
   */
  [[nodiscard]] std::optional<CalcId> find_calculation(std::string_view symbol) const;

  [[nodiscard]] std::optional<CalcId> find_by_caption(std::string_view caption) const;

  [[nodiscard]] bool is_parameter(std::string_view symbol) const;
  [[nodiscard]] bool is_source_field(std::string_view symbol) const;

  // ===========================================================================
  // Access
  // ===========================================================================

  [[nodiscard]] CalculationField & calculation(CalcId id) { return calcs_.at(id); }
  [[nodiscard]] const CalculationField & calculation(CalcId id) const { return calcs_.at(id); }

  [[nodiscard]] gsl::span<CalculationField> calculations() noexcept { return calcs_; }
  [[nodiscard]] gsl::span<const CalculationField> calculations() const noexcept { return calcs_; }

  [[nodiscard]] size_t calculation_count() const noexcept { return calcs_.size(); }
  [[nodiscard]] bool empty() const noexcept { return calcs_.empty(); }

  [[nodiscard]] const std::vector<Parameter> & parameters() const noexcept { return params_; }
  [[nodiscard]] const std::vector<SourceField> & source_fields() const noexcept
  {
    return sources_;
  }

  [[nodiscard]] const NameSet & parameter_names() const noexcept { return param_names_; }
  [[nodiscard]] const NameSet & source_field_names() const noexcept { return source_names_; }

  /// Captions of the given calculations, in order.
  [[nodiscard]] std::vector<std::string> captions_of(gsl::span<const CalcId> ids) const;

private:
  std::vector<CalculationField> calcs_;
  std::unordered_map<std::string, CalcId, StringViewHash, StringViewEqual> by_caption_;
  std::unordered_map<std::string, CalcId, StringViewHash, StringViewEqual> by_name_;

  std::vector<Parameter> params_;
  NameSet param_names_;

  std::vector<SourceField> sources_;
  NameSet source_names_;
};

}  // namespace wbcalc
