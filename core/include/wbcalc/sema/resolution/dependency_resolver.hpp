// wbcalc/sema/resolution/dependency_resolver.hpp - Forward and reverse dependency edges
#pragma once

#include "wbcalc/sema/resolution/field_table.hpp"

namespace wbcalc
{

/**
 * Classifies every reference of every calculation and records the edges.
 *
 * Each reference is tried as a parameter name first, then as a calculation
 * caption or internal name, and otherwise counts as a source field, so no
 * reference is left unclassified. Edge lists are de-duplicated and keep the
 * order the references appear in the formula.
 */
class DependencyResolver
{
public:
  explicit DependencyResolver(FieldTable & table) : table_(table) {}

  /// Fill depends_on_params / depends_on_calcs / depends_on_source.
  void resolve();

private:
  void resolve_calculation(CalculationField & calc);

  FieldTable & table_;
};

/**
 * Invert depends_on_calcs into used_by. For every edge A -> B, A is appended
 * to B.used_by once.
 */
void build_reverse_edges(FieldTable & table);

}  // namespace wbcalc
