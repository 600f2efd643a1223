// wbcalc/sema/resolution/dependency_resolver.cpp - Reference classification

#include "wbcalc/sema/resolution/dependency_resolver.hpp"

#include <algorithm>

namespace wbcalc
{
namespace
{

template <typename T>
void push_unique(std::vector<T> & list, const T & value)
{
  if (std::find(list.begin(), list.end(), value) == list.end()) {
    list.push_back(value);
  }
}

}  // namespace

void DependencyResolver::resolve()
{
  for (auto & calc : table_.calculations()) {
    resolve_calculation(calc);
  }
}

void DependencyResolver::resolve_calculation(CalculationField & calc)
{
  calc.depends_on_params.clear();
  calc.depends_on_calcs.clear();
  calc.depends_on_source.clear();

  for (const auto & ref : calc.all_references) {
    if (table_.is_parameter(ref)) {
      push_unique(calc.depends_on_params, ref);
      continue;
    }
    if (const auto target = table_.find_calculation(ref)) {
      push_unique(calc.depends_on_calcs, *target);
      continue;
    }
    push_unique(calc.depends_on_source, ref);
  }
}

void build_reverse_edges(FieldTable & table)
{
  auto calcs = table.calculations();
  for (auto & calc : calcs) {
    calc.used_by.clear();
  }
  for (const auto & calc : calcs) {
    for (const CalcId dep : calc.depends_on_calcs) {
      push_unique(calcs[dep].used_by, calc.id);
    }
  }
}

}  // namespace wbcalc
