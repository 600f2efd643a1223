// wbcalc/sema/analysis/cycle_detector.cpp - Cycle detection + depth assignment

#include "wbcalc/sema/analysis/cycle_detector.hpp"

#include <algorithm>
#include <cstdint>
#include <set>

namespace wbcalc
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

/// Everything one traversal needs. Lowlinks group calculations into strongly
/// connected components while the same walk records back-edge cycles.
struct TraversalState
{
  explicit TraversalState(gsl::span<CalculationField> calcs)
  : nodes(calcs),
    color(calcs.size(), Color::White),
    index(calcs.size(), 0),
    lowlink(calcs.size(), 0),
    on_component_stack(calcs.size(), false)
  {
  }

  gsl::span<CalculationField> nodes;
  std::vector<Color> color;
  std::vector<uint32_t> index;
  std::vector<uint32_t> lowlink;
  uint32_t next_index = 0;

  std::vector<CalcId> path;  // active path, root first
  std::vector<CalcId> component_stack;
  std::vector<bool> on_component_stack;

  std::vector<CalcId> finish_order;

  std::vector<DependencyCycle> cycles;
  std::set<std::vector<CalcId>> seen_cycles;
};

void record_cycle(TraversalState & st, CalcId target)
{
  const auto start = std::find(st.path.begin(), st.path.end(), target);
  if (start == st.path.end()) {
    return;
  }

  DependencyCycle cycle;
  cycle.members.assign(start, st.path.end());
  cycle.members.push_back(target);

  if (st.seen_cycles.insert(cycle.members).second) {
    st.cycles.push_back(std::move(cycle));
  }
}

void close_component(TraversalState & st, CalcId root)
{
  std::vector<CalcId> members;
  CalcId popped = 0;
  do {
    popped = st.component_stack.back();
    st.component_stack.pop_back();
    st.on_component_stack[popped] = false;
    members.push_back(popped);
  } while (popped != root);

  const auto & deps = st.nodes[root].depends_on_calcs;
  const bool self_loop = std::find(deps.begin(), deps.end(), root) != deps.end();
  if (members.size() > 1 || self_loop) {
    for (const CalcId m : members) {
      st.nodes[m].is_circular = true;
    }
  }
}

void visit(TraversalState & st, CalcId u)
{
  st.color[u] = Color::Gray;
  st.index[u] = st.lowlink[u] = st.next_index++;
  st.path.push_back(u);
  st.component_stack.push_back(u);
  st.on_component_stack[u] = true;

  for (const CalcId v : st.nodes[u].depends_on_calcs) {
    switch (st.color[v]) {
      case Color::Gray:
        record_cycle(st, v);
        st.lowlink[u] = std::min(st.lowlink[u], st.index[v]);
        break;
      case Color::White:
        visit(st, v);
        st.lowlink[u] = std::min(st.lowlink[u], st.lowlink[v]);
        break;
      case Color::Black:
        if (st.on_component_stack[v]) {
          st.lowlink[u] = std::min(st.lowlink[u], st.index[v]);
        }
        break;
    }
  }

  st.path.pop_back();
  if (st.lowlink[u] == st.index[u]) {
    close_component(st, u);
  }
  st.color[u] = Color::Black;
  st.finish_order.push_back(u);
}

// Dependencies of a non-circular calculation always finish before it, so one
// pass in finish order sees final child depths.
void assign_depths(TraversalState & st)
{
  for (const CalcId id : st.finish_order) {
    auto & calc = st.nodes[id];
    if (calc.is_circular || calc.depends_on_calcs.empty()) {
      calc.depth = 0;
      continue;
    }
    int deepest = 0;
    for (const CalcId dep : calc.depends_on_calcs) {
      const auto & d = st.nodes[dep];
      deepest = std::max(deepest, d.is_circular ? 0 : d.depth);
    }
    calc.depth = deepest + 1;
  }
}

}  // namespace

std::string format_cycle(const FieldTable & table, const DependencyCycle & cycle)
{
  std::string out;
  for (size_t i = 0; i < cycle.members.size(); ++i) {
    if (i > 0) out += " -> ";
    out += table.calculation(cycle.members[i]).caption;
  }
  return out;
}

std::vector<DependencyCycle> CycleDetector::run(FieldTable & table)
{
  cycleCount_ = 0;

  auto calcs = table.calculations();
  for (auto & calc : calcs) {
    calc.depth = -1;
    calc.is_circular = false;
  }

  TraversalState st(calcs);
  st.path.reserve(calcs.size());
  st.finish_order.reserve(calcs.size());

  for (const auto & calc : calcs) {
    if (st.color[calc.id] == Color::White) {
      visit(st, calc.id);
    }
  }

  assign_depths(st);

  cycleCount_ = st.cycles.size();
  for (const auto & cycle : st.cycles) {
    report_cycle(table, cycle);
  }
  return std::move(st.cycles);
}

void CycleDetector::report_cycle(const FieldTable & table, const DependencyCycle & cycle)
{
  if (!diags_ || cycle.members.empty()) {
    return;
  }

  const auto & head = table.calculation(cycle.members.front());
  auto builder = diags_->report_warning(
    head.location, "circular dependency: " + format_cycle(table, cycle),
    "'" + head.caption + "' depends on itself");
  builder.with_code(diag_code::k_circular_dependency);

  // Remaining distinct members, skipping the repeated head.
  for (size_t i = 1; i + 1 < cycle.members.size(); ++i) {
    const auto & member = table.calculation(cycle.members[i]);
    builder.with_secondary_label(member.location, "'" + member.caption + "' is part of the cycle");
  }
  builder.with_help("depths of circular calculations are reported as 0");
}

}  // namespace wbcalc
