// wbcalc/sema/analysis/cycle_detector.hpp - Dependency cycles and depth assignment
//
// Runs after DependencyResolver and build_reverse_edges, because it walks
// depends_on_calcs and reads the finished graph.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "wbcalc/basic/diagnostic.hpp"
#include "wbcalc/sema/resolution/field_table.hpp"

namespace wbcalc
{

/**
 * One discovered cycle. The first member is repeated at the end, so a
 * self-reference reads [A, A] and a mutual pair [A, B, A].
 */
struct DependencyCycle
{
  std::vector<CalcId> members;
};

/**
 * Detect circular calculations and assign every calculation its depth.
 *
 * A depth-first walk in definition order marks each calculation unvisited,
 * in progress (on the active path) or finalized. Reaching an in-progress
 * calculation closes a cycle; that path slice is reported once. Every
 * calculation in a strongly connected component with a cycle is flagged
 * circular, including those only reached through a different back edge.
 *
 * Depth is 0 for circular calculations and for calculations without
 * calculation dependencies, otherwise 1 + the deepest dependency (circular
 * dependencies count as 0).
 *
 * All traversal state lives in a single call; the detector may be reused.
 */
class CycleDetector
{
public:
  explicit CycleDetector(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /// Flag circular calculations, assign depths and return the distinct cycles.
  std::vector<DependencyCycle> run(FieldTable & table);

  [[nodiscard]] size_t cycle_count() const noexcept { return cycleCount_; }
  [[nodiscard]] bool has_cycles() const noexcept { return cycleCount_ > 0; }

private:
  void report_cycle(const FieldTable & table, const DependencyCycle & cycle);

  DiagnosticBag * diags_ = nullptr;
  size_t cycleCount_ = 0;
};

/// "a -> b -> a" using calculation captions.
[[nodiscard]] std::string format_cycle(const FieldTable & table, const DependencyCycle & cycle);

}  // namespace wbcalc
