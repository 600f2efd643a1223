// wbcalc/report/text_report.hpp - Plain-text summaries for the terminal
#pragma once

#include <ostream>

#include "wbcalc/report/reports.hpp"

namespace wbcalc
{

/// Summary counts, cycles and the dependency tree.
void write_text(std::ostream & os, const DependencyReport & report);

/// Summary counts, one block per scoped aggregation and the pattern groups.
void write_text(std::ostream & os, const ScopeReport & report);

}  // namespace wbcalc
