// wbcalc/basic/diagnostic_printer.hpp
//
// Prints diagnostics with document location information in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "wbcalc/basic/diagnostic.hpp"

namespace wbcalc
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W101]: circular dependency: Alpha -> Beta -> Alpha
 *     --> Superstore.twb:812
 *      |
 *      = note: Beta depends on Alpha
 *      = help: break the cycle by inlining one of the formulas
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param document_name Name shown in the location line (usually the input path)
   */
  void print(const Diagnostic & diag, std::string_view document_name);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by document line.
   */
  void print_all(const DiagnosticBag & diags, std::string_view document_name);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, std::string_view document_name);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace wbcalc
