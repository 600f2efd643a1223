// wbcalc/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "wbcalc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace wbcalc
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view document_name)
{
  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line ===
  const DocumentLocation primary = diag.primary_location();
  if (primary.is_valid()) {
    fmt::print(os_, "{} {}:{}\n", gutter_arrow(), document_name, primary.line());
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), document_name);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Labels ===
  for (const auto & label : diag.labels) {
    print_label(label, document_name);
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view document_name)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Located diagnostics by line, unlocated ones keep their order at the end
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const DocumentLocation la = a.primary_location();
      const DocumentLocation lb = b.primary_location();
      if (la.is_valid() != lb.is_valid()) {
        return la.is_valid();
      }
      return la < lb;
    });

  for (const auto & d : sorted_diags) {
    print(d, document_name);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

namespace
{

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

}  // namespace

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, std::string_view document_name)
{
  if (label.message.empty()) {
    return;
  }

  // Secondary labels point at a different element, so show where
  if (label.style == LabelStyle::Secondary && label.location.is_valid()) {
    print_note(fmt::format("{} ({}:{})", label.message, document_name, label.location.line()));
    return;
  }
  print_note(label.message);
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace wbcalc
