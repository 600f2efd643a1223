// wbcalc/basic/diagnostic.hpp - Diagnostic types for loading and analysis
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbcalc/basic/source_location.hpp"

namespace wbcalc
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{
inline constexpr const char * k_circular_dependency = "W101";
inline constexpr const char * k_duplicate_caption = "W102";
inline constexpr const char * k_no_calculations = "I103";
inline constexpr const char * k_load_failure = "E201";
inline constexpr const char * k_config_failure = "E202";
}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // element the diagnostic is about
  Secondary,  // related element
};

struct Label
{
  DocumentLocation location;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "W101"
  std::string message;  // main message

  std::vector<Label> labels;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] DocumentLocation primary_location() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    DocumentLocation location, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(DocumentLocation location, std::string msg);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    DocumentLocation location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    DocumentLocation location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    DocumentLocation location, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] bool has_code(std::string_view code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace wbcalc
