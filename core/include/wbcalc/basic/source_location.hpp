// wbcalc/basic/source_location.hpp - Locations inside an input workbook document
//
// The analysis core works on an already-decoded tree, so the only location
// information that survives is the line of the element a node was read from.
//
#pragma once

#include <cstdint>
#include <string>

namespace wbcalc
{

// ============================================================================
// DocumentLocation - Line inside the workbook document
// ============================================================================

/**
 * Position of a datasource or column element in the document it was loaded from.
 *
 * Trees built in memory (tests, JSON input without line info) carry an invalid
 * location; printers fall back to the document name alone.
 */
class DocumentLocation
{
public:
  /// Invalid/unknown line sentinel
  static constexpr uint32_t k_invalid_line = 0;

  /// Create an invalid location
  constexpr DocumentLocation() noexcept = default;

  /// Create a location from a 1-indexed line number
  constexpr explicit DocumentLocation(uint32_t line) noexcept : line_(line) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line_ != k_invalid_line; }

  /// 1-indexed line number (0 = invalid)
  [[nodiscard]] constexpr uint32_t line() const noexcept { return line_; }

  [[nodiscard]] constexpr bool operator==(DocumentLocation other) const noexcept
  {
    return line_ == other.line_;
  }
  [[nodiscard]] constexpr bool operator!=(DocumentLocation other) const noexcept
  {
    return line_ != other.line_;
  }
  [[nodiscard]] constexpr bool operator<(DocumentLocation other) const noexcept
  {
    return line_ < other.line_;
  }

private:
  uint32_t line_ = k_invalid_line;
};

}  // namespace wbcalc
