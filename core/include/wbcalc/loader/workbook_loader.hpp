// wbcalc/loader/workbook_loader.hpp - Build the Workbook tree from documents
//
// Two input formats are accepted: the workbook XML (.twb) and the same tree
// written as JSON. Both produce an identical Workbook for the analyzer.
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "wbcalc/model/workbook.hpp"

namespace wbcalc
{

// ============================================================================
// Load Result
// ============================================================================

struct LoadResult
{
  /// Loaded workbook (only valid if success == true)
  Workbook workbook;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static LoadResult ok(Workbook wb)
  {
    LoadResult r;
    r.workbook = std::move(wb);
    r.success = true;
    return r;
  }

  static LoadResult fail(std::string msg)
  {
    LoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loading API
// ============================================================================

/**
 * Parse workbook XML.
 *
 * Reads workbook/datasources/datasource/column elements, the formula of a
 * column's <calculation> child, and parameter <members>. Line numbers of
 * columns are kept for diagnostics.
 */
[[nodiscard]] LoadResult load_twb_string(const std::string & xml);

/**
 * Convert a JSON document of the shape
 * {"datasources":[{"name":..,"columns":[{"name":..,"formula":..}]}]}.
 */
[[nodiscard]] LoadResult workbook_from_json(const nlohmann::json & doc);

/// Parse JSON text, then workbook_from_json.
[[nodiscard]] LoadResult load_workbook_json_string(const std::string & text);

/**
 * Load a workbook file, choosing the format by extension (.twb or .json).
 */
[[nodiscard]] LoadResult load_workbook_file(const std::filesystem::path & path);

/// Remove one pair of surrounding brackets: "[Sales]" -> "Sales".
[[nodiscard]] std::string strip_brackets(const std::string & name);

}  // namespace wbcalc
