// wbcalc/project/analysis_config.hpp - Analysis configuration (wbcalc.yaml)
//
// Parses and validates wbcalc.yaml. Values not present keep the
// AnalysisOptions defaults; unknown keys are ignored.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "wbcalc/driver/analysis_options.hpp"

namespace wbcalc
{

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded options (only valid if success == true)
  AnalysisOptions options;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(AnalysisOptions opts)
  {
    ConfigLoadResult r;
    r.options = opts;
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse configuration text.
 *
 * @param yaml_text Contents of a wbcalc.yaml
 * @return ConfigLoadResult with the options or an error message
 */
[[nodiscard]] ConfigLoadResult parse_analysis_config(const std::string & yaml_text);

/**
 * Load a configuration file.
 *
 * @param config_path Path to wbcalc.yaml
 */
[[nodiscard]] ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path);

/**
 * Find wbcalc.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_analysis_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_config_file_name = "wbcalc.yaml";

}  // namespace wbcalc
