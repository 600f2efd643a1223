// wbcalc/project/analysis_config.cpp - Analysis configuration implementation
//
#include "wbcalc/project/analysis_config.hpp"

#include <yaml-cpp/yaml.h>

namespace wbcalc
{

namespace
{

/// Read a non-negative integer if the key is present.
bool read_count(
  const YAML::Node & section, const char * section_name, const char * key, size_t & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }

  long long value = 0;
  try {
    value = node.as<long long>();
  } catch (const YAML::Exception &) {
    error = std::string(section_name) + "." + key + " must be an integer";
    return false;
  }
  if (value < 0) {
    error = std::string(section_name) + "." + key + " must not be negative";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

/// Read a boolean if the key is present.
bool read_flag(
  const YAML::Node & section, const char * section_name, const char * key, bool & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::Exception &) {
    error = std::string(section_name) + "." + key + " must be true or false";
    return false;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  AnalysisOptions opts;
  std::string error;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(opts);
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'analysis' section
  if (const YAML::Node analysis = root["analysis"]) {
    if (!analysis.IsMap()) {
      return ConfigLoadResult::fail("analysis must be a map");
    }
    if (
      !read_flag(analysis, "analysis", "include_source_fields", opts.include_source_fields, error) ||
      !read_count(analysis, "analysis", "source_field_preview", opts.source_field_preview, error) ||
      !read_count(analysis, "analysis", "formula_preview_length", opts.formula_preview_length, error) ||
      !read_count(
        analysis, "analysis", "max_listed_calculations", opts.max_listed_calculations, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'tree' section
  if (const YAML::Node tree = root["tree"]) {
    if (!tree.IsMap()) {
      return ConfigLoadResult::fail("tree must be a map");
    }
    if (
      !read_count(tree, "tree", "max_leaf_trees", opts.tree.max_leaf_trees, error) ||
      !read_count(tree, "tree", "source_preview", opts.tree.source_preview, error) ||
      !read_flag(
        tree, "tree", "collapse_shared_subtrees", opts.tree.collapse_shared_subtrees, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'scopes' section
  if (const YAML::Node scopes = root["scopes"]) {
    if (!scopes.IsMap()) {
      return ConfigLoadResult::fail("scopes must be a map");
    }
    if (!read_flag(scopes, "scopes", "include_usage_context", opts.include_usage_context, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  return ConfigLoadResult::ok(opts);
}

}  // namespace

ConfigLoadResult parse_analysis_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = parse_root(root);
  if (!result.success) {
    result.error = config_path.string() + ": " + result.error;
  }
  return result;
}

std::optional<std::filesystem::path> find_analysis_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // A file path starts the search in its directory
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace wbcalc
