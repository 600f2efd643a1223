// wbcalc/loader/workbook_loader.cpp - XML and JSON workbook loading

#include "wbcalc/loader/workbook_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <tinyxml2.h>

#include "wbcalc/basic/string_utils.hpp"

namespace wbcalc
{

namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

std::string get_string_attr(const tinyxml2::XMLElement * elem, const char * name)
{
  const char * val = elem->Attribute(name);
  return val ? std::string(val) : std::string();
}

DocumentLocation line_of(const tinyxml2::XMLElement * elem)
{
  const int line = elem->GetLineNum();
  return line > 0 ? DocumentLocation(static_cast<uint32_t>(line)) : DocumentLocation{};
}

void parse_members(const tinyxml2::XMLElement * col_elem, Column & col)
{
  const auto * members = col_elem->FirstChildElement("members");
  if (!members) return;

  for (const auto * m = members->FirstChildElement("member"); m;
       m = m->NextSiblingElement("member")) {
    std::string value = get_string_attr(m, "alias");
    if (value.empty()) {
      value = get_string_attr(m, "value");
    }
    if (!value.empty()) {
      col.allowed_values.push_back(std::move(value));
    }
  }
}

Column parse_column(const tinyxml2::XMLElement * elem)
{
  Column col;
  col.name = strip_brackets(get_string_attr(elem, "name"));
  col.caption = get_string_attr(elem, "caption");
  col.hidden = get_string_attr(elem, "hidden") == "true";
  col.datatype = get_string_attr(elem, "datatype");
  col.role = get_string_attr(elem, "role");
  col.value = get_string_attr(elem, "value");
  col.location = line_of(elem);

  if (const auto * calc = elem->FirstChildElement("calculation")) {
    std::string formula = get_string_attr(calc, "formula");
    if (!formula.empty()) {
      col.formula = std::move(formula);
    }
  }

  parse_members(elem, col);
  return col;
}

std::string json_string(const nlohmann::json & obj, const char * key)
{
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

Column column_from_json(const nlohmann::json & obj)
{
  if (!obj.is_object()) {
    throw std::invalid_argument("column entry must be an object");
  }

  Column col;
  col.name = strip_brackets(json_string(obj, "name"));
  col.caption = json_string(obj, "caption");
  col.hidden = obj.value("hidden", false);
  col.datatype = json_string(obj, "datatype");
  col.role = json_string(obj, "role");
  col.value = json_string(obj, "value");

  std::string formula = json_string(obj, "formula");
  if (!formula.empty()) {
    col.formula = std::move(formula);
  }

  if (const auto it = obj.find("allowedValues"); it != obj.end()) {
    col.allowed_values = it->get<std::vector<std::string>>();
  }
  return col;
}

}  // namespace

std::string strip_brackets(const std::string & name)
{
  if (name.size() >= 2 && name.front() == '[' && name.back() == ']') {
    return name.substr(1, name.size() - 2);
  }
  return name;
}

// ============================================================================
// XML
// ============================================================================

LoadResult load_twb_string(const std::string & xml)
{
  std::string_view text(xml);
  if (text.substr(0, k_utf8_bom.size()) == k_utf8_bom) {
    text.remove_prefix(k_utf8_bom.size());
  }

  tinyxml2::XMLDocument doc;
  const tinyxml2::XMLError err = doc.Parse(text.data(), text.size());
  if (err != tinyxml2::XML_SUCCESS) {
    return LoadResult::fail("failed to parse workbook XML: " + std::string(doc.ErrorStr()));
  }

  const auto * root = doc.RootElement();
  if (!root || std::string_view(root->Name()) != "workbook") {
    return LoadResult::fail(
      "invalid workbook structure: expected <workbook> root element" +
      (root ? std::string(", found <") + root->Name() + ">" : std::string()));
  }

  Workbook wb;
  const auto * container = root->FirstChildElement("datasources");
  if (!container) {
    return LoadResult::ok(std::move(wb));
  }

  for (const auto * ds_elem = container->FirstChildElement("datasource"); ds_elem;
       ds_elem = ds_elem->NextSiblingElement("datasource")) {
    Datasource ds;
    ds.name = get_string_attr(ds_elem, "name");
    ds.caption = get_string_attr(ds_elem, "caption");
    ds.location = line_of(ds_elem);

    for (const auto * col = ds_elem->FirstChildElement("column"); col;
         col = col->NextSiblingElement("column")) {
      ds.columns.push_back(parse_column(col));
    }
    wb.datasources.push_back(std::move(ds));
  }

  return LoadResult::ok(std::move(wb));
}

// ============================================================================
// JSON
// ============================================================================

LoadResult workbook_from_json(const nlohmann::json & doc)
{
  if (!doc.is_object()) {
    return LoadResult::fail("invalid workbook structure: top level must be an object");
  }

  Workbook wb;
  const auto it = doc.find("datasources");
  if (it == doc.end()) {
    return LoadResult::ok(std::move(wb));
  }
  if (!it->is_array()) {
    return LoadResult::fail("invalid workbook structure: 'datasources' must be a list");
  }

  try {
    for (const auto & ds_obj : *it) {
      if (!ds_obj.is_object()) {
        return LoadResult::fail("invalid workbook structure: datasource entry must be an object");
      }
      Datasource ds;
      ds.name = json_string(ds_obj, "name");
      ds.caption = json_string(ds_obj, "caption");

      if (const auto cols = ds_obj.find("columns"); cols != ds_obj.end()) {
        if (!cols->is_array()) {
          return LoadResult::fail(
            "invalid workbook structure: 'columns' of datasource '" + ds.name + "' must be a list");
        }
        for (const auto & col : *cols) {
          ds.columns.push_back(column_from_json(col));
        }
      }
      wb.datasources.push_back(std::move(ds));
    }
  } catch (const nlohmann::json::exception & e) {
    return LoadResult::fail("invalid workbook structure: " + std::string(e.what()));
  } catch (const std::invalid_argument & e) {
    return LoadResult::fail("invalid workbook structure: " + std::string(e.what()));
  }

  return LoadResult::ok(std::move(wb));
}

LoadResult load_workbook_json_string(const std::string & text)
{
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error & e) {
    return LoadResult::fail("failed to parse workbook JSON: " + std::string(e.what()));
  }
  return workbook_from_json(doc);
}

// ============================================================================
// Files
// ============================================================================

LoadResult load_workbook_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return LoadResult::fail("workbook file not found: " + path.string());
  }

  std::string ext = path.extension().string();
  for (auto & c : ext) {
    c = ascii_lower(c);
  }
  if (ext != ".twb" && ext != ".json") {
    return LoadResult::fail(
      "unsupported workbook file type '" + (ext.empty() ? std::string("(none)") : ext) +
      "' (expected .twb or .json)");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return LoadResult::fail("cannot open workbook file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  return ext == ".twb" ? load_twb_string(ss.str()) : load_workbook_json_string(ss.str());
}

}  // namespace wbcalc
