// wbcalc/sema/resolution/field_table.cpp - Symbol table implementation

#include "wbcalc/sema/resolution/field_table.hpp"

#include <algorithm>
#include <utility>

namespace wbcalc
{

std::optional<CalcId> FieldTable::add_calculation(CalculationField field)
{
  if (by_caption_.find(field.caption) != by_caption_.end()) {
    return std::nullopt;
  }

  const auto id = static_cast<CalcId>(calcs_.size());
  field.id = id;

  by_caption_.emplace(field.caption, id);
  if (!field.name.empty()) {
    // Internal names may repeat across datasources; the first one stays.
    by_name_.emplace(field.name, id);
  }

  calcs_.push_back(std::move(field));
  return id;
}

void FieldTable::add_parameter(Parameter param)
{
  if (!param.caption.empty()) {
    param_names_.insert(param.caption);
  }
  if (!param.name.empty()) {
    param_names_.insert(param.name);
  }
  params_.push_back(std::move(param));
}

void FieldTable::add_source_field(SourceField field)
{
  if (!field.caption.empty()) {
    source_names_.insert(field.caption);
  }
  if (!field.name.empty()) {
    source_names_.insert(field.name);
  }
  sources_.push_back(std::move(field));
}

std::optional<CalcId> FieldTable::find_calculation(std::string_view symbol) const
{
  const auto it_caption = by_caption_.find(symbol);
  const auto it_name = by_name_.find(symbol);

  const bool has_caption = it_caption != by_caption_.end();
  const bool has_name = it_name != by_name_.end();

  if (has_caption && has_name) {
    return std::min(it_caption->second, it_name->second);
  }
  if (has_caption) {
    return it_caption->second;
  }
  if (has_name) {
    return it_name->second;
  }
  return std::nullopt;
}

std::optional<CalcId> FieldTable::find_by_caption(std::string_view caption) const
{
  const auto it = by_caption_.find(caption);
  if (it == by_caption_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool FieldTable::is_parameter(std::string_view symbol) const
{
  return param_names_.find(symbol) != param_names_.end();
}

bool FieldTable::is_source_field(std::string_view symbol) const
{
  return source_names_.find(symbol) != source_names_.end();
}

std::vector<std::string> FieldTable::captions_of(gsl::span<const CalcId> ids) const
{
  std::vector<std::string> out;
  out.reserve(ids.size());
  for (const CalcId id : ids) {
    out.push_back(calcs_.at(id).caption);
  }
  return out;
}

}  // namespace wbcalc
