// argconv/convert/custom_converter.cpp - Application-supplied converters
//
#include "argconv/convert/custom_converter.hpp"

#include <algorithm>

namespace argconv
{

// ============================================================================
// CustomConverters
// ============================================================================

void CustomConverters::add(ConverterInfo info)
{
  const auto it = std::find_if(
    converters_.begin(), converters_.end(),
    [&info](const ConverterInfo & existing) { return existing.type == info.type; });
  if (it != converters_.end()) {
    *it = std::move(info);
  } else {
    converters_.push_back(std::move(info));
  }
}

const ConverterInfo * CustomConverters::get_converter_info(const DeclaredType & type) const
{
  for (const auto & info : converters_) {
    if (info.type == type) {
      return &info;
    }
  }
  return nullptr;
}

// ============================================================================
// CustomConverter
// ============================================================================

// Nested converters of a custom type never use custom converters themselves.
CustomConverter::CustomConverter(
  TypeInfo info, const ConverterInfo & converter_info, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), nullptr, std::move(languages)), converter_info_(converter_info)
{
  primitive_type_ = converter_info_.type;
  value_types_ = converter_info_.value_types;
}

std::optional<std::string> CustomConverter::doc() const
{
  if (converter_info_.doc.empty()) {
    return std::nullopt;
  }
  return converter_info_.doc;
}

std::string CustomConverter::compute_type_name() const { return converter_info_.name; }

bool CustomConverter::handles_value(const Value & value) const
{
  return value_types_.empty() || Converter::handles_value(value);
}

Value CustomConverter::do_convert(const Value & value) const
{
  if (!converter_info_.convert) {
    throw ConversionError();
  }
  try {
    return converter_info_.convert(value);
  } catch (const ConversionError &) {
    throw;
  } catch (const std::exception &) {
    throw ConversionError();
  }
}

}  // namespace argconv
