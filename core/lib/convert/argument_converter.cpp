// argconv/convert/argument_converter.cpp - Batch conversion of named arguments
//
#include "argconv/convert/argument_converter.hpp"

#include <algorithm>

namespace argconv
{

ArgumentConverter::ArgumentConverter(
  std::vector<ArgumentSpec> specs, DiagnosticBag * diags, const CustomConverters * custom,
  std::shared_ptr<const Languages> languages)
: specs_(std::move(specs)), diags_(diags), custom_(custom), languages_(std::move(languages))
{
  converters_.resize(specs_.size());
}

// ============================================================================
// Entry Points
// ============================================================================

bool ArgumentConverter::validate()
{
  bool valid = true;
  for (size_t i = 0; i < specs_.size(); ++i) {
    // Untyped arguments are only converted based on their default.
    if (specs_[i].type.name.empty() && specs_[i].type.type.is_unknown()) {
      continue;
    }
    try {
      converter(i).validate();
    } catch (const UnrecognizedTypeError & e) {
      valid = false;
      report_error(
        specs_[i].name, e.what(), diag_code::k_unrecognized_type,
        "declare a supported type or register a custom converter for it");
    }
  }
  return valid;
}

std::vector<NamedValue> ArgumentConverter::convert(const std::vector<NamedValue> & values)
{
  std::vector<NamedValue> result;
  result.reserve(values.size());
  for (const auto & item : values) {
    result.push_back({item.name, convert(item.name, item.value)});
  }
  return result;
}

Value ArgumentConverter::convert(std::string_view name, const Value & value)
{
  const ArgumentSpec * spec = find_spec(name);
  if (spec == nullptr) {
    return value;
  }
  const auto & default_value = spec->default_value;
  if (default_value && *default_value == value &&
      runtime_type(*default_value) == runtime_type(value)) {
    return value;
  }

  const Converter & conv = converter(static_cast<size_t>(spec - specs_.data()));
  std::optional<std::string> error;
  if (!isa<UnknownConverter>(&conv)) {
    try {
      return conv.convert(value, spec->name);
    } catch (const ConversionError & e) {
      error = e.what();
    }
  }

  if (auto converted = convert_by_default(*spec, value)) {
    return std::move(*converted);
  }
  if (error) {
    report_error(spec->name, *error, diag_code::k_conversion_failed);
  }
  return value;
}

// ============================================================================
// Internal Helpers
// ============================================================================

const ArgumentSpec * ArgumentConverter::find_spec(std::string_view name) const
{
  const auto it = std::find_if(
    specs_.begin(), specs_.end(), [name](const ArgumentSpec & spec) { return spec.name == name; });
  return it == specs_.end() ? nullptr : &*it;
}

const Converter & ArgumentConverter::converter(size_t index)
{
  if (!converters_[index]) {
    converters_[index] = Converter::converter_for(specs_[index].type, custom_, languages_);
  }
  return *converters_[index];
}

std::optional<Value> ArgumentConverter::convert_by_default(
  const ArgumentSpec & spec, const Value & value) const
{
  if (!spec.default_value || spec.default_value->is_none() || spec.default_value->is_string()) {
    return std::nullopt;
  }
  const DeclaredType type = runtime_type(*spec.default_value);
  const auto conv = Converter::converter_for(TypeInfo(type.name(), type), custom_, languages_);
  if (isa<UnknownConverter>(conv.get())) {
    return std::nullopt;
  }
  try {
    return conv->convert(value, spec.name, "Argument default value");
  } catch (const ConversionError &) {
    // The declared type's error is the one reported.
    return std::nullopt;
  }
}

void ArgumentConverter::report_error(
  const std::string & subject, const std::string & message, const char * code,
  std::optional<std::string> help)
{
  ++error_count_;
  if (!diags_) {
    return;
  }
  auto builder = diags_->report_error(subject, message);
  builder.with_code(code);
  if (help) {
    builder.with_help(std::move(*help));
  }
}

}  // namespace argconv
