// argconv/convert/resolution_converters.cpp - Enum, union and literal converters
//
#include "argconv/convert/resolution_converters.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/core.h>

#include "argconv/basic/text.hpp"

namespace argconv
{

namespace
{

/// Parse text the way int() does for base 10.
std::optional<int64_t> parse_decimal_int(std::string_view text)
{
  std::string digits = remove_chars(strip(text), "_");
  if (!digits.empty() && digits.front() == '+') {
    digits.erase(0, 1);
  }
  if (digits.empty() || digits.front() == '_' || digits.front() == '+') {
    return std::nullopt;
  }
  int64_t result = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return result;
}

}  // namespace

// ============================================================================
// EnumConverter
// ============================================================================

EnumConverter::EnumConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages)),
  enum_(type_info().type.enum_type)
{
  primitive_type_ = TypeKind::Enum;
  if (enum_->int_backed) {
    value_types_ = {TypeKind::String, TypeKind::Integer};
  }
}

Value EnumConverter::member(size_t index) const { return Value::make_enum_member(enum_, index); }

Value EnumConverter::do_convert(const Value & value) const
{
  if (!value.is_string()) {
    return find_by_int_value(value);
  }
  if (const auto index = enum_->find(value.as_string())) {
    return member(*index);
  }
  return find_by_normalized_name_or_int_value(value.as_string());
}

Value EnumConverter::find_by_normalized_name_or_int_value(std::string_view text) const
{
  std::vector<std::string> names;
  for (const auto & m : enum_->members) {
    names.push_back(m.name);
  }
  std::sort(names.begin(), names.end());

  std::vector<std::string> matches;
  for (const auto & name : names) {
    if (eq_normalized(name, text, "_-")) {
      matches.push_back(name);
    }
  }
  if (matches.size() == 1) {
    return member(*enum_->find(matches.front()));
  }
  if (matches.size() > 1) {
    throw ConversionError(fmt::format(
      "{} has multiple members matching '{}'. Available: {}", type_name(), text,
      seq2str(matches)));
  }

  if (enum_->int_backed) {
    try {
      return find_by_int_value(Value::make_string(std::string(text)));
    } catch (const ConversionError &) {
      // Neither a name nor a value; list both.
      for (auto & name : names) {
        name = fmt::format("{} ({})", name, enum_->members[*enum_->find(name)].value.str());
      }
    }
  }
  throw ConversionError(fmt::format(
    "{} does not have member '{}'. Available: {}", type_name(), text, seq2str(names)));
}

Value EnumConverter::find_by_int_value(const Value & value) const
{
  std::optional<int64_t> number;
  if (value.is_string()) {
    number = parse_decimal_int(value.as_string());
  } else if (value.is_bool()) {
    number = value.as_bool() ? 1 : 0;
  } else if (value.is_integer()) {
    number = value.as_integer();
  }
  if (!number) {
    throw ConversionError();
  }

  std::vector<int64_t> values;
  for (size_t i = 0; i < enum_->members.size(); ++i) {
    const Value & candidate = enum_->members[i].value;
    if (!candidate.is_integer()) continue;
    if (candidate.as_integer() == *number) {
      return member(i);
    }
    values.push_back(candidate.as_integer());
  }
  std::sort(values.begin(), values.end());
  std::vector<std::string> available;
  for (const auto v : values) {
    available.push_back(std::to_string(v));
  }
  throw ConversionError(fmt::format(
    "{} does not have value '{}'. Available: {}", type_name(), *number, seq2str(available)));
}

// ============================================================================
// UnionConverter
// ============================================================================

UnionConverter::UnionConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Union;
  value_types_ = {TypeKind::Any};
}

std::string UnionConverter::compute_type_name() const
{
  std::vector<std::string> names;
  for (const auto & conv : nested_) {
    names.push_back(conv->type_name());
  }
  return seq2str(names, "", ", ", " or ");
}

bool UnionConverter::no_conversion_needed(const Value & value) const
{
  return std::any_of(nested_.begin(), nested_.end(), [&value](const auto & conv) {
    return conv->no_conversion_needed(value);
  });
}

Value UnionConverter::do_convert(const Value & value) const
{
  bool unrecognized = false;
  for (const auto & conv : nested_) {
    if (isa<UnknownConverter>(conv.get())) {
      unrecognized = true;
      continue;
    }
    try {
      return conv->convert(value);
    } catch (const ConversionError &) {
      // Fall through to the next member.
    }
  }
  if (unrecognized) {
    return value;
  }
  throw ConversionError();
}

// ============================================================================
// LiteralConverter
// ============================================================================

LiteralConverter::LiteralConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Literal;
  static_name_ = "Literal";
  value_types_ = {TypeKind::Any};
}

void LiteralConverter::build_nested()
{
  for (const auto & info : type_info().nested) {
    nested_.push_back(make_nested(TypeInfo(info.name, runtime_type(*info.type.constant))));
  }
}

const Value & LiteralConverter::constant(size_t index) const
{
  return *type_info().nested[index].type.constant;
}

std::string LiteralConverter::compute_type_name() const
{
  std::vector<std::string> names;
  for (const auto & info : type_info().nested) {
    names.push_back(info.name);
  }
  return seq2str(names, "", ", ", " or ");
}

bool LiteralConverter::no_conversion_needed(const Value & value) const
{
  for (size_t i = 0; i < nested_.size(); ++i) {
    const Value & expected = constant(i);
    if (value == expected && runtime_type(value) == runtime_type(expected)) {
      return true;
    }
  }
  return false;
}

Value LiteralConverter::do_convert(const Value & value) const
{
  std::vector<size_t> matches;
  for (size_t i = 0; i < nested_.size(); ++i) {
    const Value & expected = constant(i);
    if (value == expected && runtime_type(value) == runtime_type(expected)) {
      return expected;
    }
    try {
      const Value converted = nested_[i]->convert(value);
      const bool match =
        expected.is_string()
          ? converted.is_string() && eq_normalized(converted.as_string(), expected.as_string(), "_-")
          : converted == expected;
      if (match) {
        matches.push_back(i);
      }
    } catch (const ConversionError &) {
      // Not convertible to this constant's type.
    }
  }
  if (matches.size() == 1) {
    return constant(matches.front());
  }
  if (!matches.empty()) {
    throw ConversionError("No unique match found.");
  }
  throw ConversionError();
}

}  // namespace argconv
