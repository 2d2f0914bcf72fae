// argconv/convert/converter.cpp - Converter base class and registry
//
#include "argconv/convert/converter.hpp"

#include <fmt/core.h>

#include "argconv/basic/text.hpp"
#include "argconv/convert/container_converters.hpp"
#include "argconv/convert/custom_converter.hpp"
#include "argconv/convert/resolution_converters.hpp"
#include "argconv/convert/scalar_converters.hpp"
#include "argconv/syntax/literal_eval.hpp"
#include "argconv/vocabulary/languages.hpp"

namespace argconv
{

std::string_view to_string(ConverterKind kind) noexcept
{
  switch (kind) {
    case ConverterKind::Enum:
      return "enum";
    case ConverterKind::Any:
      return "any";
    case ConverterKind::String:
      return "string";
    case ConverterKind::Boolean:
      return "boolean";
    case ConverterKind::Integer:
      return "integer";
    case ConverterKind::Float:
      return "float";
    case ConverterKind::Decimal:
      return "decimal";
    case ConverterKind::Bytes:
      return "bytes";
    case ConverterKind::ByteArray:
      return "bytearray";
    case ConverterKind::DateTime:
      return "datetime";
    case ConverterKind::Date:
      return "date";
    case ConverterKind::TimeDelta:
      return "timedelta";
    case ConverterKind::Path:
      return "path";
    case ConverterKind::None:
      return "none";
    case ConverterKind::List:
      return "list";
    case ConverterKind::Tuple:
      return "tuple";
    case ConverterKind::TypedDict:
      return "typeddict";
    case ConverterKind::Dictionary:
      return "dictionary";
    case ConverterKind::Set:
      return "set";
    case ConverterKind::FrozenSet:
      return "frozenset";
    case ConverterKind::Union:
      return "union";
    case ConverterKind::Literal:
      return "literal";
    case ConverterKind::Custom:
      return "custom";
    case ConverterKind::Unknown:
      return "unknown";
  }
  return "";
}

// ============================================================================
// Registry
// ============================================================================

namespace
{

using Factory = std::unique_ptr<Converter> (*)(
  const TypeInfo &, const CustomConverters *, std::shared_ptr<const Languages>);

struct RegistryEntry
{
  /// Type converted to; exact matches select this entry
  TypeKind type;

  /// Abstract base also handled structurally
  std::optional<TypeKind> abc;

  /// Replaces the subclass test when set
  bool (*handles)(const TypeInfo &);

  Factory create;
};

template <typename T>
std::unique_ptr<Converter> create(
  const TypeInfo & info, const CustomConverters * custom,
  std::shared_ptr<const Languages> languages)
{
  return T::create(info, custom, std::move(languages));
}

bool handles_enum(const TypeInfo & info) { return info.type.enum_type != nullptr; }
bool handles_typed_dict(const TypeInfo & info) { return info.is_typed_dict; }
bool handles_union(const TypeInfo & info) { return info.is_union; }
bool handles_literal(const TypeInfo & info) { return info.type.kind == TypeKind::Literal; }
bool handles_any(const TypeInfo & info) { return info.type.kind == TypeKind::Any; }
bool handles_none(const TypeInfo & info) { return info.type.kind == TypeKind::None; }

// Registration order decides structural matches: an integer-backed enum is
// an enum before it is an integer, a bool before an integer.
const RegistryEntry k_registry[] = {
  {TypeKind::Enum, std::nullopt, &handles_enum, &create<EnumConverter>},
  {TypeKind::Any, std::nullopt, &handles_any, &create<AnyConverter>},
  {TypeKind::String, std::nullopt, nullptr, &create<StringConverter>},
  {TypeKind::Bool, std::nullopt, nullptr, &create<BooleanConverter>},
  {TypeKind::Integer, TypeKind::Integral, nullptr, &create<IntegerConverter>},
  {TypeKind::Float, TypeKind::Real, nullptr, &create<FloatConverter>},
  {TypeKind::Decimal, std::nullopt, nullptr, &create<DecimalConverter>},
  {TypeKind::Bytes, std::nullopt, nullptr, &create<BytesConverter>},
  {TypeKind::ByteArray, std::nullopt, nullptr, &create<ByteArrayConverter>},
  {TypeKind::DateTime, std::nullopt, nullptr, &create<DateTimeConverter>},
  {TypeKind::Date, std::nullopt, nullptr, &create<DateConverter>},
  {TypeKind::TimeDelta, std::nullopt, nullptr, &create<TimeDeltaConverter>},
  {TypeKind::Path, TypeKind::PathLike, nullptr, &create<PathConverter>},
  {TypeKind::None, std::nullopt, &handles_none, &create<NoneConverter>},
  {TypeKind::List, TypeKind::Sequence, nullptr, &create<ListConverter>},
  {TypeKind::Tuple, std::nullopt, nullptr, &create<TupleConverter>},
  {TypeKind::TypedDict, std::nullopt, &handles_typed_dict, &create<TypedDictConverter>},
  {TypeKind::Dict, TypeKind::Mapping, nullptr, &create<DictionaryConverter>},
  {TypeKind::Set, TypeKind::AbstractSet, nullptr, &create<SetConverter>},
  {TypeKind::FrozenSet, std::nullopt, nullptr, &create<FrozenSetConverter>},
  {TypeKind::Union, std::nullopt, &handles_union, &create<UnionConverter>},
  {TypeKind::Literal, std::nullopt, &handles_literal, &create<LiteralConverter>},
};

/// Entries selected by the type itself rather than by its kind alone.
bool needs_definition(TypeKind kind) noexcept
{
  return kind == TypeKind::Enum || kind == TypeKind::TypedDict;
}

bool handles(const RegistryEntry & entry, const TypeInfo & info)
{
  if (entry.handles) {
    return entry.handles(info);
  }
  if (!info.type.is_class()) {
    return false;
  }
  return is_subclass(info.type, entry.type) || (entry.abc && is_subclass(info.type, *entry.abc));
}

}  // namespace

std::unique_ptr<Converter> Converter::converter_for(
  const TypeInfo & info, const CustomConverters * custom,
  std::shared_ptr<const Languages> languages)
{
  if (info.type.is_unknown()) {
    return UnknownConverter::create(info, custom, std::move(languages));
  }

  if (custom) {
    if (const auto * converter_info = custom->get_converter_info(info.type)) {
      return CustomConverter::create(info, *converter_info, std::move(languages));
    }
  }

  if (!info.type.is_user_defined() && !info.is_typed_dict) {
    for (const auto & entry : k_registry) {
      if (entry.type == info.type.kind && !needs_definition(entry.type)) {
        return entry.create(info, custom, std::move(languages));
      }
    }
  }

  for (const auto & entry : k_registry) {
    if (handles(entry, info)) {
      return entry.create(info, custom, std::move(languages));
    }
  }

  return UnknownConverter::create(info, custom, std::move(languages));
}

// ============================================================================
// Converter
// ============================================================================

Converter::Converter(
  ConverterKind k, TypeInfo info, const CustomConverters * custom,
  std::shared_ptr<const Languages> languages)
: kind(k), type_info_(std::move(info)), custom_(custom), languages_(std::move(languages))
{
}

void Converter::initialize()
{
  build_nested();
  type_name_ = compute_type_name();
}

void Converter::build_nested()
{
  nested_.reserve(type_info_.nested.size());
  for (const auto & info : type_info_.nested) {
    nested_.push_back(make_nested(info));
  }
}

std::unique_ptr<Converter> Converter::make_nested(const TypeInfo & info) const
{
  return converter_for(info, custom_, languages_);
}

std::string Converter::compute_type_name() const
{
  if (!static_name_.empty() && type_info_.nested.empty()) {
    return static_name_;
  }
  return type_info_.to_string();
}

const Languages & Converter::languages() const
{
  if (!languages_) {
    languages_ = std::make_shared<const Languages>();
  }
  return *languages_;
}

Value Converter::convert(
  const Value & value, std::optional<std::string_view> name, std::string_view kind) const
{
  if (no_conversion_needed(value)) {
    return value;
  }
  if (!handles_value(value)) {
    handle_error(value, name, kind, nullptr);
  }
  try {
    if (!value.is_string()) {
      return non_string_convert(value);
    }
    return do_convert(value);
  } catch (const ConversionError & error) {
    handle_error(value, name, kind, &error);
  }
}

bool Converter::no_conversion_needed(const Value & value) const
{
  if (type_info_.type.is_class()) {
    return is_instance(value, type_info_.type);
  }
  if (primitive_type_ != type_info_.type && primitive_type_.is_class()) {
    return is_instance(value, primitive_type_);
  }
  return false;
}

void Converter::validate() const
{
  for (const auto & conv : nested_) {
    conv->validate();
  }
}

bool Converter::handles_value(const Value & value) const
{
  for (const auto & type : value_types_) {
    if (type.kind == TypeKind::Any || is_instance(value, type)) {
      return true;
    }
  }
  return false;
}

void Converter::handle_error(
  const Value & value, std::optional<std::string_view> name, std::string_view kind,
  const ConversionError * error) const
{
  const std::string typ = value.is_string() ? "" : fmt::format(" ({})", value.type_name());
  const std::string what = is_lower(kind) ? capitalize(kind) : std::string(kind);
  const std::string ending =
    (error != nullptr && error->has_detail()) ? fmt::format(": {}", error->what()) : ".";
  if (!name) {
    throw ConversionError(fmt::format(
      "{} '{}'{} cannot be converted to {}{}", what, value.str(), typ, type_name_, ending));
  }
  throw ConversionError(fmt::format(
    "{} '{}' got value '{}'{} that cannot be converted to {}{}", what, *name, value.str(), typ,
    type_name_, ending));
}

Value Converter::literal_eval(const std::string & text, TypeKind expected)
{
  if (expected == TypeKind::Set && text == "set()") {
    return Value::make_set({});
  }
  Value value = syntax::literal_eval(text);
  if (runtime_type(value).kind != expected) {
    throw ConversionError(
      fmt::format("Value is {}, not {}.", value.type_name(), to_string(expected)));
  }
  return value;
}

std::string Converter::remove_number_separators(std::string_view text)
{
  return remove_chars(text, " _");
}

// ============================================================================
// UnknownConverter
// ============================================================================

Value UnknownConverter::convert(
  const Value & value, std::optional<std::string_view> /*name*/, std::string_view /*kind*/) const
{
  return value;
}

void UnknownConverter::validate() const
{
  throw UnrecognizedTypeError(fmt::format("Unrecognized type '{}'.", type_name()));
}

}  // namespace argconv
