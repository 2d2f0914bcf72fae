// argconv/convert/container_converters.cpp - Converters for collections
//
#include "argconv/convert/container_converters.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "argconv/basic/text.hpp"

namespace argconv
{

namespace
{

/// Items of an iterable value; non-iterable input fails the conversion.
Value::Items iterate_or_fail(const Value & value)
{
  auto items = iterate(value);
  if (!items) {
    throw ConversionError();
  }
  return std::move(*items);
}

std::vector<std::string> sorted_strings(const Value::Items & values)
{
  std::vector<std::string> result;
  result.reserve(values.size());
  for (const auto & value : values) {
    result.push_back(value.str());
  }
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace

// ============================================================================
// ListConverter
// ============================================================================

ListConverter::ListConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::List;
  static_name_ = "list";
  value_types_ = {TypeKind::String, TypeKind::Sequence};
}

bool ListConverter::no_conversion_needed(const Value & value) const
{
  if (value.is_string() || !Converter::no_conversion_needed(value)) {
    return false;
  }
  if (nested_.empty()) {
    return true;
  }
  const auto items = iterate(value);
  if (!items) {
    return false;
  }
  return std::all_of(items->begin(), items->end(), [this](const Value & item) {
    return nested_[0]->no_conversion_needed(item);
  });
}

Value ListConverter::do_convert(const Value & value) const
{
  return convert_items(literal_eval(value.as_string(), TypeKind::List));
}

Value ListConverter::non_string_convert(const Value & value) const
{
  return convert_items(Value::make_list(iterate_or_fail(value)));
}

Value ListConverter::convert_items(const Value & list) const
{
  if (nested_.empty()) {
    return list;
  }
  const Converter & conv = *nested_[0];
  Value::Items result;
  result.reserve(list.items().size());
  for (size_t i = 0; i < list.items().size(); ++i) {
    result.push_back(conv.convert(list.items()[i], std::to_string(i), "Item"));
  }
  return Value::make_list(std::move(result));
}

// ============================================================================
// TupleConverter
// ============================================================================

TupleConverter::TupleConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Tuple;
  static_name_ = "tuple";
  value_types_ = {TypeKind::String, TypeKind::Sequence};
  const auto & nested = type_info().nested;
  homogeneous_ = !nested.empty() && nested.back().type.kind == TypeKind::Ellipsis;
}

bool TupleConverter::no_conversion_needed(const Value & value) const
{
  if (value.is_string() || !Converter::no_conversion_needed(value)) {
    return false;
  }
  if (nested_.empty()) {
    return true;
  }
  const auto iterated = iterate(value);
  if (!iterated) {
    return false;
  }
  const auto & items = *iterated;
  if (homogeneous_) {
    return std::all_of(items.begin(), items.end(), [this](const Value & item) {
      return nested_[0]->no_conversion_needed(item);
    });
  }
  if (items.size() != nested_.size()) {
    return false;
  }
  for (size_t i = 0; i < items.size(); ++i) {
    if (!nested_[i]->no_conversion_needed(items[i])) {
      return false;
    }
  }
  return true;
}

void TupleConverter::validate() const
{
  if (!homogeneous_) {
    Converter::validate();
    return;
  }
  // The trailing ellipsis has no converter of its own.
  for (size_t i = 0; i + 1 < nested_.size(); ++i) {
    nested_[i]->validate();
  }
}

Value TupleConverter::do_convert(const Value & value) const
{
  return convert_items(literal_eval(value.as_string(), TypeKind::Tuple));
}

Value TupleConverter::non_string_convert(const Value & value) const
{
  return convert_items(Value::make_tuple(iterate_or_fail(value)));
}

Value TupleConverter::convert_items(const Value & tuple) const
{
  if (nested_.empty()) {
    return tuple;
  }
  const auto & items = tuple.items();
  Value::Items result;
  result.reserve(items.size());
  if (homogeneous_) {
    for (size_t i = 0; i < items.size(); ++i) {
      result.push_back(nested_[0]->convert(items[i], std::to_string(i), "Item"));
    }
    return Value::make_tuple(std::move(result));
  }
  if (items.size() != nested_.size()) {
    throw ConversionError(fmt::format(
      "Expected {} item{}, got {}.", nested_.size(), plural_or_not(nested_.size()), items.size()));
  }
  for (size_t i = 0; i < items.size(); ++i) {
    result.push_back(nested_[i]->convert(items[i], std::to_string(i), "Item"));
  }
  return Value::make_tuple(std::move(result));
}

// ============================================================================
// TypedDictConverter
// ============================================================================

TypedDictConverter::TypedDictConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Dict;
  value_types_ = {TypeKind::String, TypeKind::Mapping};
}

void TypedDictConverter::build_nested()
{
  for (const auto & field : type_info().annotations) {
    field_names_.push_back(field.name);
    nested_.push_back(make_nested(field.type));
  }
}

const Converter * TypedDictConverter::field_converter(const Value & key) const
{
  if (!key.is_string()) {
    return nullptr;
  }
  const auto it = std::find(field_names_.begin(), field_names_.end(), key.as_string());
  if (it == field_names_.end()) {
    return nullptr;
  }
  return nested_[static_cast<size_t>(it - field_names_.begin())].get();
}

bool TypedDictConverter::no_conversion_needed(const Value & value) const
{
  if (!value.is_dict()) {
    return false;
  }
  for (const auto & [key, item] : value.dict_items()) {
    const Converter * conv = field_converter(key);
    if (conv == nullptr || !conv->no_conversion_needed(item)) {
      return false;
    }
  }
  for (const auto & name : required()) {
    if (value.find(Value::make_string(name)) == nullptr) {
      return false;
    }
  }
  return true;
}

Value TypedDictConverter::do_convert(const Value & value) const
{
  return convert_items(literal_eval(value.as_string(), TypeKind::Dict));
}

Value TypedDictConverter::non_string_convert(const Value & value) const
{
  if (!value.is_dict()) {
    throw ConversionError();
  }
  return convert_items(value);
}

Value TypedDictConverter::convert_items(const Value & dict) const
{
  Value::DictItems result;
  Value::Items not_allowed;
  for (const auto & [key, item] : dict.dict_items()) {
    const Converter * conv = field_converter(key);
    if (conv == nullptr) {
      not_allowed.push_back(key);
      result.emplace_back(key, item);
    } else if (isa<UnknownConverter>(conv)) {
      result.emplace_back(key, item);
    } else {
      result.emplace_back(key, conv->convert(item, key.str(), "Item"));
    }
  }

  if (!not_allowed.empty()) {
    std::string message = fmt::format(
      "Item{} {} not allowed.", plural_or_not(not_allowed.size()),
      seq2str(sorted_strings(not_allowed)));
    std::vector<std::string> available;
    for (const auto & name : field_names_) {
      if (dict.find(Value::make_string(name)) == nullptr) {
        available.push_back(name);
      }
    }
    std::sort(available.begin(), available.end());
    if (!available.empty()) {
      message += fmt::format(
        " Available item{}: {}", plural_or_not(available.size()), seq2str(available));
    }
    throw ConversionError(message);
  }

  std::vector<std::string> missing;
  for (const auto & name : required()) {
    if (dict.find(Value::make_string(name)) == nullptr) {
      missing.push_back(name);
    }
  }
  if (!missing.empty()) {
    throw ConversionError(fmt::format(
      "Required item{} {} missing.", plural_or_not(missing.size()), seq2str(missing)));
  }
  return Value::make_dict(std::move(result));
}

// ============================================================================
// DictionaryConverter
// ============================================================================

DictionaryConverter::DictionaryConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Dict;
  static_name_ = "dictionary";
  value_types_ = {TypeKind::String, TypeKind::Mapping};
}

bool DictionaryConverter::no_conversion_needed(const Value & value) const
{
  if (value.is_string() || !Converter::no_conversion_needed(value)) {
    return false;
  }
  if (nested_.size() != 2) {
    return true;
  }
  if (!value.is_dict()) {
    return false;
  }
  for (const auto & [key, item] : value.dict_items()) {
    if (!nested_[0]->no_conversion_needed(key) || !nested_[1]->no_conversion_needed(item)) {
      return false;
    }
  }
  return true;
}

Value DictionaryConverter::do_convert(const Value & value) const
{
  return convert_items(literal_eval(value.as_string(), TypeKind::Dict));
}

Value DictionaryConverter::non_string_convert(const Value & value) const
{
  if (!value.is_dict()) {
    throw ConversionError();
  }
  return convert_items(value);
}

Value DictionaryConverter::convert_items(const Value & dict) const
{
  if (nested_.size() != 2) {
    return dict;
  }
  const Converter & key_converter = *nested_[0];
  const Converter & value_converter = *nested_[1];
  Value::DictItems result;
  result.reserve(dict.dict_items().size());
  for (const auto & [key, item] : dict.dict_items()) {
    result.emplace_back(
      key_converter.convert(key, std::nullopt, "Key"),
      value_converter.convert(item, key.str(), "Item"));
  }
  return Value::make_dict(std::move(result));
}

// ============================================================================
// Sets
// ============================================================================

bool SetLikeConverter::no_conversion_needed(const Value & value) const
{
  if (value.is_string() || !Converter::no_conversion_needed(value)) {
    return false;
  }
  if (nested_.empty()) {
    return true;
  }
  if (value.kind() != ValueKind::Set && value.kind() != ValueKind::FrozenSet) {
    return false;
  }
  return std::all_of(value.items().begin(), value.items().end(), [this](const Value & item) {
    return nested_[0]->no_conversion_needed(item);
  });
}

Value::Items SetLikeConverter::collect(const Value & value) const
{
  Value::Items items = iterate_or_fail(value);
  for (const auto & item : items) {
    if (!item.is_hashable()) {
      throw ConversionError(
        fmt::format("unhashable type: '{}'", to_string(runtime_type(item).kind)));
    }
  }
  return items;
}

Value::Items SetLikeConverter::convert_items(const Value::Items & items) const
{
  if (nested_.empty()) {
    return items;
  }
  Value::Items result;
  result.reserve(items.size());
  for (const auto & item : items) {
    result.push_back(nested_[0]->convert(item, std::nullopt, "Item"));
  }
  return result;
}

SetConverter::SetConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Set;
  static_name_ = "set";
  value_types_ = {TypeKind::String, TypeKind::Container};
}

Value SetConverter::do_convert(const Value & value) const
{
  const Value set = literal_eval(value.as_string(), TypeKind::Set);
  return Value::make_set(convert_items(set.items()));
}

Value SetConverter::non_string_convert(const Value & value) const
{
  return Value::make_set(convert_items(collect(value)));
}

FrozenSetConverter::FrozenSetConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::FrozenSet;
  static_name_ = "frozenset";
  value_types_ = {TypeKind::String, TypeKind::Container};
}

Value FrozenSetConverter::do_convert(const Value & value) const
{
  if (value.as_string() == "frozenset()") {
    return Value::make_frozenset({});
  }
  const Value set = literal_eval(value.as_string(), TypeKind::Set);
  return Value::make_frozenset(convert_items(set.items()));
}

Value FrozenSetConverter::non_string_convert(const Value & value) const
{
  return Value::make_frozenset(convert_items(collect(value)));
}

}  // namespace argconv
