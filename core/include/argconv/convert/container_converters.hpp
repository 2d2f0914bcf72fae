// argconv/convert/container_converters.hpp - Converters for collections
//
// String input is evaluated as a literal expression ("[1, 2]", "{'a': 1}")
// and must produce the matching collection kind. Items are then converted
// with the nested converters, if the declared type has any.
//
#pragma once

#include <set>
#include <string>
#include <vector>

#include "argconv/convert/converter.hpp"

namespace argconv
{

/// `list` and `list[T]`; any sequence is accepted as input.
class ListConverter : public ConverterBase<ListConverter, Converter, ConverterKind::List>
{
  ARGCONV_CONVERTER_BOILERPLATE(ListConverter, Converter, List)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;

private:
  [[nodiscard]] Value convert_items(const Value & list) const;
};

/**
 * `tuple`, `tuple[A, B]` and `tuple[T, ...]`.
 *
 * A fixed-arity tuple requires exactly as many items as it has nested
 * types. A homogeneous tuple (last nested type is the ellipsis) converts
 * every item with the first nested converter.
 */
class TupleConverter : public ConverterBase<TupleConverter, Converter, ConverterKind::Tuple>
{
  ARGCONV_CONVERTER_BOILERPLATE(TupleConverter, Converter, Tuple)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;
  void validate() const override;

  [[nodiscard]] bool homogeneous() const noexcept { return homogeneous_; }

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;

private:
  [[nodiscard]] Value convert_items(const Value & tuple) const;

  bool homogeneous_ = false;
};

/**
 * A record with declared fields.
 *
 * Keys outside the declared fields are rejected and every required field
 * must be present. Declared fields are converted with their own converter.
 */
class TypedDictConverter
: public ConverterBase<TypedDictConverter, Converter, ConverterKind::TypedDict>
{
  ARGCONV_CONVERTER_BOILERPLATE(TypedDictConverter, Converter, TypedDict)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

  /// Field names, parallel to nested().
  [[nodiscard]] const std::vector<std::string> & field_names() const noexcept
  {
    return field_names_;
  }
  [[nodiscard]] const std::set<std::string> & required() const noexcept
  {
    return type_info().required;
  }

protected:
  void build_nested() override;
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;

private:
  /// Converter of the field named by `key`; null if `key` is not a declared field.
  [[nodiscard]] const Converter * field_converter(const Value & key) const;
  [[nodiscard]] Value convert_items(const Value & dict) const;

  std::vector<std::string> field_names_;
};

/// `dict` and `dict[K, V]`; keys are converted with kind "Key", values with kind "Item".
class DictionaryConverter
: public ConverterBase<DictionaryConverter, Converter, ConverterKind::Dictionary>
{
  ARGCONV_CONVERTER_BOILERPLATE(DictionaryConverter, Converter, Dictionary)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;

private:
  [[nodiscard]] Value convert_items(const Value & dict) const;
};

/// Shared behavior of the set and frozenset converters.
class SetLikeConverter : public Converter
{
public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  using Converter::Converter;

  /// Items of any container, as an unconverted set.
  [[nodiscard]] Value::Items collect(const Value & value) const;
  [[nodiscard]] Value::Items convert_items(const Value::Items & items) const;
};

/// `set` and `set[T]`; any container is accepted as input.
class SetConverter : public ConverterBase<SetConverter, SetLikeConverter, ConverterKind::Set>
{
  ARGCONV_CONVERTER_BOILERPLATE(SetConverter, SetLikeConverter, Set)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

/// `frozenset` and `frozenset[T]`; "frozenset()" is accepted for the empty set.
class FrozenSetConverter
: public ConverterBase<FrozenSetConverter, SetLikeConverter, ConverterKind::FrozenSet>
{
  ARGCONV_CONVERTER_BOILERPLATE(FrozenSetConverter, SetLikeConverter, FrozenSet)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

}  // namespace argconv
