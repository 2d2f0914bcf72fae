// argconv/convert/resolution_converters.hpp - Enum, union and literal converters
//
// These converters pick one result among several candidates: an enum
// member, the first union member that converts, or the single literal
// constant the value matches.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "argconv/convert/converter.hpp"

namespace argconv
{

/**
 * Enumeration members by name or, for integer-backed enums, by value.
 *
 * Names are matched exactly first, then case-, space-, underscore- and
 * hyphen-insensitively. An ambiguous normalized match is an error.
 */
class EnumConverter : public ConverterBase<EnumConverter, Converter, ConverterKind::Enum>
{
  ARGCONV_CONVERTER_BOILERPLATE(EnumConverter, Converter, Enum)

public:
  [[nodiscard]] const EnumType & enum_type() const noexcept { return *enum_; }

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;

private:
  [[nodiscard]] Value find_by_normalized_name_or_int_value(std::string_view text) const;
  [[nodiscard]] Value find_by_int_value(const Value & value) const;
  [[nodiscard]] Value member(size_t index) const;

  std::shared_ptr<const EnumType> enum_;
};

/**
 * `A | B | ...`: members are tried in declaration order.
 *
 * A value that no member converts is returned unchanged if any member's
 * type is unrecognized.
 */
class UnionConverter : public ConverterBase<UnionConverter, Converter, ConverterKind::Union>
{
  ARGCONV_CONVERTER_BOILERPLATE(UnionConverter, Converter, Union)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  [[nodiscard]] std::string compute_type_name() const override;
  [[nodiscard]] bool handles_value(const Value & /*value*/) const override { return true; }
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

/**
 * `Literal[c1, c2, ...]`: the value must match exactly one constant.
 *
 * Each constant gets a converter for its own runtime type. String
 * constants match case-, space-, underscore- and hyphen-insensitively.
 */
class LiteralConverter : public ConverterBase<LiteralConverter, Converter, ConverterKind::Literal>
{
  ARGCONV_CONVERTER_BOILERPLATE(LiteralConverter, Converter, Literal)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  void build_nested() override;
  [[nodiscard]] std::string compute_type_name() const override;
  [[nodiscard]] bool handles_value(const Value & /*value*/) const override { return true; }
  [[nodiscard]] Value do_convert(const Value & value) const override;

private:
  [[nodiscard]] const Value & constant(size_t index) const;
};

}  // namespace argconv
