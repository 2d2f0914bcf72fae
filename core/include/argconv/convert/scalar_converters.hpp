// argconv/convert/scalar_converters.hpp - Converters for single values
#pragma once

#include "argconv/convert/converter.hpp"

namespace argconv
{

/// Accepts anything as is.
class AnyConverter : public ConverterBase<AnyConverter, Converter, ConverterKind::Any>
{
  ARGCONV_CONVERTER_BOILERPLATE(AnyConverter, Converter, Any)

public:
  [[nodiscard]] bool no_conversion_needed(const Value & value) const override;

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override { return value; }
};

/// Any value becomes its str() form.
class StringConverter : public ConverterBase<StringConverter, Converter, ConverterKind::String>
{
  ARGCONV_CONVERTER_BOILERPLATE(StringConverter, Converter, String)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

/**
 * Language-aware boolean parsing.
 *
 * Text is title-cased and looked up in the true and false vocabularies;
 * "None" gives None. Anything unrecognized, including non-string input,
 * is returned unchanged.
 */
class BooleanConverter : public ConverterBase<BooleanConverter, Converter, ConverterKind::Boolean>
{
  ARGCONV_CONVERTER_BOILERPLATE(BooleanConverter, Converter, Boolean)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override { return value; }
};

/**
 * Integer parsing.
 *
 * Spaces and underscores are ignored; 0x, 0o and 0b prefixes select the
 * base (case-insensitive, after an optional sign). Text that is not an
 * integer literal is accepted when it is a whole decimal number ("1e3",
 * "10.0"). Floats must be whole.
 */
class IntegerConverter : public ConverterBase<IntegerConverter, Converter, ConverterKind::Integer>
{
  ARGCONV_CONVERTER_BOILERPLATE(IntegerConverter, Converter, Integer)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

class FloatConverter : public ConverterBase<FloatConverter, Converter, ConverterKind::Float>
{
  ARGCONV_CONVERTER_BOILERPLATE(FloatConverter, Converter, Float)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

class DecimalConverter : public ConverterBase<DecimalConverter, Converter, ConverterKind::Decimal>
{
  ARGCONV_CONVERTER_BOILERPLATE(DecimalConverter, Converter, Decimal)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

/// Text is encoded as Latin-1; every character must be at most U+00FF.
class BytesConverter : public ConverterBase<BytesConverter, Converter, ConverterKind::Bytes>
{
  ARGCONV_CONVERTER_BOILERPLATE(BytesConverter, Converter, Bytes)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

class ByteArrayConverter
: public ConverterBase<ByteArrayConverter, Converter, ConverterKind::ByteArray>
{
  ARGCONV_CONVERTER_BOILERPLATE(ByteArrayConverter, Converter, ByteArray)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
  [[nodiscard]] Value non_string_convert(const Value & value) const override;
};

class DateTimeConverter
: public ConverterBase<DateTimeConverter, Converter, ConverterKind::DateTime>
{
  ARGCONV_CONVERTER_BOILERPLATE(DateTimeConverter, Converter, DateTime)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

/// Like DateTimeConverter, but the time of day must be midnight.
class DateConverter : public ConverterBase<DateConverter, Converter, ConverterKind::Date>
{
  ARGCONV_CONVERTER_BOILERPLATE(DateConverter, Converter, Date)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

class TimeDeltaConverter
: public ConverterBase<TimeDeltaConverter, Converter, ConverterKind::TimeDelta>
{
  ARGCONV_CONVERTER_BOILERPLATE(TimeDeltaConverter, Converter, TimeDelta)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

/// Filesystem paths in POSIX form; repeated separators and "." parts are dropped.
class PathConverter : public ConverterBase<PathConverter, Converter, ConverterKind::Path>
{
  ARGCONV_CONVERTER_BOILERPLATE(PathConverter, Converter, Path)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

/// Only "None" (any case) converts.
class NoneConverter : public ConverterBase<NoneConverter, Converter, ConverterKind::None>
{
  ARGCONV_CONVERTER_BOILERPLATE(NoneConverter, Converter, None)

protected:
  [[nodiscard]] Value do_convert(const Value & value) const override;
};

}  // namespace argconv
