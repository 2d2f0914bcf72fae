// argconv/convert/custom_converter.hpp - Application-supplied converters
//
// Applications register a conversion function per type:
//
//   CustomConverters custom;
//   custom.add({DeclaredType::of_class(point), "Point", "Point as 'x,y'.",
//               {TypeKind::String}, &parse_point});
//   auto conv = Converter::converter_for(TypeInfo::of_class(point), &custom);
//
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "argconv/convert/converter.hpp"

namespace argconv
{

/**
 * A registered conversion function.
 */
struct ConverterInfo
{
  /// Type the function converts to
  DeclaredType type;

  /// Name used in error messages
  std::string name;

  /// Documentation of the accepted syntax
  std::string doc;

  /// Accepted input types; empty accepts anything
  std::vector<DeclaredType> value_types;

  /// The conversion. Throwing ConversionError reports its message; any
  /// other exception is reported as a plain conversion failure.
  std::function<Value(const Value &)> convert;
};

class CustomConverters
{
public:
  /// Register a converter; one already registered for the same type is replaced.
  void add(ConverterInfo info);

  /// Converter registered for exactly `type`, or nullptr.
  [[nodiscard]] const ConverterInfo * get_converter_info(const DeclaredType & type) const;

  [[nodiscard]] bool empty() const noexcept { return converters_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return converters_.size(); }

  [[nodiscard]] auto begin() const noexcept { return converters_.begin(); }
  [[nodiscard]] auto end() const noexcept { return converters_.end(); }

private:
  std::vector<ConverterInfo> converters_;
};

/// Adapts a ConverterInfo to the Converter interface.
class CustomConverter : public ConverterBase<CustomConverter, Converter, ConverterKind::Custom>
{
  friend class ConverterBase<CustomConverter, Converter, ConverterKind::Custom>;

public:
  [[nodiscard]] std::optional<std::string> doc() const override;

protected:
  CustomConverter(
    TypeInfo info, const ConverterInfo & converter_info, std::shared_ptr<const Languages> languages);

  [[nodiscard]] std::string compute_type_name() const override;
  [[nodiscard]] bool handles_value(const Value & value) const override;
  [[nodiscard]] Value do_convert(const Value & value) const override;

private:
  ConverterInfo converter_info_;
};

}  // namespace argconv
