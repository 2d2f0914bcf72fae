// argconv/convert/argument_converter.hpp - Batch conversion of named arguments
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "argconv/basic/diagnostic.hpp"
#include "argconv/convert/converter.hpp"

namespace argconv
{

/**
 * Declared type and default of one argument.
 */
struct ArgumentSpec
{
  std::string name;

  /// Declared type; TypeInfo() when the argument is untyped
  TypeInfo type;

  std::optional<Value> default_value;
};

struct NamedValue
{
  std::string name;
  Value value;
};

/**
 * Validates and converts arguments against their specs.
 *
 * Failures are collected as diagnostics instead of thrown so that every
 * argument is handled:
 * - E0100 (unrecognized type): from validate()
 * - E0200 (conversion failed): from convert(); the original value is kept
 */
class ArgumentConverter
{
public:
  /**
   * Construct an ArgumentConverter.
   *
   * @param specs Argument specs; names are unique
   * @param diags DiagnosticBag for error reporting (may be nullptr)
   * @param custom Custom converters (may be nullptr)
   * @param languages Boolean vocabulary shared by all converters (may be nullptr)
   */
  explicit ArgumentConverter(
    std::vector<ArgumentSpec> specs, DiagnosticBag * diags = nullptr,
    const CustomConverters * custom = nullptr,
    std::shared_ptr<const Languages> languages = nullptr);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Check every declared type.
   *
   * @return true if all types are recognized
   */
  bool validate();

  /**
   * Convert named values in order.
   *
   * Values without a spec are passed through.
   */
  [[nodiscard]] std::vector<NamedValue> convert(const std::vector<NamedValue> & values);

  /// Convert a single value; failures are reported and the value is kept.
  [[nodiscard]] Value convert(std::string_view name, const Value & value);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /// Get the collected diagnostics (may be nullptr)
  [[nodiscard]] DiagnosticBag * diagnostics() noexcept { return diags_; }

private:
  [[nodiscard]] const ArgumentSpec * find_spec(std::string_view name) const;

  /// Converter of a spec's declared type, built on first use.
  [[nodiscard]] const Converter & converter(size_t index);

  /// Retry with the converter of the default value's type.
  [[nodiscard]] std::optional<Value> convert_by_default(
    const ArgumentSpec & spec, const Value & value) const;

  void report_error(
    const std::string & subject, const std::string & message, const char * code,
    std::optional<std::string> help = std::nullopt);

  std::vector<ArgumentSpec> specs_;
  std::vector<std::unique_ptr<Converter>> converters_;
  DiagnosticBag * diags_;
  const CustomConverters * custom_;
  std::shared_ptr<const Languages> languages_;
  size_t error_count_ = 0;
};

}  // namespace argconv
