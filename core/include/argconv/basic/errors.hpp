// argconv/basic/errors.hpp - Exception types raised by converters
#pragma once

#include <stdexcept>
#include <string>

namespace argconv
{

/**
 * A value could not be converted.
 *
 * Thrown at data time. The message may be empty when the failing step has
 * nothing useful to add; Converter::convert() then reports the generic
 * "cannot be converted" message.
 */
class ConversionError : public std::runtime_error
{
public:
  ConversionError() : std::runtime_error("") {}
  explicit ConversionError(const std::string & message) : std::runtime_error(message) {}

  [[nodiscard]] bool has_detail() const noexcept { return what()[0] != '\0'; }
};

/**
 * A declared type has no converter.
 *
 * Thrown by Converter::validate() at setup time, before any data is converted.
 */
class UnrecognizedTypeError : public std::runtime_error
{
public:
  explicit UnrecognizedTypeError(const std::string & message) : std::runtime_error(message) {}
};

}  // namespace argconv
