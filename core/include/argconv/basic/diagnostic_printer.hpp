// argconv/basic/diagnostic_printer.hpp
//
// Prints batch-conversion diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "argconv/basic/diagnostic.hpp"

namespace argconv
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0200]: Argument 'count' got value 'abc' that cannot be converted to integer.
 *     --> count
 *      |
 *      = help: use an integer such as '42' or '0x2A'
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /// Print all diagnostics from a DiagnosticBag, in report order.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace argconv
