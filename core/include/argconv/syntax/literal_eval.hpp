// argconv/syntax/literal_eval.hpp - Restricted literal expression evaluator
#pragma once

#include <string_view>

#include "argconv/value/value.hpp"

namespace argconv::syntax
{

/**
 * Evaluate Python-style literal text.
 *
 * Supported: strings and bytes (quoted, triple-quoted, `r`/`b` prefixes,
 * implicit concatenation), integers (decimal, hex, octal, binary,
 * underscores), floats, a unary sign on numbers, True/False/None, lists,
 * tuples (with or without parentheses), sets, dicts and `set()`.
 *
 * @throws ConversionError "Invalid expression." for malformed text, or
 *         "Evaluating expression failed: unhashable type: '<type>'" when a
 *         set element or dict key is unhashable
 */
[[nodiscard]] Value literal_eval(std::string_view text);

}  // namespace argconv::syntax
