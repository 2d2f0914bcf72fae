// argconv/basic/text.hpp - Small text helpers shared by converters
//
// Message helpers (seq2str, plural_or_not) and the normalization rules used
// for case/space/separator-insensitive matching.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argconv
{

// ============================================================================
// Message helpers
// ============================================================================

/**
 * Join items for messages.
 *
 * seq2str({"a", "b", "c"}) -> "'a', 'b' and 'c'"
 * seq2str({"a", "b"}, "", ", ", " or ") -> "a or b"
 */
[[nodiscard]] std::string seq2str(
  const std::vector<std::string> & items, std::string_view quote = "'",
  std::string_view sep = ", ", std::string_view lastsep = " and ");

/// "" for a count of one, "s" otherwise.
[[nodiscard]] inline const char * plural_or_not(size_t count) noexcept
{
  return count == 1 ? "" : "s";
}

// ============================================================================
// Case and whitespace
// ============================================================================

[[nodiscard]] std::string to_lower_ascii(std::string_view s);
[[nodiscard]] std::string to_upper_ascii(std::string_view s);

/**
 * Title-case like Python's str.title(): the first cased character after an
 * uncased one is upper-cased, the rest lower-cased. Bytes outside ASCII are
 * treated as cased and left untouched.
 */
[[nodiscard]] std::string to_title(std::string_view s);

/// Strip ASCII whitespace from both ends.
[[nodiscard]] std::string_view strip(std::string_view s) noexcept;

/// Remove every occurrence of the given characters.
[[nodiscard]] std::string remove_chars(std::string_view s, std::string_view chars);

/// Whether `s` is all lowercase in the Python str.islower() sense.
[[nodiscard]] bool is_lower(std::string_view s) noexcept;

/// Python str.capitalize(): first character upper, the rest lower.
[[nodiscard]] std::string capitalize(std::string_view s);

/**
 * Normalize for loose comparison: drop whitespace, lower-case and remove
 * the `ignore` characters.
 */
[[nodiscard]] std::string normalize(std::string_view s, std::string_view ignore = "");

/// normalize(a, ignore) == normalize(b, ignore)
[[nodiscard]] bool eq_normalized(std::string_view a, std::string_view b, std::string_view ignore);

// ============================================================================
// UTF-8
// ============================================================================

/// Append a code point to `out` as UTF-8.
void append_utf8(std::string & out, uint32_t code_point);

/**
 * Decode UTF-8 text into code points.
 *
 * Invalid sequences decode byte-wise (each byte becomes its own code point).
 */
[[nodiscard]] std::vector<uint32_t> decode_utf8(std::string_view s);

}  // namespace argconv
