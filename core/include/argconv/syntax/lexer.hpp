// argconv/syntax/lexer.hpp - Lexer for the literal expression language
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "argconv/syntax/token.hpp"

namespace argconv::syntax
{

/**
 * Splits Python-style literal text into tokens.
 *
 * Malformed input (unterminated strings, bad escapes, invalid numbers,
 * unsupported characters) becomes TokenKind::Unknown; the lexer never
 * throws.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  /// Consume `digit (_? digit)*`; false if nothing matched or an underscore dangles.
  template <typename Pred>
  bool scan_digits(Pred is_digit);

  [[nodiscard]] Token lex_identifier_or_string();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(uint32_t start, bool raw, bool bytes);

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace argconv::syntax
