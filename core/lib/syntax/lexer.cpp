// argconv/syntax/lexer.cpp - Lexer for the literal expression language
//
#include "argconv/syntax/lexer.hpp"

#include <cctype>

#include "argconv/basic/text.hpp"

namespace argconv::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hex_value(unsigned char c)
{
  if (std::isdigit(c) != 0) return c - '0';
  return (std::tolower(c) - 'a') + 10;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
      advance(1);
      continue;
    }
    // Explicit line joining
    if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
      advance(peek(1) == '\n' ? 2 : 3);
      continue;
    }
    // Comment to end of line
    if (c == '#') {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
}

template <typename Pred>
bool Lexer::scan_digits(Pred is_digit)
{
  if (!is_digit(static_cast<unsigned char>(peek()))) {
    return false;
  }
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (is_digit(c)) {
      advance(1);
      continue;
    }
    if (c == '_') {
      // Underscores are only allowed between digits.
      if (!is_digit(static_cast<unsigned char>(peek(1)))) {
        return false;
      }
      advance(1);
      continue;
    }
    break;
  }
  return true;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const
{
  Token t;
  t.kind = kind;
  t.begin = start;
  t.end = static_cast<uint32_t>(pos_);
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_identifier_or_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }

  if (peek() == '\'' || peek() == '"') {
    const std::string prefix = to_lower_ascii(src_.substr(start, pos_ - start));
    if (prefix == "r" || prefix == "u" || prefix == "b" || prefix == "rb" || prefix == "br") {
      const bool raw = prefix.find('r') != std::string::npos;
      const bool bytes = prefix.find('b') != std::string::npos;
      return lex_string(start, raw, bytes);
    }
    // f-strings and other prefixes are not literals.
    return make_token(TokenKind::Unknown, start);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  const auto is_dec = [](unsigned char c) { return std::isdigit(c) != 0; };

  bool ok = true;
  bool is_float = false;

  // Base-prefixed integers: 0x.. 0b.. 0o..
  const char p1 = peek(1);
  if (peek() == '0' && (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O')) {
    advance(2);
    if (peek() == '_') {
      advance(1);
    }
    if (p1 == 'x' || p1 == 'X') {
      ok = scan_digits(is_hex_digit);
    } else if (p1 == 'b' || p1 == 'B') {
      ok = scan_digits([](unsigned char c) { return c == '0' || c == '1'; });
    } else {
      ok = scan_digits([](unsigned char c) { return c >= '0' && c <= '7'; });
    }
  } else {
    if (peek() != '.') {
      ok = scan_digits(is_dec);
    }

    // Fractional part
    if (ok && peek() == '.') {
      const bool leading_dot = pos_ == start;
      is_float = true;
      advance(1);
      if (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        ok = scan_digits(is_dec);
      } else if (leading_dot) {
        ok = false;
      }
    }

    // Exponent
    if (ok && (peek() == 'e' || peek() == 'E')) {
      is_float = true;
      advance(1);
      if (peek() == '+' || peek() == '-') {
        advance(1);
      }
      ok = scan_digits(is_dec);
    }
  }

  // A number running into a name (`1a`, `0x1g`, `1_`) is malformed.
  if (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    ok = false;
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }

  Token t = make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
  if (ok && !is_float && t.text.size() > 1 && t.text[0] == '0' && is_dec(t.text[1])) {
    // Leading zeros are only allowed in zero itself ("00", "0_0").
    ok = t.text.find_first_not_of("0_") == std::string_view::npos;
  }
  if (!ok) {
    t.kind = TokenKind::Unknown;
  }
  return t;
}

Token Lexer::lex_string(uint32_t start, bool raw, bool bytes)
{
  const char quote = peek();
  const bool triple = peek(1) == quote && peek(2) == quote;
  advance(triple ? 3 : 1);

  std::string value;
  bool invalid = false;

  while (true) {
    if (eof()) {
      // Unterminated
      return make_token(TokenKind::Unknown, start);
    }
    const char c = peek();
    if (triple) {
      if (c == quote && peek(1) == quote && peek(2) == quote) {
        advance(3);
        break;
      }
    } else {
      if (c == quote) {
        advance(1);
        break;
      }
      if (c == '\n' || c == '\r') {
        return make_token(TokenKind::Unknown, start);
      }
    }

    if (c == '\\') {
      if (pos_ + 1 >= src_.size()) {
        return make_token(TokenKind::Unknown, start);
      }
      const char n = peek(1);
      advance(2);

      if (raw) {
        value.push_back('\\');
        value.push_back(n);
        continue;
      }

      switch (n) {
        case '\n':
          break;
        case '\r':
          if (peek() == '\n') {
            advance(1);
          }
          break;
        case '\\':
        case '\'':
        case '"':
          value.push_back(n);
          break;
        case 'n':
          value.push_back('\n');
          break;
        case 't':
          value.push_back('\t');
          break;
        case 'r':
          value.push_back('\r');
          break;
        case 'a':
          value.push_back('\a');
          break;
        case 'b':
          value.push_back('\b');
          break;
        case 'f':
          value.push_back('\f');
          break;
        case 'v':
          value.push_back('\v');
          break;
        case 'x': {
          if (!is_hex_digit(static_cast<unsigned char>(peek())) ||
              !is_hex_digit(static_cast<unsigned char>(peek(1)))) {
            invalid = true;
            break;
          }
          const auto code = static_cast<uint32_t>(
            hex_value(static_cast<unsigned char>(peek())) * 16 +
            hex_value(static_cast<unsigned char>(peek(1))));
          advance(2);
          if (bytes) {
            value.push_back(static_cast<char>(code));
          } else {
            append_utf8(value, code);
          }
          break;
        }
        case 'u':
        case 'U': {
          if (bytes) {
            value.push_back('\\');
            value.push_back(n);
            break;
          }
          const int digits = n == 'u' ? 4 : 8;
          uint32_t code = 0;
          for (int i = 0; i < digits; ++i) {
            const auto h = static_cast<unsigned char>(peek());
            if (!is_hex_digit(h)) {
              invalid = true;
              break;
            }
            code = code * 16 + static_cast<uint32_t>(hex_value(h));
            advance(1);
          }
          if (code > 0x10FFFF) {
            invalid = true;
          }
          if (!invalid) {
            append_utf8(value, code);
          }
          break;
        }
        case 'N':
          // Named escapes would need the Unicode name database.
          if (bytes) {
            value.push_back('\\');
            value.push_back(n);
          } else {
            invalid = true;
          }
          break;
        default:
          if (n >= '0' && n <= '7') {
            uint32_t code = static_cast<uint32_t>(n - '0');
            for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; ++i) {
              code = code * 8 + static_cast<uint32_t>(peek() - '0');
              advance(1);
            }
            if (bytes) {
              if (code > 0xFF) {
                invalid = true;
              } else {
                value.push_back(static_cast<char>(code));
              }
            } else {
              append_utf8(value, code);
            }
            break;
          }
          // Unknown escapes are kept verbatim.
          value.push_back('\\');
          value.push_back(n);
          break;
      }
      continue;
    }

    // Bytes literals may only contain ASCII characters.
    if (bytes && static_cast<unsigned char>(c) >= 0x80) {
      invalid = true;
    }
    value.push_back(c);
    advance(1);
  }

  Token t = make_token(bytes ? TokenKind::BytesLiteral : TokenKind::StringLiteral, start);
  if (invalid) {
    t.kind = TokenKind::Unknown;
    return t;
  }
  t.value = std::move(value);
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  const auto c = static_cast<unsigned char>(peek());

  if (is_ident_start(c)) {
    return lex_identifier_or_string();
  }
  if (std::isdigit(c) != 0 || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
    return lex_number();
  }
  if (c == '\'' || c == '"') {
    return lex_string(start, false, false);
  }

  // Single-char tokens
  const char ch = peek();
  advance(1);

  switch (ch) {
    case '(':
      return make_token(TokenKind::LParen, start);
    case ')':
      return make_token(TokenKind::RParen, start);
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case ':':
      return make_token(TokenKind::Colon, start);
    case '+':
      return make_token(TokenKind::Plus, start);
    case '-':
      return make_token(TokenKind::Minus, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(std::move(t));
    if (done) {
      break;
    }
  }
  return out;
}

}  // namespace argconv::syntax
