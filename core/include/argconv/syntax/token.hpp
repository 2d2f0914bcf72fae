// argconv/syntax/token.hpp - Tokens of the literal expression language
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace argconv::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // True, False, None, set
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.value is the decoded contents
  BytesLiteral,   // token.value is the decoded bytes

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,

  Plus,
  Minus,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  uint32_t begin = 0;     // byte offset of the first character
  uint32_t end = 0;       // byte offset one past the last character
  std::string_view text;  // slice of the source (including prefix and quotes for strings)
  std::string value;      // decoded contents of string and bytes literals
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::BytesLiteral:
      return "bytes";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
  }
  return "";
}

}  // namespace argconv::syntax
