// argconv/syntax/literal_eval.cpp - Restricted literal expression evaluator
//
#include "argconv/syntax/literal_eval.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "argconv/basic/errors.hpp"
#include "argconv/syntax/lexer.hpp"

namespace argconv::syntax
{
namespace
{

[[noreturn]] void invalid_expression() { throw ConversionError("Invalid expression."); }

// Bracket nesting accepted before the expression is rejected.
constexpr int k_max_nesting = 200;

/// Name of the first unhashable type found in `value`, if any.
std::optional<std::string> unhashable_type(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::List:
      return std::string("list");
    case ValueKind::Dict:
      return std::string("dict");
    case ValueKind::Set:
      return std::string("set");
    case ValueKind::ByteArray:
      return std::string("bytearray");
    case ValueKind::Tuple:
      for (const auto & item : value.items()) {
        if (auto name = unhashable_type(item)) return name;
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

void require_hashable(const Value & value)
{
  if (auto name = unhashable_type(value)) {
    throw ConversionError("Evaluating expression failed: unhashable type: '" + *name + "'");
  }
}

class LiteralParser
{
public:
  explicit LiteralParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  [[nodiscard]] Value parse_program()
  {
    Value result = parse_expr_list(TokenKind::Eof);
    expect(TokenKind::Eof);
    return result;
  }

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const
  {
    const size_t i = idx_ + lookahead;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
  }
  [[nodiscard]] bool at(TokenKind k) const { return cur().kind == k; }

  const Token & advance()
  {
    const Token & t = cur();
    if (idx_ < tokens_.size() - 1) {
      ++idx_;
    }
    return t;
  }

  bool match(TokenKind k)
  {
    if (!at(k)) return false;
    advance();
    return true;
  }

  void expect(TokenKind k)
  {
    if (!match(k)) invalid_expression();
  }

  // Counts one level of bracket nesting for the lifetime of the scope.
  class NestingScope
  {
  public:
    explicit NestingScope(int & depth) : depth_(depth)
    {
      if (++depth_ > k_max_nesting) {
        --depth_;
        invalid_expression();
      }
    }
    ~NestingScope() { --depth_; }

    NestingScope(const NestingScope &) = delete;
    NestingScope & operator=(const NestingScope &) = delete;

  private:
    int & depth_;
  };

  // `expr (, expr)* ,?` - a tuple when any comma is present
  [[nodiscard]] Value parse_expr_list(TokenKind closer)
  {
    Value first = parse_expr();
    if (!at(TokenKind::Comma)) {
      return first;
    }
    Value::Items items{std::move(first)};
    while (match(TokenKind::Comma)) {
      if (at(closer)) break;
      items.push_back(parse_expr());
    }
    return Value::make_tuple(std::move(items));
  }

  [[nodiscard]] Value parse_expr()
  {
    const Token & t = cur();
    switch (t.kind) {
      case TokenKind::Plus:
      case TokenKind::Minus:
        advance();
        return parse_signed_number(t.kind == TokenKind::Minus);
      case TokenKind::IntLiteral:
      case TokenKind::FloatLiteral:
        return parse_signed_number(false);
      case TokenKind::StringLiteral:
      case TokenKind::BytesLiteral:
        return parse_strings();
      case TokenKind::Identifier:
        return parse_name();
      case TokenKind::LBracket:
        return parse_list();
      case TokenKind::LParen:
        return parse_parenthesized();
      case TokenKind::LBrace:
        return parse_dict_or_set();
      default:
        invalid_expression();
    }
  }

  [[nodiscard]] Value parse_signed_number(bool negative)
  {
    const Token & t = advance();
    if (t.kind == TokenKind::IntLiteral) {
      return parse_integer(t.text, negative);
    }
    if (t.kind == TokenKind::FloatLiteral) {
      std::string digits;
      for (const char c : t.text) {
        if (c != '_') digits.push_back(c);
      }
      const double value = std::strtod(digits.c_str(), nullptr);
      return Value::make_float(negative ? -value : value);
    }
    // A sign applies to booleans as integers (-True == -1).
    if (t.kind == TokenKind::Identifier && (t.text == "True" || t.text == "False")) {
      const int64_t value = t.text == "True" ? 1 : 0;
      return Value::make_integer(negative ? -value : value);
    }
    invalid_expression();
  }

  [[nodiscard]] static Value parse_integer(std::string_view text, bool negative)
  {
    int base = 10;
    if (text.size() > 1 && text[0] == '0') {
      const char p = text[1];
      if (p == 'x' || p == 'X') {
        base = 16;
      } else if (p == 'o' || p == 'O') {
        base = 8;
      } else if (p == 'b' || p == 'B') {
        base = 2;
      }
      if (base != 10) text.remove_prefix(2);
    }

    std::string digits;
    for (const char c : text) {
      if (c != '_') digits.push_back(c);
    }

    uint64_t magnitude = 0;
    const char * first = digits.data();
    const char * last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, magnitude, base);
    if (ec != std::errc() || ptr != last) {
      invalid_expression();
    }

    constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (negative) {
      if (magnitude > k_max + 1) invalid_expression();
      if (magnitude == k_max + 1) return Value::make_integer(std::numeric_limits<int64_t>::min());
      return Value::make_integer(-static_cast<int64_t>(magnitude));
    }
    if (magnitude > k_max) invalid_expression();
    return Value::make_integer(static_cast<int64_t>(magnitude));
  }

  // Adjacent literals concatenate; str and bytes cannot be mixed.
  [[nodiscard]] Value parse_strings()
  {
    const TokenKind kind = cur().kind;
    std::string value;
    while (at(TokenKind::StringLiteral) || at(TokenKind::BytesLiteral)) {
      if (cur().kind != kind) invalid_expression();
      value += advance().value;
    }
    if (kind == TokenKind::BytesLiteral) {
      return Value::make_bytes(std::move(value));
    }
    return Value::make_string(std::move(value));
  }

  [[nodiscard]] Value parse_name()
  {
    const Token & t = advance();
    if (t.text == "True") return Value::make_bool(true);
    if (t.text == "False") return Value::make_bool(false);
    if (t.text == "None") return Value::none();
    if (t.text == "set" && at(TokenKind::LParen) && cur(1).kind == TokenKind::RParen) {
      advance();
      advance();
      return Value::make_set({});
    }
    invalid_expression();
  }

  [[nodiscard]] Value parse_list()
  {
    NestingScope nesting(depth_);
    expect(TokenKind::LBracket);
    Value::Items items;
    while (!at(TokenKind::RBracket)) {
      items.push_back(parse_expr());
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::RBracket);
    return Value::make_list(std::move(items));
  }

  [[nodiscard]] Value parse_parenthesized()
  {
    NestingScope nesting(depth_);
    expect(TokenKind::LParen);
    if (match(TokenKind::RParen)) {
      return Value::make_tuple({});
    }
    Value result = parse_expr_list(TokenKind::RParen);
    expect(TokenKind::RParen);
    return result;
  }

  [[nodiscard]] Value parse_dict_or_set()
  {
    NestingScope nesting(depth_);
    expect(TokenKind::LBrace);
    if (match(TokenKind::RBrace)) {
      return Value::make_dict({});
    }

    Value first = parse_expr();
    if (match(TokenKind::Colon)) {
      Value::DictItems entries;
      Value value = parse_expr();
      entries.emplace_back(std::move(first), std::move(value));
      while (match(TokenKind::Comma)) {
        if (at(TokenKind::RBrace)) break;
        Value key = parse_expr();
        expect(TokenKind::Colon);
        Value item = parse_expr();
        entries.emplace_back(std::move(key), std::move(item));
      }
      expect(TokenKind::RBrace);
      for (const auto & entry : entries) {
        require_hashable(entry.first);
      }
      return Value::make_dict(std::move(entries));
    }

    Value::Items items{std::move(first)};
    while (match(TokenKind::Comma)) {
      if (at(TokenKind::RBrace)) break;
      items.push_back(parse_expr());
    }
    expect(TokenKind::RBrace);
    for (const auto & item : items) {
      require_hashable(item);
    }
    return Value::make_set(std::move(items));
  }

  std::vector<Token> tokens_;
  size_t idx_ = 0;
  int depth_ = 0;
};

}  // namespace

Value literal_eval(std::string_view text)
{
  Lexer lexer(text);
  std::vector<Token> tokens = lexer.lex_all();
  for (const auto & t : tokens) {
    if (t.kind == TokenKind::Unknown) {
      invalid_expression();
    }
  }
  LiteralParser parser(std::move(tokens));
  return parser.parse_program();
}

}  // namespace argconv::syntax
