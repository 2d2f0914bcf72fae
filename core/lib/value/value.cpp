// argconv/value/value.cpp - Dynamic runtime value implementation
//
#include "argconv/value/value.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "argconv/basic/text.hpp"

namespace argconv
{

namespace
{

std::string quote_text(std::string_view text, bool is_bytes)
{
  const bool has_single = text.find('\'') != std::string_view::npos;
  const bool has_double = text.find('"') != std::string_view::npos;
  const char quote = (has_single && !has_double) ? '"' : '\'';

  std::string out;
  out.reserve(text.size() + 2);
  out.push_back(quote);
  for (const char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == static_cast<unsigned char>(quote)) {
          out.push_back('\\');
          out.push_back(ch);
        } else if (c < 0x20 || c == 0x7f || (is_bytes && c >= 0x80)) {
          out += fmt::format("\\x{:02x}", c);
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back(quote);
  return out;
}

std::string join_repr(const Value::Items & items)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i].repr();
  }
  return out;
}

std::string dict_repr(const Value::DictItems & items)
{
  std::string out = "{";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i].first.repr();
    out += ": ";
    out += items[i].second.repr();
  }
  out += "}";
  return out;
}

std::string timedelta_repr(const TimeDelta & td)
{
  constexpr int64_t k_us_per_day = int64_t{86400} * 1000000;
  int64_t days = td.microseconds / k_us_per_day;
  int64_t rest = td.microseconds % k_us_per_day;
  if (rest < 0) {
    rest += k_us_per_day;
    --days;
  }
  const int64_t seconds = rest / 1000000;
  const int64_t micros = rest % 1000000;

  std::vector<std::string> parts;
  if (days != 0) parts.push_back(fmt::format("days={}", days));
  if (seconds != 0) parts.push_back(fmt::format("seconds={}", seconds));
  if (micros != 0) parts.push_back(fmt::format("microseconds={}", micros));
  if (parts.empty()) return "datetime.timedelta(0)";
  return "datetime.timedelta(" + seq2str(parts, "", ", ", ", ") + ")";
}

std::string datetime_repr(const DateTime & dt)
{
  std::string out = fmt::format(
    "datetime.datetime({}, {}, {}, {}, {}", dt.date.year, dt.date.month, dt.date.day, dt.hour,
    dt.minute);
  if (dt.second != 0 || dt.microsecond != 0) out += fmt::format(", {}", dt.second);
  if (dt.microsecond != 0) out += fmt::format(", {}", dt.microsecond);
  return out + ")";
}

/// Numeric view used for cross-type equality.
struct Numeric
{
  enum class Tag : uint8_t { Int, Float, Dec } tag;
  int64_t i = 0;
  double f = 0.0;
  const Decimal * d = nullptr;
};

std::optional<Numeric> as_numeric(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Bool:
      return Numeric{Numeric::Tag::Int, v.as_bool() ? 1 : 0, 0.0, nullptr};
    case ValueKind::Integer:
      return Numeric{Numeric::Tag::Int, v.as_integer(), 0.0, nullptr};
    case ValueKind::Float:
      return Numeric{Numeric::Tag::Float, 0, v.as_float(), nullptr};
    case ValueKind::Decimal:
      return Numeric{Numeric::Tag::Dec, 0, 0.0, &v.as_decimal()};
    case ValueKind::EnumMember: {
      const auto & member = v.as_enum_member();
      if (member.type->int_backed && member.value().is_integer()) {
        return Numeric{Numeric::Tag::Int, member.value().as_integer(), 0.0, nullptr};
      }
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

bool int_equals_float(int64_t i, double f)
{
  if (std::isnan(f) || std::isinf(f) || std::floor(f) != f) return false;
  if (f < -9223372036854775808.0 || f >= 9223372036854775808.0) return false;
  return static_cast<int64_t>(f) == i;
}

bool numeric_equal(const Numeric & a, const Numeric & b)
{
  using Tag = Numeric::Tag;
  if (a.tag == Tag::Int && b.tag == Tag::Int) return a.i == b.i;
  if (a.tag == Tag::Float && b.tag == Tag::Float) return a.f == b.f;
  if (a.tag == Tag::Int && b.tag == Tag::Float) return int_equals_float(a.i, b.f);
  if (a.tag == Tag::Float && b.tag == Tag::Int) return int_equals_float(b.i, a.f);

  const auto to_decimal = [](const Numeric & n) {
    switch (n.tag) {
      case Tag::Int:
        return Decimal::from_integer(n.i);
      case Tag::Float:
        return Decimal::from_double(n.f);
      case Tag::Dec:
        break;
    }
    return *n.d;
  };
  return to_decimal(a) == to_decimal(b);
}

bool items_equal(const Value::Items & a, const Value::Items & b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i] != b[i]) return false;
  }
  return true;
}

bool contains(const Value::Items & items, const Value & v)
{
  for (const auto & item : items) {
    if (item == v) return true;
  }
  return false;
}

bool is_set_kind(ValueKind k) { return k == ValueKind::Set || k == ValueKind::FrozenSet; }

bool is_bytes_kind(ValueKind k) { return k == ValueKind::Bytes || k == ValueKind::ByteArray; }

}  // namespace

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_bool(bool value)
{
  Value v;
  v.kind_ = ValueKind::Bool;
  v.storage_ = value;
  return v;
}

Value Value::make_integer(int64_t value)
{
  Value v;
  v.kind_ = ValueKind::Integer;
  v.storage_ = value;
  return v;
}

Value Value::make_float(double value)
{
  Value v;
  v.kind_ = ValueKind::Float;
  v.storage_ = value;
  return v;
}

Value Value::make_decimal(Decimal value)
{
  Value v;
  v.kind_ = ValueKind::Decimal;
  v.storage_ = std::move(value);
  return v;
}

Value Value::make_string(std::string value)
{
  Value v;
  v.kind_ = ValueKind::String;
  v.storage_ = std::move(value);
  return v;
}

Value Value::make_bytes(std::string value)
{
  Value v;
  v.kind_ = ValueKind::Bytes;
  v.storage_ = std::move(value);
  return v;
}

Value Value::make_bytearray(std::string value)
{
  Value v;
  v.kind_ = ValueKind::ByteArray;
  v.storage_ = std::move(value);
  return v;
}

Value Value::make_path(std::string value)
{
  Value v;
  v.kind_ = ValueKind::Path;
  v.storage_ = std::move(value);
  return v;
}

Value Value::make_list(Items items)
{
  Value v;
  v.kind_ = ValueKind::List;
  v.storage_ = std::make_shared<const Items>(std::move(items));
  return v;
}

Value Value::make_tuple(Items items)
{
  Value v;
  v.kind_ = ValueKind::Tuple;
  v.storage_ = std::make_shared<const Items>(std::move(items));
  return v;
}

Value Value::make_set(Items items)
{
  Items unique;
  unique.reserve(items.size());
  for (auto & item : items) {
    if (!contains(unique, item)) unique.push_back(std::move(item));
  }
  Value v;
  v.kind_ = ValueKind::Set;
  v.storage_ = std::make_shared<const Items>(std::move(unique));
  return v;
}

Value Value::make_frozenset(Items items)
{
  Value v = make_set(std::move(items));
  v.kind_ = ValueKind::FrozenSet;
  return v;
}

Value Value::make_dict(DictItems items)
{
  DictItems merged;
  merged.reserve(items.size());
  for (auto & entry : items) {
    bool found = false;
    for (auto & existing : merged) {
      if (existing.first == entry.first) {
        existing.second = std::move(entry.second);
        found = true;
        break;
      }
    }
    if (!found) merged.push_back(std::move(entry));
  }
  Value v;
  v.kind_ = ValueKind::Dict;
  v.storage_ = std::make_shared<const DictItems>(std::move(merged));
  return v;
}

Value Value::make_enum_member(std::shared_ptr<const EnumType> type, size_t index)
{
  if (!type || index >= type->members.size()) {
    throw std::out_of_range("enum member index out of range");
  }
  Value v;
  v.kind_ = ValueKind::EnumMember;
  v.storage_ = EnumMember{std::move(type), index};
  return v;
}

Value Value::make_datetime(DateTime value)
{
  Value v;
  v.kind_ = ValueKind::DateTime;
  v.storage_ = value;
  return v;
}

Value Value::make_date(Date value)
{
  Value v;
  v.kind_ = ValueKind::Date;
  v.storage_ = value;
  return v;
}

Value Value::make_timedelta(TimeDelta value)
{
  Value v;
  v.kind_ = ValueKind::TimeDelta;
  v.storage_ = value;
  return v;
}

Value Value::make_object(std::shared_ptr<const ClassType> cls, std::string display)
{
  Value v;
  v.kind_ = ValueKind::Object;
  v.storage_ = std::make_shared<const Object>(Object{std::move(cls), std::move(display)});
  return v;
}

// ============================================================================
// Queries
// ============================================================================

bool Value::is_collection() const noexcept
{
  return kind_ == ValueKind::List || kind_ == ValueKind::Tuple || kind_ == ValueKind::Set ||
         kind_ == ValueKind::FrozenSet;
}

size_t Value::size() const
{
  if (is_collection()) return items().size();
  if (is_dict()) return dict_items().size();
  return 0;
}

const Value * Value::find(const Value & key) const
{
  if (!is_dict()) return nullptr;
  for (const auto & [k, v] : dict_items()) {
    if (k == key) return &v;
  }
  return nullptr;
}

bool Value::is_hashable() const
{
  switch (kind_) {
    case ValueKind::List:
    case ValueKind::Set:
    case ValueKind::Dict:
    case ValueKind::ByteArray:
      return false;
    case ValueKind::Tuple:
      for (const auto & item : items()) {
        if (!item.is_hashable()) return false;
      }
      return true;
    default:
      return true;
  }
}

// ============================================================================
// Text Forms
// ============================================================================

std::string Value::str() const
{
  switch (kind_) {
    case ValueKind::String:
    case ValueKind::Path:
      return as_string();
    case ValueKind::Decimal:
      return as_decimal().to_string();
    case ValueKind::EnumMember:
      return as_enum_member().type->name + "." + as_enum_member().name();
    case ValueKind::DateTime:
      return as_datetime().to_string();
    case ValueKind::Date:
      return as_date().to_string();
    case ValueKind::TimeDelta:
      return as_timedelta().to_string();
    case ValueKind::Object: {
      const auto & obj = as_object();
      if (!obj.display.empty()) return obj.display;
      return fmt::format("<{} object>", obj.cls ? obj.cls->name : "object");
    }
    default:
      return repr();
  }
}

std::string Value::repr() const
{
  switch (kind_) {
    case ValueKind::None:
      return "None";
    case ValueKind::Bool:
      return as_bool() ? "True" : "False";
    case ValueKind::Integer:
      return std::to_string(as_integer());
    case ValueKind::Float:
      return format_float(as_float());
    case ValueKind::Decimal:
      return "Decimal('" + as_decimal().to_string() + "')";
    case ValueKind::String:
      return quote_text(as_string(), false);
    case ValueKind::Bytes:
      return "b" + quote_text(as_string(), true);
    case ValueKind::ByteArray:
      return "bytearray(b" + quote_text(as_string(), true) + ")";
    case ValueKind::Path:
      return "Path(" + quote_text(as_string(), false) + ")";
    case ValueKind::List:
      return "[" + join_repr(items()) + "]";
    case ValueKind::Tuple:
      if (items().size() == 1) return "(" + items()[0].repr() + ",)";
      return "(" + join_repr(items()) + ")";
    case ValueKind::Set:
      if (items().empty()) return "set()";
      return "{" + join_repr(items()) + "}";
    case ValueKind::FrozenSet:
      if (items().empty()) return "frozenset()";
      return "frozenset({" + join_repr(items()) + "})";
    case ValueKind::Dict:
      return dict_repr(dict_items());
    case ValueKind::EnumMember: {
      const auto & member = as_enum_member();
      return fmt::format("<{}.{}: {}>", member.type->name, member.name(), member.value().repr());
    }
    case ValueKind::DateTime:
      return datetime_repr(as_datetime());
    case ValueKind::Date:
      return fmt::format(
        "datetime.date({}, {}, {})", as_date().year, as_date().month, as_date().day);
    case ValueKind::TimeDelta:
      return timedelta_repr(as_timedelta());
    case ValueKind::Object:
      return str();
  }
  return "";
}

std::string Value::type_name() const
{
  switch (kind_) {
    case ValueKind::None:
      return "None";
    case ValueKind::Bool:
      return "boolean";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::Decimal:
      return "Decimal";
    case ValueKind::String:
      return "string";
    case ValueKind::Bytes:
      return "bytes";
    case ValueKind::ByteArray:
      return "bytearray";
    case ValueKind::Path:
      return "Path";
    case ValueKind::List:
      return "list";
    case ValueKind::Tuple:
      return "tuple";
    case ValueKind::Set:
      return "set";
    case ValueKind::FrozenSet:
      return "frozenset";
    case ValueKind::Dict:
      return "dictionary";
    case ValueKind::EnumMember:
      return as_enum_member().type->name;
    case ValueKind::DateTime:
      return "datetime";
    case ValueKind::Date:
      return "date";
    case ValueKind::TimeDelta:
      return "timedelta";
    case ValueKind::Object:
      return as_object().cls ? as_object().cls->name : "object";
  }
  return "";
}

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Value & a, const Value & b)
{
  const auto na = as_numeric(a);
  const auto nb = as_numeric(b);
  if (na && nb) return numeric_equal(*na, *nb);

  if (is_set_kind(a.kind_) && is_set_kind(b.kind_)) {
    const auto & ia = a.items();
    const auto & ib = b.items();
    if (ia.size() != ib.size()) return false;
    for (const auto & item : ia) {
      if (!contains(ib, item)) return false;
    }
    return true;
  }
  if (is_bytes_kind(a.kind_) && is_bytes_kind(b.kind_)) {
    return a.as_string() == b.as_string();
  }
  if (a.kind_ != b.kind_) return false;

  switch (a.kind_) {
    case ValueKind::None:
      return true;
    case ValueKind::String:
    case ValueKind::Path:
      return a.as_string() == b.as_string();
    case ValueKind::List:
    case ValueKind::Tuple:
      return items_equal(a.items(), b.items());
    case ValueKind::Dict: {
      const auto & da = a.dict_items();
      const auto & db = b.dict_items();
      if (da.size() != db.size()) return false;
      for (const auto & [key, value] : da) {
        const Value * other = b.find(key);
        if (other == nullptr || *other != value) return false;
      }
      return true;
    }
    case ValueKind::EnumMember:
      return a.as_enum_member().type == b.as_enum_member().type &&
             a.as_enum_member().index == b.as_enum_member().index;
    case ValueKind::DateTime:
      return a.as_datetime() == b.as_datetime();
    case ValueKind::Date:
      return a.as_date() == b.as_date();
    case ValueKind::TimeDelta:
      return a.as_timedelta() == b.as_timedelta();
    case ValueKind::Object:
      return std::get<std::shared_ptr<const Object>>(a.storage_) ==
             std::get<std::shared_ptr<const Object>>(b.storage_);
    default:
      return false;
  }
}

// ============================================================================
// Enumeration Types
// ============================================================================

std::optional<size_t> EnumType::find(std::string_view member_name) const
{
  for (size_t i = 0; i < members.size(); ++i) {
    if (members[i].name == member_name) return i;
  }
  return std::nullopt;
}

std::shared_ptr<const EnumType> make_int_enum(
  std::string name, const std::vector<std::pair<std::string, int64_t>> & members)
{
  auto type = std::make_shared<EnumType>();
  type->name = std::move(name);
  type->int_backed = true;
  for (const auto & [member_name, value] : members) {
    type->members.push_back({member_name, Value::make_integer(value)});
  }
  return type;
}

std::shared_ptr<const EnumType> make_enum(
  std::string name, const std::vector<std::pair<std::string, std::string>> & members)
{
  auto type = std::make_shared<EnumType>();
  type->name = std::move(name);
  for (const auto & [member_name, value] : members) {
    type->members.push_back({member_name, Value::make_string(value)});
  }
  return type;
}

Value enum_member(const std::shared_ptr<const EnumType> & type, std::string_view name)
{
  const auto index = type->find(name);
  if (!index) {
    throw std::out_of_range(fmt::format("{} has no member '{}'", type->name, name));
  }
  return Value::make_enum_member(type, *index);
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<Value::Items> iterate(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::List:
    case ValueKind::Tuple:
    case ValueKind::Set:
    case ValueKind::FrozenSet:
      return value.items();
    case ValueKind::Dict: {
      Value::Items keys;
      keys.reserve(value.size());
      for (const auto & entry : value.dict_items()) keys.push_back(entry.first);
      return keys;
    }
    case ValueKind::String: {
      Value::Items chars;
      for (const uint32_t cp : decode_utf8(value.as_string())) {
        std::string ch;
        append_utf8(ch, cp);
        chars.push_back(Value::make_string(std::move(ch)));
      }
      return chars;
    }
    case ValueKind::Bytes:
    case ValueKind::ByteArray: {
      Value::Items bytes;
      for (const char c : value.as_string()) {
        bytes.push_back(Value::make_integer(static_cast<unsigned char>(c)));
      }
      return bytes;
    }
    default:
      return std::nullopt;
  }
}

std::string format_float(double value)
{
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value < 0 ? "-inf" : "inf";
  std::string text = fmt::format("{}", value);
  if (text.find_first_of(".e") == std::string::npos) text += ".0";
  return text;
}

}  // namespace argconv
