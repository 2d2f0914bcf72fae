// argconv/value/value.hpp - Dynamic runtime value representation
//
// Values are what converters consume and produce: text coming from the
// outside world, and the typed results the caller asked for. Containers
// share their elements (copying a Value is cheap) and are immutable.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "argconv/types/type_kind.hpp"
#include "argconv/value/decimal.hpp"
#include "argconv/value/temporal.hpp"

namespace argconv
{

struct EnumType;
struct ClassType;
class Value;

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of runtime value.
 */
enum class ValueKind : uint8_t {
  None,
  Bool,
  Integer,    ///< 64-bit signed integer
  Float,      ///< 64-bit floating point
  Decimal,    ///< Exact decimal
  String,     ///< UTF-8 text
  Bytes,      ///< Immutable byte string
  ByteArray,  ///< Mutable-by-convention byte string
  Path,       ///< Filesystem path
  List,
  Tuple,
  Set,
  FrozenSet,
  Dict,        ///< Insertion-ordered mapping
  EnumMember,  ///< Member of an EnumType
  DateTime,
  Date,
  TimeDelta,
  Object,  ///< Opaque application object (see ClassType)
};

/// Reference to one member of an enumeration type.
struct EnumMember
{
  std::shared_ptr<const EnumType> type;
  size_t index = 0;

  [[nodiscard]] const std::string & name() const;
  [[nodiscard]] const Value & value() const;
};

/// Opaque application object, typically produced by a custom converter.
struct Object
{
  std::shared_ptr<const ClassType> cls;
  std::string display;
};

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  using Items = std::vector<Value>;
  using DictItems = std::vector<std::pair<Value, Value>>;

  /// Default constructor creates None
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value none() { return Value(); }
  static Value make_bool(bool value);
  static Value make_integer(int64_t value);
  static Value make_float(double value);
  static Value make_decimal(Decimal value);
  static Value make_string(std::string value);
  /// Bytes are stored one byte per char.
  static Value make_bytes(std::string value);
  static Value make_bytearray(std::string value);
  static Value make_path(std::string value);
  static Value make_list(Items items);
  static Value make_tuple(Items items);
  /// Duplicates (by ==) are dropped, first occurrence wins.
  static Value make_set(Items items);
  static Value make_frozenset(Items items);
  /// A repeated key keeps its first position and takes the last value.
  static Value make_dict(DictItems items);
  static Value make_enum_member(std::shared_ptr<const EnumType> type, size_t index);
  static Value make_datetime(DateTime value);
  static Value make_date(Date value);
  static Value make_timedelta(TimeDelta value);
  static Value make_object(std::shared_ptr<const ClassType> cls, std::string display = "");

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_none() const noexcept { return kind_ == ValueKind::None; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
  [[nodiscard]] bool is_decimal() const noexcept { return kind_ == ValueKind::Decimal; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_dict() const noexcept { return kind_ == ValueKind::Dict; }
  [[nodiscard]] bool is_enum_member() const noexcept { return kind_ == ValueKind::EnumMember; }

  /// List, tuple, set or frozenset
  [[nodiscard]] bool is_collection() const noexcept;

  // ===========================================================================
  // Value Accessors (only valid for the matching kind)
  // ===========================================================================

  [[nodiscard]] bool as_bool() const { return std::get<bool>(storage_); }
  [[nodiscard]] int64_t as_integer() const { return std::get<int64_t>(storage_); }
  [[nodiscard]] double as_float() const { return std::get<double>(storage_); }
  [[nodiscard]] const Decimal & as_decimal() const { return std::get<Decimal>(storage_); }

  /// Text of a String, Bytes, ByteArray or Path value.
  [[nodiscard]] const std::string & as_string() const { return std::get<std::string>(storage_); }

  /// Elements of a List, Tuple, Set or FrozenSet value.
  [[nodiscard]] const Items & items() const { return *std::get<std::shared_ptr<const Items>>(storage_); }

  [[nodiscard]] const DictItems & dict_items() const
  {
    return *std::get<std::shared_ptr<const DictItems>>(storage_);
  }

  [[nodiscard]] const EnumMember & as_enum_member() const { return std::get<EnumMember>(storage_); }
  [[nodiscard]] const DateTime & as_datetime() const { return std::get<DateTime>(storage_); }
  [[nodiscard]] const Date & as_date() const { return std::get<Date>(storage_); }
  [[nodiscard]] const TimeDelta & as_timedelta() const { return std::get<TimeDelta>(storage_); }
  [[nodiscard]] const Object & as_object() const
  {
    return *std::get<std::shared_ptr<const Object>>(storage_);
  }

  /// Number of elements of a collection or entries of a dict; 0 otherwise.
  [[nodiscard]] size_t size() const;

  /// Dict lookup by key equality.
  [[nodiscard]] const Value * find(const Value & key) const;

  // ===========================================================================
  // Text Forms
  // ===========================================================================

  /// Human-readable form (Python str()).
  [[nodiscard]] std::string str() const;

  /// Unambiguous form used inside containers (Python repr()).
  [[nodiscard]] std::string repr() const;

  /// Name of the runtime type used in messages: "string", "integer", "list", ...
  [[nodiscard]] std::string type_name() const;

  /// Whether the value can be a set element or dict key.
  [[nodiscard]] bool is_hashable() const;

  friend bool operator==(const Value & a, const Value & b);
  friend bool operator!=(const Value & a, const Value & b) { return !(a == b); }

private:
  using Storage = std::variant<
    std::monostate, bool, int64_t, double, Decimal, std::string, std::shared_ptr<const Items>,
    std::shared_ptr<const DictItems>, EnumMember, DateTime, Date, TimeDelta,
    std::shared_ptr<const Object>>;

  ValueKind kind_ = ValueKind::None;
  Storage storage_;
};

// ============================================================================
// Enumeration and Class Types
// ============================================================================

/**
 * An enumeration type.
 *
 * Int-backed enumerations (members with integer values that compare equal
 * to plain integers) accept integer input.
 */
struct EnumType
{
  struct Member
  {
    std::string name;
    Value value;
  };

  std::string name;
  bool int_backed = false;
  std::vector<Member> members;

  /// Index of the member with exactly this name.
  [[nodiscard]] std::optional<size_t> find(std::string_view member_name) const;
};

/// Create an int-backed enumeration.
[[nodiscard]] std::shared_ptr<const EnumType> make_int_enum(
  std::string name, const std::vector<std::pair<std::string, int64_t>> & members);

/// Create a plain enumeration with string values.
[[nodiscard]] std::shared_ptr<const EnumType> make_enum(
  std::string name, const std::vector<std::pair<std::string, std::string>> & members);

/// The member of `type` called `name`; throws std::out_of_range if missing.
[[nodiscard]] Value enum_member(const std::shared_ptr<const EnumType> & type, std::string_view name);

/**
 * An application class.
 *
 * Bases decide duck-typed matching: a class deriving from Sequence is
 * handled like a list, one deriving from Integer like an integer.
 */
struct ClassType
{
  std::string name;
  std::vector<TypeKind> bases;
  std::vector<std::shared_ptr<const ClassType>> class_bases;
};

inline const std::string & EnumMember::name() const { return type->members[index].name; }
inline const Value & EnumMember::value() const { return type->members[index].value; }

// ============================================================================
// Helpers
// ============================================================================

/**
 * Elements produced by iterating over a value.
 *
 * Collections yield their elements, dicts their keys, strings one string per
 * character and byte strings one integer per byte.
 *
 * @return std::nullopt if the value is not iterable
 */
[[nodiscard]] std::optional<Value::Items> iterate(const Value & value);

/// Shortest round-trip float text, always with a '.' or exponent ("1.0", "1e+16").
[[nodiscard]] std::string format_float(double value);

}  // namespace argconv
