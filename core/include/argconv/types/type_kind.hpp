// argconv/types/type_kind.hpp - Kinds of declared types
#pragma once

#include <cstdint>
#include <string_view>

namespace argconv
{

/**
 * Kind of a declared type.
 *
 * Concrete built-ins, the abstract bases used for duck-typed matching and
 * the special forms (union, literal, record) a type descriptor can name.
 */
enum class TypeKind : uint8_t {
  Unknown,  ///< No usable type information

  // Scalars
  Any,
  String,
  Bool,
  Integer,
  Float,
  Decimal,
  Bytes,
  ByteArray,
  DateTime,
  Date,
  TimeDelta,
  Path,
  None,

  // Containers
  List,
  Tuple,
  Dict,
  Set,
  FrozenSet,

  // Special forms
  Union,
  Literal,
  TypedDict,
  Enum,      ///< A concrete enumeration type (see EnumType)
  Class,     ///< An application class (see ClassType)
  Constant,  ///< A literal constant used as a Literal member
  Ellipsis,  ///< `...` marking a homogeneous tuple

  // Abstract bases
  Integral,
  Real,
  Sequence,
  Mapping,
  AbstractSet,
  Container,
  PathLike,
};

/// Canonical source-level name of a kind ("int", "list", "Sequence", ...).
[[nodiscard]] constexpr std::string_view to_string(TypeKind k) noexcept
{
  switch (k) {
    case TypeKind::Unknown:
      return "Unknown";
    case TypeKind::Any:
      return "Any";
    case TypeKind::String:
      return "str";
    case TypeKind::Bool:
      return "bool";
    case TypeKind::Integer:
      return "int";
    case TypeKind::Float:
      return "float";
    case TypeKind::Decimal:
      return "Decimal";
    case TypeKind::Bytes:
      return "bytes";
    case TypeKind::ByteArray:
      return "bytearray";
    case TypeKind::DateTime:
      return "datetime";
    case TypeKind::Date:
      return "date";
    case TypeKind::TimeDelta:
      return "timedelta";
    case TypeKind::Path:
      return "Path";
    case TypeKind::None:
      return "None";
    case TypeKind::List:
      return "list";
    case TypeKind::Tuple:
      return "tuple";
    case TypeKind::Dict:
      return "dict";
    case TypeKind::Set:
      return "set";
    case TypeKind::FrozenSet:
      return "frozenset";
    case TypeKind::Union:
      return "Union";
    case TypeKind::Literal:
      return "Literal";
    case TypeKind::TypedDict:
      return "TypedDict";
    case TypeKind::Enum:
      return "Enum";
    case TypeKind::Class:
      return "object";
    case TypeKind::Constant:
      return "constant";
    case TypeKind::Ellipsis:
      return "...";
    case TypeKind::Integral:
      return "Integral";
    case TypeKind::Real:
      return "Real";
    case TypeKind::Sequence:
      return "Sequence";
    case TypeKind::Mapping:
      return "Mapping";
    case TypeKind::AbstractSet:
      return "Set";
    case TypeKind::Container:
      return "Container";
    case TypeKind::PathLike:
      return "PathLike";
  }
  return "";
}

}  // namespace argconv
