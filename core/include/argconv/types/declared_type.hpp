// argconv/types/declared_type.hpp - Type identity and subclass relations
#pragma once

#include <memory>
#include <string>

#include "argconv/types/type_kind.hpp"
#include "argconv/value/value.hpp"

namespace argconv
{

/**
 * Identity of a declared type.
 *
 * Built-in and abstract types are identified by their kind alone. Enumeration
 * and application class types additionally point at their definition, and a
 * literal constant carries its value.
 */
struct DeclaredType
{
  TypeKind kind = TypeKind::Unknown;
  std::shared_ptr<const EnumType> enum_type;    ///< Set for a concrete enumeration
  std::shared_ptr<const ClassType> class_type;  ///< Set for an application class
  std::shared_ptr<const Value> constant;        ///< Set for TypeKind::Constant

  DeclaredType() = default;
  DeclaredType(TypeKind k) : kind(k) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] static DeclaredType of_enum(std::shared_ptr<const EnumType> type);
  [[nodiscard]] static DeclaredType of_class(std::shared_ptr<const ClassType> type);
  [[nodiscard]] static DeclaredType of_constant(Value value);

  [[nodiscard]] bool is_unknown() const noexcept { return kind == TypeKind::Unknown; }

  /// A concrete enumeration or application class, not a bare kind.
  [[nodiscard]] bool is_user_defined() const noexcept { return enum_type || class_type; }

  /**
   * Whether instances can be tested against this type.
   *
   * False for the special forms (Any, Union, Literal, TypedDict, constants,
   * the ellipsis) and for unknown types.
   */
  [[nodiscard]] bool is_class() const noexcept;

  /// Display name ("int", "Color", "Sequence", ...).
  [[nodiscard]] std::string name() const;

  friend bool operator==(const DeclaredType & a, const DeclaredType & b);
  friend bool operator!=(const DeclaredType & a, const DeclaredType & b) { return !(a == b); }
};

/// Whether `sub` is `sup` or derives from it, directly or through an abstract base.
[[nodiscard]] bool is_subclass(const DeclaredType & sub, const DeclaredType & sup);

/// Concrete type of a runtime value.
[[nodiscard]] DeclaredType runtime_type(const Value & value);

/// is_subclass(runtime_type(value), type); false if `type` is not a class.
[[nodiscard]] bool is_instance(const Value & value, const DeclaredType & type);

}  // namespace argconv
