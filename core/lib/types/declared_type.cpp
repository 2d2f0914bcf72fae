// argconv/types/declared_type.cpp - Type identity and subclass relations
//
#include "argconv/types/declared_type.hpp"

namespace argconv
{

namespace
{

/// Direct supertype of a built-in or abstract kind; Unknown for roots.
TypeKind direct_base(TypeKind kind)
{
  switch (kind) {
    case TypeKind::Bool:
      return TypeKind::Integer;
    case TypeKind::Integer:
      return TypeKind::Integral;
    case TypeKind::Integral:
    case TypeKind::Float:
      return TypeKind::Real;
    case TypeKind::String:
    case TypeKind::Bytes:
    case TypeKind::ByteArray:
    case TypeKind::List:
    case TypeKind::Tuple:
      return TypeKind::Sequence;
    case TypeKind::Dict:
      return TypeKind::Mapping;
    case TypeKind::Set:
    case TypeKind::FrozenSet:
      return TypeKind::AbstractSet;
    case TypeKind::Sequence:
    case TypeKind::Mapping:
    case TypeKind::AbstractSet:
      return TypeKind::Container;
    case TypeKind::DateTime:
      return TypeKind::Date;
    case TypeKind::Path:
      return TypeKind::PathLike;
    default:
      return TypeKind::Unknown;
  }
}

bool kind_derives(TypeKind kind, TypeKind target)
{
  for (TypeKind k = kind; k != TypeKind::Unknown; k = direct_base(k)) {
    if (k == target) return true;
  }
  return false;
}

bool class_derives(const ClassType & cls, TypeKind target)
{
  for (const TypeKind base : cls.bases) {
    if (kind_derives(base, target)) return true;
  }
  for (const auto & base : cls.class_bases) {
    if (base && class_derives(*base, target)) return true;
  }
  return false;
}

bool class_derives(const std::shared_ptr<const ClassType> & cls, const ClassType * target)
{
  if (!cls) return false;
  if (cls.get() == target) return true;
  for (const auto & base : cls->class_bases) {
    if (class_derives(base, target)) return true;
  }
  return false;
}

}  // namespace

DeclaredType DeclaredType::of_enum(std::shared_ptr<const EnumType> type)
{
  DeclaredType t(TypeKind::Enum);
  t.enum_type = std::move(type);
  return t;
}

DeclaredType DeclaredType::of_class(std::shared_ptr<const ClassType> type)
{
  DeclaredType t(TypeKind::Class);
  t.class_type = std::move(type);
  return t;
}

DeclaredType DeclaredType::of_constant(Value value)
{
  DeclaredType t(TypeKind::Constant);
  t.constant = std::make_shared<const Value>(std::move(value));
  return t;
}

bool DeclaredType::is_class() const noexcept
{
  switch (kind) {
    case TypeKind::Unknown:
    case TypeKind::Any:
    case TypeKind::Union:
    case TypeKind::Literal:
    case TypeKind::TypedDict:
    case TypeKind::Constant:
    case TypeKind::Ellipsis:
      return false;
    default:
      return true;
  }
}

std::string DeclaredType::name() const
{
  if (enum_type) return enum_type->name;
  if (class_type) return class_type->name;
  if (constant) {
    return constant->is_enum_member() ? constant->str() : constant->repr();
  }
  return std::string(to_string(kind));
}

bool operator==(const DeclaredType & a, const DeclaredType & b)
{
  if (a.kind != b.kind || a.enum_type != b.enum_type || a.class_type != b.class_type) {
    return false;
  }
  if (!a.constant || !b.constant) return a.constant == b.constant;
  return a.constant->kind() == b.constant->kind() && *a.constant == *b.constant;
}

bool is_subclass(const DeclaredType & sub, const DeclaredType & sup)
{
  if (!sup.is_class() || !sub.is_class()) return false;

  if (sup.enum_type) return sub.enum_type == sup.enum_type;
  if (sup.class_type) return class_derives(sub.class_type, sup.class_type.get());
  // Every class derives from object.
  if (sup.kind == TypeKind::Class) return true;

  if (sub.enum_type) {
    if (sup.kind == TypeKind::Enum) return true;
    return sub.enum_type->int_backed && kind_derives(TypeKind::Integer, sup.kind);
  }
  if (sub.class_type) return class_derives(*sub.class_type, sup.kind);
  return kind_derives(sub.kind, sup.kind);
}

DeclaredType runtime_type(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::None:
      return TypeKind::None;
    case ValueKind::Bool:
      return TypeKind::Bool;
    case ValueKind::Integer:
      return TypeKind::Integer;
    case ValueKind::Float:
      return TypeKind::Float;
    case ValueKind::Decimal:
      return TypeKind::Decimal;
    case ValueKind::String:
      return TypeKind::String;
    case ValueKind::Bytes:
      return TypeKind::Bytes;
    case ValueKind::ByteArray:
      return TypeKind::ByteArray;
    case ValueKind::Path:
      return TypeKind::Path;
    case ValueKind::List:
      return TypeKind::List;
    case ValueKind::Tuple:
      return TypeKind::Tuple;
    case ValueKind::Set:
      return TypeKind::Set;
    case ValueKind::FrozenSet:
      return TypeKind::FrozenSet;
    case ValueKind::Dict:
      return TypeKind::Dict;
    case ValueKind::EnumMember:
      return DeclaredType::of_enum(value.as_enum_member().type);
    case ValueKind::DateTime:
      return TypeKind::DateTime;
    case ValueKind::Date:
      return TypeKind::Date;
    case ValueKind::TimeDelta:
      return TypeKind::TimeDelta;
    case ValueKind::Object:
      return DeclaredType::of_class(value.as_object().cls);
  }
  return TypeKind::Unknown;
}

bool is_instance(const Value & value, const DeclaredType & type)
{
  return is_subclass(runtime_type(value), type);
}

}  // namespace argconv
