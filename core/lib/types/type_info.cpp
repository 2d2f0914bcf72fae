// argconv/types/type_info.cpp - Declared type descriptor tree
//
#include "argconv/types/type_info.hpp"

namespace argconv
{

TypeInfo::TypeInfo(std::string name, DeclaredType type, std::vector<TypeInfo> nested)
: name(std::move(name)), type(std::move(type)), nested(std::move(nested))
{
}

std::string TypeInfo::to_string() const
{
  std::string out;
  if (is_union) {
    for (size_t i = 0; i < nested.size(); ++i) {
      if (i > 0) out += " | ";
      out += nested[i].to_string();
    }
    return out;
  }
  out = name;
  if (!nested.empty()) {
    out += "[";
    for (size_t i = 0; i < nested.size(); ++i) {
      if (i > 0) out += ", ";
      out += nested[i].to_string();
    }
    out += "]";
  }
  return out;
}

TypeInfo TypeInfo::of(TypeKind kind) { return TypeInfo(std::string(argconv::to_string(kind)), kind); }

TypeInfo TypeInfo::any() { return of(TypeKind::Any); }

TypeInfo TypeInfo::ellipsis() { return of(TypeKind::Ellipsis); }

TypeInfo TypeInfo::unknown(std::string name) { return TypeInfo(std::move(name), TypeKind::Unknown); }

TypeInfo TypeInfo::list_of(TypeInfo item)
{
  return TypeInfo("list", TypeKind::List, {std::move(item)});
}

TypeInfo TypeInfo::set_of(TypeInfo item) { return TypeInfo("set", TypeKind::Set, {std::move(item)}); }

TypeInfo TypeInfo::frozenset_of(TypeInfo item)
{
  return TypeInfo("frozenset", TypeKind::FrozenSet, {std::move(item)});
}

TypeInfo TypeInfo::dict_of(TypeInfo key, TypeInfo value)
{
  return TypeInfo("dict", TypeKind::Dict, {std::move(key), std::move(value)});
}

TypeInfo TypeInfo::tuple_of(std::vector<TypeInfo> items)
{
  return TypeInfo("tuple", TypeKind::Tuple, std::move(items));
}

TypeInfo TypeInfo::homogeneous_tuple_of(TypeInfo item)
{
  return TypeInfo("tuple", TypeKind::Tuple, {std::move(item), ellipsis()});
}

TypeInfo TypeInfo::union_of(std::vector<TypeInfo> members)
{
  TypeInfo info("Union", TypeKind::Union, std::move(members));
  info.is_union = true;
  return info;
}

TypeInfo TypeInfo::literal(const std::vector<Value> & constants)
{
  TypeInfo info("Literal", TypeKind::Literal);
  for (const auto & constant : constants) {
    DeclaredType type = DeclaredType::of_constant(constant);
    std::string member_name = type.name();
    info.nested.emplace_back(std::move(member_name), std::move(type));
  }
  return info;
}

TypeInfo TypeInfo::enumeration(std::shared_ptr<const EnumType> type)
{
  std::string name = type ? type->name : "Enum";
  return TypeInfo(std::move(name), DeclaredType::of_enum(std::move(type)));
}

TypeInfo TypeInfo::of_class(std::shared_ptr<const ClassType> type)
{
  std::string name = type ? type->name : "object";
  return TypeInfo(std::move(name), DeclaredType::of_class(std::move(type)));
}

TypeInfo TypeInfo::typed_dict(
  std::string name, std::vector<TypeInfoField> fields, std::set<std::string> required)
{
  TypeInfo info(std::move(name), TypeKind::TypedDict);
  info.is_typed_dict = true;
  info.annotations = std::move(fields);
  info.required = std::move(required);
  return info;
}

}  // namespace argconv
