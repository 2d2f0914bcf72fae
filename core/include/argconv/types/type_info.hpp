// argconv/types/type_info.hpp - Declared type descriptor tree
//
// A TypeInfo describes the type a value should be converted to: the primary
// type, its generic parameters (or record fields) and how to display it.
// Descriptors are built by the caller; nothing here parses type strings.
//
#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "argconv/types/declared_type.hpp"

namespace argconv
{

struct TypeInfoField;

class TypeInfo
{
public:
  std::string name;
  DeclaredType type;

  /// Generic parameters in declaration order
  std::vector<TypeInfo> nested;

  /// Treat as `a | b | ...` over `nested`
  bool is_union = false;

  /// Treat as a record with `annotations` and `required`
  bool is_typed_dict = false;
  std::vector<TypeInfoField> annotations;
  std::set<std::string> required;

  TypeInfo() = default;
  TypeInfo(std::string name, DeclaredType type, std::vector<TypeInfo> nested = {});

  /// "name[nested, ...]", or "a | b" for unions.
  [[nodiscard]] std::string to_string() const;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  /// Plain built-in or abstract type named after its kind.
  [[nodiscard]] static TypeInfo of(TypeKind kind);

  [[nodiscard]] static TypeInfo any();
  [[nodiscard]] static TypeInfo ellipsis();

  /// A type nothing can convert to, e.g. an unsupported application type.
  [[nodiscard]] static TypeInfo unknown(std::string name);

  [[nodiscard]] static TypeInfo list_of(TypeInfo item);
  [[nodiscard]] static TypeInfo set_of(TypeInfo item);
  [[nodiscard]] static TypeInfo frozenset_of(TypeInfo item);
  [[nodiscard]] static TypeInfo dict_of(TypeInfo key, TypeInfo value);

  /// Fixed-arity tuple, one type per position.
  [[nodiscard]] static TypeInfo tuple_of(std::vector<TypeInfo> items);

  /// `tuple[T, ...]`
  [[nodiscard]] static TypeInfo homogeneous_tuple_of(TypeInfo item);

  [[nodiscard]] static TypeInfo union_of(std::vector<TypeInfo> members);
  [[nodiscard]] static TypeInfo literal(const std::vector<Value> & constants);

  [[nodiscard]] static TypeInfo enumeration(std::shared_ptr<const EnumType> type);
  [[nodiscard]] static TypeInfo of_class(std::shared_ptr<const ClassType> type);

  [[nodiscard]] static TypeInfo typed_dict(
    std::string name, std::vector<TypeInfoField> fields, std::set<std::string> required);
};

/// One declared field of a record type.
struct TypeInfoField
{
  std::string name;
  TypeInfo type;
};

}  // namespace argconv
