// argconv/convert/json_export.cpp - JSON serialization for converters and values
//
#include "argconv/convert/json_export.hpp"

#include <cmath>
#include <string>

#include "argconv/basic/text.hpp"
#include "argconv/convert/container_converters.hpp"
#include "argconv/convert/resolution_converters.hpp"

namespace argconv
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

/// Bytes as text, one code point per byte.
std::string latin1_to_utf8(const std::string & bytes)
{
  std::string result;
  for (const char c : bytes) {
    append_utf8(result, static_cast<unsigned char>(c));
  }
  return result;
}

json j_items(const Value::Items & items)
{
  json j = json::array();
  for (const auto & item : items) j.push_back(to_json(item));
  return j;
}

json j_dict(const Value::DictItems & items)
{
  bool string_keys = true;
  for (const auto & [key, item] : items) {
    if (!key.is_string()) {
      string_keys = false;
      break;
    }
  }
  if (string_keys) {
    json j = json::object();
    for (const auto & [key, item] : items) j[key.as_string()] = to_json(item);
    return j;
  }
  json j = json::array();
  for (const auto & [key, item] : items) j.push_back(json::array({to_json(key), to_json(item)}));
  return j;
}

json j_accepts(const Converter & conv)
{
  json j = json::array();
  for (const auto & type : conv.value_types()) j.push_back(type.name());
  if (j.empty()) j.push_back("Any");
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::None:
      return nullptr;
    case ValueKind::Bool:
      return value.as_bool();
    case ValueKind::Integer:
      return value.as_integer();
    case ValueKind::Float:
      if (std::isfinite(value.as_float())) return value.as_float();
      return value.str();
    case ValueKind::String:
    case ValueKind::Path:
      return value.as_string();
    case ValueKind::Bytes:
    case ValueKind::ByteArray:
      return latin1_to_utf8(value.as_string());
    case ValueKind::List:
    case ValueKind::Tuple:
    case ValueKind::Set:
    case ValueKind::FrozenSet:
      return j_items(value.items());
    case ValueKind::Dict:
      return j_dict(value.dict_items());
    default:
      return value.str();
  }
}

nlohmann::json to_json(const Converter & converter)
{
  json j{
    {"name", converter.type_name()},
    {"kind", std::string(to_string(converter.get_kind()))},
    {"accepts", j_accepts(converter)}};

  if (const auto * record = dyn_cast<TypedDictConverter>(&converter)) {
    json fields = json::object();
    for (size_t i = 0; i < record->field_names().size(); ++i) {
      fields[record->field_names()[i]] = to_json(*record->nested()[i]);
    }
    j["fields"] = fields;
    j["required"] = record->required();
    return j;
  }

  json nested = json::array();
  for (const auto & conv : converter.nested()) nested.push_back(to_json(*conv));
  j["nested"] = nested;

  if (const auto * enumeration = dyn_cast<EnumConverter>(&converter)) {
    json members = json::array();
    for (const auto & member : enumeration->enum_type().members) members.push_back(member.name);
    j["members"] = members;
  } else if (isa<LiteralConverter>(&converter)) {
    json members = json::array();
    for (const auto & info : converter.type_info().nested) members.push_back(info.name);
    j["members"] = members;
  }

  if (const auto doc = converter.doc()) {
    j["doc"] = *doc;
  }
  return j;
}

}  // namespace argconv
