// argconv/convert/json_export.hpp - JSON serialization for converters and values
//
// Describes converter trees for documentation tools:
//
//   {"name": "list[int]", "kind": "list", "accepts": ["str", "Sequence"],
//    "nested": [{"name": "integer", "kind": "integer", ...}]}
//
#pragma once

#include <nlohmann/json.hpp>

#include "argconv/convert/converter.hpp"

namespace argconv
{

/**
 * Serialize a converter tree.
 *
 * Records add "fields" and "required", enums and literals "members" and
 * documented custom converters "doc".
 */
[[nodiscard]] nlohmann::json to_json(const Converter & converter);

/**
 * Serialize a value.
 *
 * Collections become arrays and string-keyed dicts objects; other dicts
 * become arrays of [key, value] pairs. Values without a JSON counterpart
 * (decimals, dates, non-finite floats, enum members, ...) become their
 * str() form.
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

}  // namespace argconv
