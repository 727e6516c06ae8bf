#pragma once

// tierpool/jsonlite.hpp: Minimal strict JSON value model.
//
// Used for two things:
//   - Request parameter sets (opaque key -> value mappings attached to a task).
//   - Canonical serialization: objects are std::map, so to_json() always emits
//     keys in sorted order. Two parameter sets built in different insertion
//     orders serialize byte-identically, which is what the cache fingerprint
//     relies on.
//
// DETERMINISM:
//   - Doubles are rendered by format_double(): "%.6f" with trailing zeros trimmed.
//   - Non-negative integers are held as uint64_t and rendered exactly.
//   - Negative integers parse as double (rendered through format_double()).
//
// EXTENSION_POINT: signed_integer_values
//   Add an int64_t alternative if negative integral parameters need exact
//   round-tripping. Changing the variant changes canonical output: bump
//   FINGERPRINT_SCHEMA_VERSION in version.hpp when doing so.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tierpool::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Strict parse. Duplicate keys, trailing data, NaN/Infinity are errors.
Value parse_value(const std::string& text, std::optional<JsonError>* error);
// Parse and require a top-level object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);
std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);
std::string format_double(double d);
std::string escape(const std::string& s);

// Numeric view of a value: uint64 and double both convert, anything else -> nullopt.
std::optional<double> as_number(const Value& v);

// Type-safe extractors. Return `def` when the key is absent or has another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::vector<double> get_double_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

}  // namespace tierpool::jsonlite
