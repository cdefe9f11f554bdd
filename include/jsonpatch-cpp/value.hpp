/// @file value.hpp
/// @brief The document value model: nlohmann::json plus kind helpers.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

namespace jsonpatch_cpp {

/// A node of a JSON document.
///
/// The tree is nlohmann::json: objects keep their members in a std::map,
/// so re-serialized output lists keys in sorted order regardless of the
/// order the edits were made in.
using Value = nlohmann::json;

/// The kinds of node a document tree is made of.
enum class ValueKind : std::uint8_t {
    null,     ///< JSON null.
    boolean,  ///< true or false.
    number,   ///< Integer, unsigned or floating point number.
    string,   ///< A UTF-8 string.
    array,    ///< An ordered sequence of values.
    object,   ///< A string-keyed mapping of values.
    binary,   ///< nlohmann binary payload; never produced by the JSON parser.
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
        case ValueKind::binary:  return "binary";
    }
    return "unknown";
}

/// Classify a value. Discarded parser results report as null.
auto kind_of(const Value& v) noexcept -> ValueKind;

/// Check if a value is an object or an array.
inline auto is_container(const Value& v) noexcept -> bool {
    return v.is_object() || v.is_array();
}

/// Recursively clone a value.
///
/// Containers are rebuilt element by element, scalars are copied by
/// value. The result shares nothing with the source, so later edits to
/// either side are never visible through the other.
auto deep_copy(const Value& v) -> Value;

}  // namespace jsonpatch_cpp
