/// @file operation.hpp
/// @brief The RFC 6902 operation record and its JSON form.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The six operations defined by RFC 6902.
///
/// Extensions may register further names; those have no OpType.
enum class OpType : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpType to its wire name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Map a wire name to an OpType, or nullopt for non-standard names.
auto op_type_from_string(std::string_view name) noexcept -> std::optional<OpType>;

/// One operation of a JSON Patch document.
///
/// Every member is optional so that a decoded record can be validated
/// later with a precise error. @c value distinguishes "absent" from
/// "present and null": `{"value": null}` decodes to a value holding
/// a JSON null, a missing member to std::nullopt.
struct Operation {
    std::optional<std::string> op;    ///< Operation name, e.g. "add".
    std::optional<std::string> path;  ///< Target JSON Pointer.
    std::optional<Value> value;       ///< Operand for add/replace/test.
    std::optional<std::string> from;  ///< Source JSON Pointer for move/copy.

    /// Structural validation shared by every operation.
    ///
    /// Throws missing_required_field when op or path is absent and
    /// malformed_pointer when path or a present from is not a pointer.
    void check() const;

    /// The generic "op path" description used in error messages.
    auto describe() const -> std::string;
};

/// Encode as `{"op", "path"[, "value"][, "from"]}`.
void to_json(Value& j, const Operation& op);

/// Decode leniently: op, path and from are taken only when they are
/// strings, value whenever the member exists. Non-object input yields
/// an operation with every member absent.
void from_json(const Value& j, Operation& op);

/// Decode a JSON Patch document (an array of operation objects).
/// @throws Exception invalid_document on bad JSON text, a non-array
///   document, or a non-object entry.
auto parse_operations(std::string_view text) -> std::vector<Operation>;

/// Decode an already parsed JSON Patch document.
auto to_operations(const Value& patch) -> std::vector<Operation>;

}  // namespace jsonpatch_cpp
