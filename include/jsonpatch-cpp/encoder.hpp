/// @file encoder.hpp
/// @brief Serialization of patched documents with configurable layout.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// Layout of the text produced by the text-in/text-out entry point.
struct OutputFormat {
    /// Written at the start of every line after the first.
    std::string prefix{};
    /// Repeated once per nesting level. With prefix and indent both
    /// empty the output is compact.
    std::string indent{};
    /// Escape '<', '>' and '&' as \u003c, \u003e and \u0026.
    bool escape_html{false};

    auto operator==(const OutputFormat&) const -> bool = default;
};

/// Serialize @p value according to @p format.
///
/// The output always ends with a newline. Object members are written in
/// sorted key order. U+2028 and U+2029 are always escaped so the output
/// is safe to embed in JavaScript; invalid UTF-8 is replaced by U+FFFD.
auto encode(const Value& value, const OutputFormat& format = {}) -> std::string;

/// Re-indent compact JSON text.
///
/// Each element of a non-empty object or array starts on a new line made
/// of @p prefix and one @p indent per nesting level; keys are followed by
/// ": ". Empty containers stay on one line.
auto indent_json(std::string_view compact, std::string_view prefix,
                 std::string_view indent) -> std::string;

}  // namespace jsonpatch_cpp
