/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur while checking or applying a patch.
enum class ErrorKind : std::uint8_t {
    malformed_pointer,       ///< A JSON Pointer is neither empty nor starts with '/'.
    unknown_operation,       ///< The op name is not in the registry.
    missing_required_field,  ///< op/path/value/from absent where the operation needs it.
    bad_index_syntax,        ///< An array index token does not match the index grammar.
    index_out_of_range,      ///< A resolved array index lies outside [0, size].
    type_mismatch,           ///< A container operation was attempted on the wrong kind.
    path_not_found,          ///< The addressed location does not exist (recoverable).
    abort_signal,            ///< Intentional early termination, e.g. a failed "test".
    invalid_document,        ///< JSON text could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_pointer:      return "malformed_pointer";
        case ErrorKind::unknown_operation:      return "unknown_operation";
        case ErrorKind::missing_required_field: return "missing_required_field";
        case ErrorKind::bad_index_syntax:       return "bad_index_syntax";
        case ErrorKind::index_out_of_range:     return "index_out_of_range";
        case ErrorKind::type_mismatch:          return "type_mismatch";
        case ErrorKind::path_not_found:         return "path_not_found";
        case ErrorKind::abort_signal:           return "abort_signal";
        case ErrorKind::invalid_document:       return "invalid_document";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown by every failing check or apply step.
///
/// Derives from std::runtime_error so callers that only care about
/// "the patch did not apply" can catch that; callers that need to
/// tell a stopped patch from a broken one inspect kind().
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace jsonpatch_cpp
