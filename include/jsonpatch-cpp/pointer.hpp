/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901).

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

/// An RFC 6901 JSON Pointer.
///
/// Holds the original, still escaped string. Segment accessors derive
/// everything from it and never fail; syntax is only enforced by check(),
/// which the patch engine runs once per operation before using the pointer.
///
/// @code
/// auto p = Pointer{"/a~1b/0"};
/// p.segments();        // {"a/b", "0"}
/// p.parent_segments(); // {"a/b"}
/// p.last_segment();    // "0"
/// @endcode
class Pointer {
public:
    /// The empty pointer: the whole document.
    Pointer() = default;

    explicit Pointer(std::string pointer) : origin_{std::move(pointer)} {}

    /// Build a pointer by escaping and joining @p segments.
    static auto from_segments(const std::vector<std::string>& segments) -> Pointer;

    /// Escape one reference token: '~' -> "~0", '/' -> "~1".
    static auto escape(std::string_view segment) -> std::string;

    /// Unescape one reference token: "~1" -> '/', then "~0" -> '~'.
    ///
    /// Done in a single left-to-right pass, so "~01" becomes "~1" and
    /// is never turned into '/'.
    static auto unescape(std::string_view segment) -> std::string;

    /// Throw Exception{malformed_pointer} unless empty or starting with '/'.
    void check() const;

    /// The original string.
    auto str() const noexcept -> const std::string& { return origin_; }

    /// True iff the pointer is "", i.e. the whole document.
    auto is_whole_document() const noexcept -> bool { return origin_.empty(); }

    /// The unescaped reference tokens. "" has none, "/" has one empty token.
    auto segments() const -> std::vector<std::string>;

    /// All segments but the last; empty for zero or one segments.
    auto parent_segments() const -> std::vector<std::string>;

    /// The final segment, or "" when there are none.
    auto last_segment() const -> std::string;

    /// Check if both pointers have segment-wise equal parents.
    auto same_parent_as(const Pointer& other) const -> bool;

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::string origin_;
};

}  // namespace jsonpatch_cpp
