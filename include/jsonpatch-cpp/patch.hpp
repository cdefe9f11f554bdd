/// @file patch.hpp
/// @brief The Patch class -- the primary API for jsonpatch-cpp.

#pragma once

#include <jsonpatch-cpp/encoder.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/extension.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/setter.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// Construction-time configuration of a Patch.
///
/// The defaults give exact RFC 6902 behaviour.
///
/// @code
/// auto lenient = Patch{PatchOptions{
///     .strict_path_exists = false,
///     .support_negative_array_index = true,
/// }};
/// @endcode
struct PatchOptions {
    /// Operations addressing a missing path fail; when false they are
    /// skipped silently.
    bool strict_path_exists{true};
    /// Accept array indices counted from the end ("-1" is the last element).
    bool support_negative_array_index{false};
    /// Layout of the text produced by apply(std::string_view, ...).
    OutputFormat output{};
    /// Additional handlers. One named like a standard operation replaces it.
    std::vector<ExtensionPtr> extensions{};
};

/// A node found by Patch::visit_path and the slot it lives in.
struct Location {
    Value* node;    ///< The visited node.
    Setter setter;  ///< Overwrites the node in its parent (or the root).
};

/// Applies RFC 6902 JSON Patches to documents.
///
/// A Patch owns its options and operation registry and never changes
/// after construction, so one instance can serve any number of threads
/// as long as each patches a different document.
///
/// Application is two-phase: check() validates every operation without
/// touching the document, then each operation runs in list order and
/// sees the edits of the ones before it. A failing operation stops the
/// patch; earlier edits stay applied.
///
/// @code
/// auto doc = Value::parse(R"({"a": [1, 2, 3]})");
/// auto ops = parse_operations(R"([{"op": "add", "path": "/a/1", "value": 9}])");
/// Patch{}.apply(doc, ops);   // {"a": [1, 9, 2, 3]}
/// @endcode
class Patch {
public:
    /// Standard operations, strict paths, no negative indices.
    Patch();

    explicit Patch(PatchOptions options);

    auto options() const noexcept -> const PatchOptions& { return options_; }
    auto registry() const noexcept -> const Registry& { return registry_; }
    auto strict_path_exists() const noexcept -> bool { return options_.strict_path_exists; }
    auto support_negative_array_index() const noexcept -> bool {
        return options_.support_negative_array_index;
    }

    // -- Orchestration --------------------------------------------------------

    /// Validate @p ops without touching any document.
    ///
    /// Per operation, in order: op and path present, path and from are
    /// valid pointers, the op is registered, and its handler accepts it.
    /// @throws Exception on the first invalid operation.
    void check(const std::vector<Operation>& ops) const;

    /// Check @p ops, then apply them to @p document in place.
    ///
    /// The root must be an object or an array. With strict_path_exists
    /// off, operations failing with path_not_found are skipped.
    /// @throws Exception type_mismatch for a scalar root, any check()
    ///   error, or the first failing operation's error; abort_signal
    ///   failures read "operation stopped", others "operation failed".
    void apply(Value& document, const std::vector<Operation>& ops) const;

    /// Decode @p document_text, apply @p ops and encode the result with
    /// options().output. Scalar roots are accepted here.
    /// @throws Exception invalid_document for undecodable text, otherwise
    ///   as apply(Value&, ...).
    auto apply(std::string_view document_text, const std::vector<Operation>& ops) const
        -> std::string;

    /// As above with the patch given as JSON text.
    auto apply(std::string_view document_text, std::string_view patch_text) const
        -> std::string;

    /// The description used for @p op in error messages.
    auto describe(const Operation& op) const -> std::string;

    // -- Navigation -----------------------------------------------------------

    /// Resolve an array index token against an array of @p size elements.
    ///
    /// "-" is the append position. Otherwise the token must be a decimal
    /// without leading zeros (optionally negative when negative indices
    /// are enabled; negatives count from the end). The result lies in
    /// [0, size]; size itself is the append position.
    /// @throws Exception bad_index_syntax or index_out_of_range.
    auto parse_array_index(std::size_t size, std::string_view token) const -> std::size_t;

    /// Descend one level from @p node.
    /// @throws Exception path_not_found for a missing key, an empty array
    ///   or the append position; type_mismatch for a scalar; index errors.
    auto visit_path_part(Value& node, const std::string& segment) const -> Location;

    /// Walk @p segments from @p root. No segments yields the root itself
    /// with a setter that rebinds the root.
    auto visit_path(Value& root, const std::vector<std::string>& segments) const -> Location;

    // -- Mutators -------------------------------------------------------------

    /// Object: set @p key. Array: insert before index @p key, shifting
    /// later elements right (append at the append position).
    void add_value(Value& container, const std::string& key, Value value) const;

    /// Object: overwrite @p key (strict: it must exist). Array: overwrite
    /// the element; the append position is path_not_found when strict and
    /// a no-op otherwise.
    void replace_value(Value& container, const std::string& key, Value value) const;

    /// Object: erase @p key (strict: it must exist). Array: erase the
    /// element, shifting later elements left; a bad token or the append
    /// position is path_not_found when strict and a no-op otherwise.
    void remove_value(Value& container, const std::string& key) const;

    /// Reposition a child of @p container from @p from to @p to.
    ///
    /// Object: rename the member. Array: both indices are resolved
    /// against the current length, the element is erased at @p from and
    /// inserted at @p to (clamped to the shortened length).
    void move_value(Value& container, const std::string& from, const std::string& to) const;

private:
    void apply_checked(Value& document, const std::vector<Operation>& ops) const;

    PatchOptions options_;
    Registry registry_;
};

/// Apply @p ops to @p document with a Patch built from @p options.
void apply_patch(Value& document, const std::vector<Operation>& ops,
                 PatchOptions options = {});

}  // namespace jsonpatch_cpp
