/// @file extension.hpp
/// @brief Pluggable operation handlers and the registry that maps names to them.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

class Patch;

/// A handler for one operation name.
///
/// check() runs during Patch::check, before the document is touched, and
/// must only look at the operation itself. apply() performs the edit.
/// Both report failure by throwing Exception; an apply() that wants to
/// halt the remaining patch without signalling a broken patch throws
/// ErrorKind::abort_signal, and one that found nothing to edit throws
/// ErrorKind::path_not_found so lenient patches can skip it.
///
/// @code
/// class IncrementExtension : public Extension {
/// public:
///     auto name() const -> std::string_view override { return "increment"; }
///     void check(const Operation& op) const override { ... }
///     void apply(const Patch& p, Value& doc, const Operation& op) const override {
///         auto found = p.visit_path(doc, Pointer{*op.path}.segments());
///         found.node->get_ref<std::int64_t&>() += op.value->get<std::int64_t>();
///     }
/// };
/// @endcode
class Extension {
public:
    virtual ~Extension() = default;

    /// The operation name this handler serves, e.g. "add".
    virtual auto name() const -> std::string_view = 0;

    /// Static validation, independent of any document.
    virtual void check(const Operation& op) const = 0;

    /// Apply @p op to @p document. Called only for checked operations.
    virtual void apply(const Patch& patch, Value& document, const Operation& op) const = 0;

    /// A human-readable description of @p op for error messages.
    /// Handlers without one are described as "op path".
    virtual auto describe(const Operation&) const -> std::optional<std::string> {
        return std::nullopt;
    }
};

using ExtensionPtr = std::shared_ptr<const Extension>;

/// Name -> handler mapping.
class Registry {
public:
    Registry() = default;

    /// A registry holding the six RFC 6902 operations.
    static auto standard() -> Registry;

    /// Register @p extension under its name, replacing any previous
    /// handler of the same name.
    void add(ExtensionPtr extension);

    /// The handler for @p name, or nullptr.
    auto find(std::string_view name) const -> const Extension*;

    auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

    /// Registered names in sorted order.
    auto names() const -> std::vector<std::string>;

    auto size() const noexcept -> std::size_t { return extensions_.size(); }

private:
    std::map<std::string, ExtensionPtr, std::less<>> extensions_;
};

}  // namespace jsonpatch_cpp
