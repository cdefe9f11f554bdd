// Internal header: the six RFC 6902 operation handlers.
// Not part of the public API; Registry::standard() is the public entry.

#pragma once

#include <jsonpatch-cpp/extension.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace jsonpatch_cpp::detail {

class AddExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "add"; }
    void check(const Operation& op) const override;
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
};

class RemoveExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "remove"; }
    void check(const Operation&) const override {}
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
};

class ReplaceExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "replace"; }
    void check(const Operation& op) const override;
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
};

class MoveExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "move"; }
    void check(const Operation& op) const override;
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
    auto describe(const Operation& op) const -> std::optional<std::string> override;
};

class CopyExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "copy"; }
    void check(const Operation& op) const override;
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
    auto describe(const Operation& op) const -> std::optional<std::string> override;
};

/// Compares the addressed value with the operand; a mismatch, or a
/// missing path in lenient mode, raises abort_signal.
class TestExtension final : public Extension {
public:
    auto name() const -> std::string_view override { return "test"; }
    void check(const Operation& op) const override;
    void apply(const Patch& patch, Value& document, const Operation& op) const override;
};

}  // namespace jsonpatch_cpp::detail
