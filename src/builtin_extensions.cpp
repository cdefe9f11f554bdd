#include "builtin_extensions.hpp"

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <utility>
#include <vector>

namespace jsonpatch_cpp::detail {

namespace {

void require_value(const Operation& op, std::string_view name) {
    if (!op.value) {
        throw Exception{ErrorKind::missing_required_field,
                        "operation " + std::string{name} + " must contain a value member"};
    }
}

void require_from(const Operation& op, std::string_view name) {
    if (!op.from) {
        throw Exception{ErrorKind::missing_required_field,
                        "operation " + std::string{name} + " must contain a from member"};
    }
}

auto to_text(const Value& v) -> std::string {
    return v.dump(-1, ' ', false, Value::error_handler_t::replace);
}

auto resolve_error(const std::string& pointer, const Exception& cause) -> Exception {
    return Exception{cause.kind(), "cannot resolve " + pointer + ": " + cause.what()};
}

// Visit @p segments, naming @p pointer in the error while keeping its kind.
auto resolve(const Patch& patch, Value& document,
             const std::vector<std::string>& segments,
             const std::string& pointer) -> Location {
    try {
        return patch.visit_path(document, segments);
    } catch (const Exception& e) {
        throw resolve_error(pointer, e);
    }
}

}  // anonymous namespace

// -- add ----------------------------------------------------------------------

void AddExtension::check(const Operation& op) const {
    require_value(op, name());
}

void AddExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    if (path.is_whole_document()) {
        patch.visit_path(document, {}).setter(*op.value);
        return;
    }
    auto parent = resolve(patch, document, path.parent_segments(), *op.path);
    patch.add_value(*parent.node, path.last_segment(), *op.value);
}

// -- remove -------------------------------------------------------------------

void RemoveExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    auto parent = resolve(patch, document, path.parent_segments(), *op.path);
    patch.remove_value(*parent.node, path.last_segment());
}

// -- replace ------------------------------------------------------------------

void ReplaceExtension::check(const Operation& op) const {
    require_value(op, name());
}

void ReplaceExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    if (path.is_whole_document()) {
        patch.visit_path(document, {}).setter(*op.value);
        return;
    }
    auto parent = resolve(patch, document, path.parent_segments(), *op.path);
    patch.replace_value(*parent.node, path.last_segment(), *op.value);
}

// -- move ---------------------------------------------------------------------

void MoveExtension::check(const Operation& op) const {
    require_from(op, name());
}

void MoveExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    const auto from = Pointer{*op.from};
    const auto from_last = from.last_segment();

    auto from_parent = resolve(patch, document, from.parent_segments(), *op.from);
    Value* source = nullptr;
    try {
        source = patch.visit_path_part(*from_parent.node, from_last).node;
    } catch (const Exception& e) {
        if (patch.strict_path_exists()) throw resolve_error(*op.from, e);
        JSONPATCH_CPP_LOG_DEBUG("move: nothing at {}, skipped ({})", *op.from, e.what());
        return;
    }

    if (path.same_parent_as(from)) {
        patch.move_value(*from_parent.node, from_last, path.last_segment());
        return;
    }

    auto value = std::move(*source);
    patch.remove_value(*from_parent.node, from_last);
    auto parent = resolve(patch, document, path.parent_segments(), *op.path);
    patch.add_value(*parent.node, path.last_segment(), std::move(value));
}

auto MoveExtension::describe(const Operation& op) const -> std::optional<std::string> {
    return "move " + op.from.value_or("") + " to " + op.path.value_or("");
}

// -- copy ---------------------------------------------------------------------

void CopyExtension::check(const Operation& op) const {
    require_from(op, name());
}

void CopyExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    const auto from = Pointer{*op.from};
    auto parent = resolve(patch, document, path.parent_segments(), *op.path);
    auto source = resolve(patch, document, from.segments(), *op.from);
    patch.add_value(*parent.node, path.last_segment(), deep_copy(*source.node));
}

auto CopyExtension::describe(const Operation& op) const -> std::optional<std::string> {
    return "copy " + op.path.value_or("") + " from " + op.from.value_or("");
}

// -- test ---------------------------------------------------------------------

void TestExtension::check(const Operation& op) const {
    require_value(op, name());
}

void TestExtension::apply(const Patch& patch, Value& document, const Operation& op) const {
    const auto path = Pointer{*op.path};
    const Value* current = nullptr;
    try {
        current = patch.visit_path(document, path.segments()).node;
    } catch (const Exception& e) {
        if (patch.strict_path_exists()) throw resolve_error(*op.path, e);
        throw Exception{ErrorKind::abort_signal,
                        "test: nothing at " + *op.path + " (" + e.what() + ")"};
    }
    if (*current != *op.value) {
        throw Exception{ErrorKind::abort_signal,
                        "test: value at " + *op.path + " is " + to_text(*current) +
                            ", expected " + to_text(*op.value)};
    }
}

}  // namespace jsonpatch_cpp::detail
