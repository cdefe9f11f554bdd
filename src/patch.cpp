#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/log.hpp>

#include <fmt/format.h>

#include <utility>

namespace jsonpatch_cpp {

Patch::Patch() : Patch{PatchOptions{}} {}

Patch::Patch(PatchOptions options)
    : options_{std::move(options)}, registry_{Registry::standard()} {
    for (const auto& extension : options_.extensions) {
        registry_.add(extension);
    }
}

auto Patch::describe(const Operation& op) const -> std::string {
    if (op.op) {
        if (const auto* extension = registry_.find(*op.op)) {
            if (auto description = extension->describe(op)) {
                return std::move(*description);
            }
        }
    }
    return op.describe();
}

void Patch::check(const std::vector<Operation>& ops) const {
    for (const auto& op : ops) {
        op.check();
        const auto* extension = registry_.find(*op.op);
        if (!extension) {
            throw Exception{ErrorKind::unknown_operation, "unknown operation: " + *op.op};
        }
        try {
            extension->check(op);
        } catch (const Exception& e) {
            auto j = Value{};
            to_json(j, op);
            throw Exception{e.kind(),
                            fmt::format("{}: {}", e.what(),
                                        j.dump(-1, ' ', false, Value::error_handler_t::replace))};
        }
    }
}

void Patch::apply(Value& document, const std::vector<Operation>& ops) const {
    if (!is_container(document)) {
        throw Exception{ErrorKind::type_mismatch,
                        std::string{"bad type for apply: "} + document.type_name()};
    }
    apply_checked(document, ops);
}

auto Patch::apply(std::string_view document_text, const std::vector<Operation>& ops) const
    -> std::string {
    auto document = Value{};
    try {
        document = Value::parse(document_text);
    } catch (const Value::parse_error& e) {
        throw Exception{ErrorKind::invalid_document,
                        std::string{"cannot decode document: "} + e.what()};
    }
    apply_checked(document, ops);
    return encode(document, options_.output);
}

auto Patch::apply(std::string_view document_text, std::string_view patch_text) const
    -> std::string {
    return apply(document_text, parse_operations(patch_text));
}

void Patch::apply_checked(Value& document, const std::vector<Operation>& ops) const {
    check(ops);
    for (std::size_t i = 0; i < ops.size(); ++i) {
        const auto& op = ops[i];
        const auto* extension = registry_.find(*op.op);
        try {
            extension->apply(*this, document, op);
        } catch (const Exception& e) {
            if (!strict_path_exists() && e.kind() == ErrorKind::path_not_found) {
                JSONPATCH_CPP_LOG_DEBUG("operation {} skipped: {}: {}", i, describe(op), e.what());
                continue;
            }
            const auto description = describe(op);
            if (e.kind() == ErrorKind::abort_signal) {
                JSONPATCH_CPP_LOG_DEBUG("operation {} stopped the patch: {}", i, description);
                throw Exception{ErrorKind::abort_signal,
                                fmt::format("operation stopped: {} ext={}, err={}",
                                            description, extension->name(), e.what())};
            }
            JSONPATCH_CPP_LOG_INFO("operation {} failed: {}: {}", i, description, e.what());
            throw Exception{e.kind(),
                            fmt::format("operation failed: {} ext={}, err={}",
                                        description, extension->name(), e.what())};
        }
    }
}

void apply_patch(Value& document, const std::vector<Operation>& ops, PatchOptions options) {
    Patch{std::move(options)}.apply(document, ops);
}

}  // namespace jsonpatch_cpp
