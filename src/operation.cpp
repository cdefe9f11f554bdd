#include <jsonpatch-cpp/operation.hpp>

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <array>
#include <string>
#include <utility>

namespace jsonpatch_cpp {

namespace {

constexpr auto standard_ops = std::array{
    OpType::add, OpType::remove, OpType::replace,
    OpType::move, OpType::copy, OpType::test,
};

// Take @p key from @p j only when it holds a string.
auto string_member(const Value& j, const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}  // anonymous namespace

auto op_type_from_string(std::string_view name) noexcept -> std::optional<OpType> {
    for (auto type : standard_ops) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

void Operation::check() const {
    if (!op) {
        throw Exception{ErrorKind::missing_required_field, "operation must contain an op member"};
    }
    if (!path) {
        throw Exception{ErrorKind::missing_required_field, "operation must contain a path member"};
    }
    Pointer{*path}.check();
    if (from) {
        Pointer{*from}.check();
    }
}

auto Operation::describe() const -> std::string {
    return op.value_or("") + " " + path.value_or("");
}

void to_json(Value& j, const Operation& op) {
    j = Value::object();
    if (op.op) j["op"] = *op.op;
    if (op.path) j["path"] = *op.path;
    if (op.value) j["value"] = *op.value;
    if (op.from) j["from"] = *op.from;
}

void from_json(const Value& j, Operation& op) {
    op = Operation{};
    if (!j.is_object()) return;
    op.op = string_member(j, "op");
    op.path = string_member(j, "path");
    op.from = string_member(j, "from");
    if (auto it = j.find("value"); it != j.end()) {
        op.value = *it;
    }
}

auto parse_operations(std::string_view text) -> std::vector<Operation> {
    auto patch = Value{};
    try {
        patch = Value::parse(text);
    } catch (const Value::parse_error& e) {
        throw Exception{ErrorKind::invalid_document,
                        std::string{"cannot decode json patch: "} + e.what()};
    }
    return to_operations(patch);
}

auto to_operations(const Value& patch) -> std::vector<Operation> {
    if (!patch.is_array()) {
        throw Exception{ErrorKind::invalid_document,
                        std::string{"json patch must be an array, got "} + patch.type_name()};
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        const auto& entry = patch[i];
        if (!entry.is_object()) {
            throw Exception{ErrorKind::invalid_document,
                            "json patch entry " + std::to_string(i) + " must be an object, got " +
                                entry.type_name()};
        }
        ops.push_back(entry.get<Operation>());
    }
    return ops;
}

}  // namespace jsonpatch_cpp
