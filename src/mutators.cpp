// Patch mutators: per-container edit semantics of add, replace, remove
// and same-parent move.

#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

namespace jsonpatch_cpp {

namespace {

auto not_found(const std::string& key) -> Exception {
    return Exception{ErrorKind::path_not_found, "path member not exists: " + key};
}

auto bad_type(std::string_view action, const Value& container) -> Exception {
    return Exception{ErrorKind::type_mismatch,
                     "bad type for " + std::string{action} + ": " + container.type_name()};
}

auto at(Value& array, std::size_t index) {
    return std::next(array.begin(), static_cast<std::ptrdiff_t>(index));
}

}  // anonymous namespace

void Patch::add_value(Value& container, const std::string& key, Value value) const {
    if (container.is_object()) {
        container[key] = std::move(value);
        return;
    }
    if (container.is_array()) {
        auto index = parse_array_index(container.size(), key);
        container.insert(at(container, index), std::move(value));
        return;
    }
    throw bad_type("add", container);
}

void Patch::replace_value(Value& container, const std::string& key, Value value) const {
    if (container.is_object()) {
        if (strict_path_exists() && !container.contains(key)) {
            throw not_found(key);
        }
        container[key] = std::move(value);
        return;
    }
    if (container.is_array()) {
        auto index = parse_array_index(container.size(), key);
        if (index == container.size()) {
            if (strict_path_exists()) throw not_found(key);
            return;
        }
        container[index] = std::move(value);
        return;
    }
    throw bad_type("replace", container);
}

void Patch::remove_value(Value& container, const std::string& key) const {
    if (container.is_object()) {
        if (strict_path_exists() && !container.contains(key)) {
            throw not_found(key);
        }
        container.erase(key);
        return;
    }
    if (container.is_array()) {
        auto index = container.size();
        try {
            index = parse_array_index(container.size(), key);
        } catch (const Exception&) {
            if (strict_path_exists()) throw not_found(key);
            return;
        }
        if (index == container.size()) {
            if (strict_path_exists()) throw not_found(key);
            return;
        }
        container.erase(index);
        return;
    }
    throw bad_type("remove", container);
}

void Patch::move_value(Value& container, const std::string& from, const std::string& to) const {
    if (container.is_object()) {
        auto it = container.find(from);
        if (it == container.end()) {
            if (strict_path_exists()) throw not_found(from);
            return;
        }
        auto element = std::move(*it);
        container.erase(it);
        container[to] = std::move(element);
        return;
    }
    if (container.is_array()) {
        const auto size = container.size();
        auto from_index = size;
        auto to_index = size;
        try {
            from_index = parse_array_index(size, from);
            to_index = parse_array_index(size, to);
        } catch (const Exception&) {
            if (strict_path_exists()) throw not_found(from);
            return;
        }
        if (from_index == to_index) return;
        if (from_index == size) {
            if (strict_path_exists()) throw not_found(from);
            return;
        }
        auto element = std::move(container[from_index]);
        container.erase(from_index);
        // The append position of the original length is one past the end now.
        to_index = std::min(to_index, container.size());
        container.insert(at(container, to_index), std::move(element));
        return;
    }
    throw bad_type("move", container);
}

}  // namespace jsonpatch_cpp
