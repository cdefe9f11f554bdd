// Patch navigation: the array index grammar and path walking.

#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>

namespace jsonpatch_cpp {

namespace {

/// "0" or [1-9][0-9]*: RFC 6901 forbids leading zeros.
auto is_canonical_decimal(std::string_view digits) -> bool {
    if (digits.empty()) return false;
    if (digits.size() > 1 && digits[0] == '0') return false;
    return std::ranges::all_of(digits, [](char c) { return c >= '0' && c <= '9'; });
}

auto out_of_range(std::size_t size, std::string_view token) -> Exception {
    return Exception{ErrorKind::index_out_of_range,
                     "array index out of range: size=" + std::to_string(size) + ", " +
                         std::string{token}};
}

auto not_found(const std::string& segment) -> Exception {
    return Exception{ErrorKind::path_not_found, "path member not exists: " + segment};
}

}  // anonymous namespace

auto Patch::parse_array_index(std::size_t size, std::string_view token) const -> std::size_t {
    if (token == "-") return size;

    auto digits = token;
    auto negative = false;
    if (options_.support_negative_array_index && !digits.empty() && digits.front() == '-') {
        negative = true;
        digits.remove_prefix(1);
    }
    if (!is_canonical_decimal(digits)) {
        throw Exception{ErrorKind::bad_index_syntax, "bad array index: " + std::string{token}};
    }

    auto magnitude = std::uint64_t{0};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw out_of_range(size, token);
    }
    if (magnitude > size) {
        throw out_of_range(size, token);
    }
    // "-0" is zero, not the append position.
    if (negative && magnitude > 0) {
        return size - static_cast<std::size_t>(magnitude);
    }
    return static_cast<std::size_t>(magnitude);
}

auto Patch::visit_path_part(Value& node, const std::string& segment) const -> Location {
    if (node.is_object()) {
        auto it = node.find(segment);
        if (it == node.end()) throw not_found(segment);
        return Location{&*it, Setter{node, segment}};
    }
    if (node.is_array()) {
        if (node.empty()) throw not_found(segment);
        auto index = parse_array_index(node.size(), segment);
        if (index == node.size()) throw not_found(segment);
        return Location{&node[index], Setter{node, index}};
    }
    throw Exception{ErrorKind::type_mismatch, std::string{"cannot visit type: "} + node.type_name()};
}

auto Patch::visit_path(Value& root, const std::vector<std::string>& segments) const -> Location {
    auto location = Location{&root, Setter{root}};
    for (const auto& segment : segments) {
        location = visit_path_part(*location.node, segment);
    }
    return location;
}

}  // namespace jsonpatch_cpp
