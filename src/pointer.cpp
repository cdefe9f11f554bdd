#include <jsonpatch-cpp/pointer.hpp>

#include <jsonpatch-cpp/error.hpp>

namespace jsonpatch_cpp {

auto Pointer::from_segments(const std::vector<std::string>& segments) -> Pointer {
    auto result = std::string{};
    for (const auto& segment : segments) {
        result.push_back('/');
        result += escape(segment);
    }
    return Pointer{std::move(result)};
}

auto Pointer::escape(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto Pointer::unescape(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result.push_back('/');
                ++i;
                continue;
            }
            if (segment[i + 1] == '0') {
                result.push_back('~');
                ++i;
                continue;
            }
        }
        result.push_back(segment[i]);
    }
    return result;
}

void Pointer::check() const {
    if (origin_.empty()) return;
    if (origin_[0] != '/') {
        throw Exception{ErrorKind::malformed_pointer,
                        "json pointer must start with /: \"" + origin_ + "\""};
    }
}

auto Pointer::segments() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    if (origin_.empty()) return result;

    // Everything before the first '/' is dropped, like the empty token a
    // split of "/a/b" starts with.
    auto view = std::string_view{origin_};
    auto pos = view.find('/');
    if (pos == std::string_view::npos) return result;
    ++pos;
    while (true) {
        auto next = view.find('/', pos);
        result.push_back(unescape(view.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return result;
}

auto Pointer::parent_segments() const -> std::vector<std::string> {
    auto result = segments();
    if (!result.empty()) result.pop_back();
    return result;
}

auto Pointer::last_segment() const -> std::string {
    auto result = segments();
    if (result.empty()) return {};
    return std::move(result.back());
}

auto Pointer::same_parent_as(const Pointer& other) const -> bool {
    return parent_segments() == other.parent_segments();
}

}  // namespace jsonpatch_cpp
