#include <jsonpatch-cpp/setter.hpp>

#include <jsonpatch-cpp/error.hpp>

namespace jsonpatch_cpp {

namespace {

template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // anonymous namespace

void Setter::operator()(Value v) const {
    target() = std::move(v);
}

auto Setter::target() const -> Value& {
    return std::visit(overload{
        [](const RootSlot& s) -> Value& { return *s.root; },
        [](const ObjectSlot& s) -> Value& {
            auto it = s.object->find(s.key);
            if (it == s.object->end()) {
                throw Exception{ErrorKind::path_not_found,
                                "path member not exists: " + s.key};
            }
            return *it;
        },
        [](const ArraySlot& s) -> Value& {
            if (s.index >= s.array->size()) {
                throw Exception{ErrorKind::path_not_found,
                                "path member not exists: " + std::to_string(s.index)};
            }
            return (*s.array)[s.index];
        },
    }, slot_);
}

}  // namespace jsonpatch_cpp
