#include <jsonpatch-cpp/value.hpp>

namespace jsonpatch_cpp {

auto kind_of(const Value& v) noexcept -> ValueKind {
    switch (v.type()) {
        case Value::value_t::boolean:         return ValueKind::boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:    return ValueKind::number;
        case Value::value_t::string:          return ValueKind::string;
        case Value::value_t::array:           return ValueKind::array;
        case Value::value_t::object:          return ValueKind::object;
        case Value::value_t::binary:          return ValueKind::binary;
        case Value::value_t::null:
        case Value::value_t::discarded:       return ValueKind::null;
    }
    return ValueKind::null;
}

auto deep_copy(const Value& v) -> Value {
    if (v.is_array()) {
        auto result = Value::array();
        result.get_ref<Value::array_t&>().reserve(v.size());
        for (const auto& element : v) {
            result.push_back(deep_copy(element));
        }
        return result;
    }
    if (v.is_object()) {
        auto result = Value::object();
        for (auto it = v.begin(); it != v.end(); ++it) {
            result.emplace(it.key(), deep_copy(it.value()));
        }
        return result;
    }
    return v;
}

}  // namespace jsonpatch_cpp
