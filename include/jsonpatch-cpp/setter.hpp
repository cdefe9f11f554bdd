/// @file setter.hpp
/// @brief Setter: a handle to one addressable slot of a document tree.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

/// The document root itself.
struct RootSlot {
    Value* root;
};

/// The member @c key of an object.
struct ObjectSlot {
    Value* object;
    std::string key;
};

/// The element at @c index of an array.
struct ArraySlot {
    Value* array;
    std::size_t index;
};

using Slot = std::variant<RootSlot, ObjectSlot, ArraySlot>;

/// Overwrites exactly one slot of a tree: an object member, an array
/// element, or the root reference.
///
/// Setters are produced by Patch::visit_path while walking a document
/// and stay valid until the container that owns the slot is
/// restructured (an insert or erase in the parent array, or removal of
/// the parent itself).
class Setter {
public:
    explicit Setter(Value& root) : slot_{RootSlot{&root}} {}
    Setter(Value& object, std::string key) : slot_{ObjectSlot{&object, std::move(key)}} {}
    Setter(Value& array, std::size_t index) : slot_{ArraySlot{&array, index}} {}

    /// Replace the value held in the slot.
    void operator()(Value v) const;

    /// The value currently held in the slot.
    auto target() const -> Value&;

    auto slot() const noexcept -> const Slot& { return slot_; }

    auto is_root() const noexcept -> bool {
        return std::holds_alternative<RootSlot>(slot_);
    }

private:
    Slot slot_;
};

}  // namespace jsonpatch_cpp
