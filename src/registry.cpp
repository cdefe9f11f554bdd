#include <jsonpatch-cpp/extension.hpp>

#include "builtin_extensions.hpp"

#include <jsonpatch-cpp/error.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonpatch_cpp {

auto Registry::standard() -> Registry {
    auto registry = Registry{};
    registry.add(std::make_shared<detail::AddExtension>());
    registry.add(std::make_shared<detail::RemoveExtension>());
    registry.add(std::make_shared<detail::ReplaceExtension>());
    registry.add(std::make_shared<detail::MoveExtension>());
    registry.add(std::make_shared<detail::CopyExtension>());
    registry.add(std::make_shared<detail::TestExtension>());
    return registry;
}

void Registry::add(ExtensionPtr extension) {
    if (!extension) {
        throw std::invalid_argument{"cannot register a null extension"};
    }
    auto name = std::string{extension->name()};
    extensions_.insert_or_assign(std::move(name), std::move(extension));
}

auto Registry::find(std::string_view name) const -> const Extension* {
    auto it = extensions_.find(name);
    return it == extensions_.end() ? nullptr : it->second.get();
}

auto Registry::names() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(extensions_.size());
    for (const auto& [name, _] : extensions_) {
        result.push_back(name);
    }
    return result;
}

}  // namespace jsonpatch_cpp
