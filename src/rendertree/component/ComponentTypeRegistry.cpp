#include <rendertree/component/ComponentTypeRegistry.hpp>

#include "log/TaggedLogger.hpp"

namespace RT {

auto ComponentTypeRegistry::add(ComponentType type) -> Expected<void> {
    if (!type.valid()) {
        return std::unexpected(Error{Error::Code::InvalidComponentType, "cannot register a component type that is not instantiable"});
    }
    if (type.name().empty()) {
        return std::unexpected(Error{Error::Code::InvalidComponentType, "component type name is empty"});
    }
    auto const [it, inserted] = this->types.try_emplace(type.name(), type);
    if (!inserted && !(it->second == type)) {
        rt_log("Component name " + type.name() + " already registered with another type", "ComponentTypeRegistry", "ERROR");
        return std::unexpected(Error{Error::Code::InvalidComponentType,
                                     "component name " + type.name() + " is already registered with a different type"});
    }
    return {};
}

auto ComponentTypeRegistry::find(std::string_view name) const -> Expected<ComponentType> {
    auto const it = this->types.find(std::string(name));
    if (it == this->types.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "no component registered as " + std::string(name)});
    }
    return it->second;
}

auto ComponentTypeRegistry::instantiate(std::string_view name) const -> Expected<std::unique_ptr<Component>> {
    auto type = this->find(name);
    if (!type) {
        return std::unexpected(type.error());
    }
    return type->instantiate();
}

} // namespace RT
