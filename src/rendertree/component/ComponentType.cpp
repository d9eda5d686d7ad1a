#include <rendertree/component/ComponentType.hpp>

namespace RT {

auto ComponentType::instantiate() const -> Expected<std::unique_ptr<Component>> {
    if (!this->valid()) {
        return std::unexpected(Error{Error::Code::InvalidComponentType, "component type is not instantiable"});
    }
    auto instance = this->factory_();
    if (!instance) {
        return std::unexpected(Error{Error::Code::InvalidComponentType, "factory for " + this->name_ + " returned no instance"});
    }
    return instance;
}

} // namespace RT
