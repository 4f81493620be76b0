#include <propmap/property/class_registry.h>
#include <propmap/types/type_registry.h>
#include <propmap/util/errors.h>

#include <boost/core/demangle.hpp>

#include <algorithm>

namespace propmap {

ClassRegistry& ClassRegistry::instance() {
    static ClassRegistry registry;
    return registry;
}

ClassDefinition* ClassRegistry::find(std::type_index cls) {
    auto it = _definitions.find(cls);
    return it != _definitions.end() ? it->second.get() : nullptr;
}

const ClassDefinition* ClassRegistry::find(std::type_index cls) const {
    auto it = _definitions.find(cls);
    return it != _definitions.end() ? it->second.get() : nullptr;
}

const ClassDefinition* ClassRegistry::resolve(const PropertyObject& self) const {
    if (auto definition = find(self.class_id())) { return definition; }

    // Classes defined along one inheritance chain nest, the deepest matching one is the most derived
    const ClassDefinition* best{nullptr};
    size_t best_depth{0};
    for (const auto& [id, definition] : _definitions) {
        if (!definition->is_instance || !definition->is_instance(self)) { continue; }
        size_t depth{0};
        for (auto base = find_base(*definition); base != nullptr; base = find_base(*base)) { ++depth; }
        if (best == nullptr || depth > best_depth || (depth == best_depth && definition->name < best->name)) {
            best = definition.get();
            best_depth = depth;
        }
    }
    return best;
}

const ClassDefinition* ClassRegistry::find_base(const ClassDefinition& definition) const {
    return definition.base ? find(*definition.base) : nullptr;
}

const ClassDefinition* ClassRegistry::find_decorated(const ClassDefinition* definition) const {
    while (definition != nullptr && !definition->is_decorated()) { definition = find_base(*definition); }
    return definition;
}

const Accessor* ClassRegistry::find_accessor(const ClassDefinition* definition, std::string_view accessor_name) const {
    for (; definition != nullptr; definition = find_base(*definition)) {
        if (auto accessor = definition->find_accessor(accessor_name)) { return accessor; }
    }
    return nullptr;
}

const ClassDefinition& ClassRegistry::get(std::type_index cls) const {
    if (auto definition = find(cls)) { return *definition; }
    throw_error<usage_error>("'{}' has not been defined", boost::core::demangle(cls.name()));
}

std::unique_ptr<PropertyObject> ClassRegistry::construct(std::type_index cls, const Value& payload) const {
    const auto& definition = get(cls);
    if (!definition.is_output_type() || !definition.factory) {
        throw_error<usage_error>("'{}' is not an output type that can be constructed from a payload",
                                 definition.name);
    }
    return definition.factory(payload);
}

ClassDefinition& ClassRegistry::insert(std::unique_ptr<ClassDefinition> definition, type_expr_ptr type) {
    auto& registry = TypeRegistry::instance();
    const auto& name = definition->name;
    registry.register_named(name, type);
    if (auto pos = name.rfind("::"); pos != std::string::npos) {
        registry.register_named(std::string_view(name).substr(pos + 2), type);
    }
    auto [it, inserted] = _definitions.emplace(definition->id, std::move(definition));
    return *it->second;
}

void ClassRegistry::add_observer(registration_observer_s_ptr observer) {
    if (!observer) { throw_error<invalid_argument_error>("Observer must not be null"); }
    _observers.push_back(std::move(observer));
}

void ClassRegistry::remove_observer(const registration_observer_s_ptr& observer) {
    auto it = std::ranges::find(_observers, observer);
    if (it != _observers.end()) { _observers.erase(it); }
}

void ClassRegistry::notify_before_decorate(const ClassDefinition& definition, ClassKind kind) const {
    for (const auto& observer : _observers) { observer->on_before_decorate(definition, kind); }
}

void ClassRegistry::notify_property_synthesized(const ClassDefinition& definition, const std::string& field,
                                                const PropertyDescriptor& descriptor) const {
    for (const auto& observer : _observers) { observer->on_property_synthesized(definition, field, descriptor); }
}

void ClassRegistry::notify_after_decorate(const ClassDefinition& definition) const {
    for (const auto& observer : _observers) { observer->on_after_decorate(definition); }
}

} // namespace propmap
