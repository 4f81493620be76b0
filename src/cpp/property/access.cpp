#include <propmap/property/access.h>
#include <propmap/property/class_registry.h>
#include <propmap/util/errors.h>

#include <boost/core/demangle.hpp>

namespace propmap
{

    namespace
    {

        std::string class_name(const PropertyObject &self) {
            if (const auto *definition = ClassRegistry::instance().find(self.class_id())) { return definition->name; }
            return boost::core::demangle(self.class_id().name());
        }

        void check_name(std::string_view name) {
            if (name.empty()) { throw_error<invalid_argument_error>("Missing name argument"); }
        }

        const Accessor &require_accessor(const PropertyObject &self, std::string_view accessor_name) {
            const auto &registry = ClassRegistry::instance();
            const auto *accessor = registry.find_accessor(registry.resolve(self), accessor_name);
            if (accessor == nullptr) {
                throw_error<attribute_error>("'{}' object has no attribute '{}'", class_name(self), accessor_name);
            }
            return *accessor;
        }

        // The definition carrying the kind tag self inherits, nullptr when self is of neither kind
        const ClassDefinition *decorated_definition(const PropertyObject &self) {
            const auto &registry = ClassRegistry::instance();
            return registry.find_decorated(registry.resolve(self));
        }

        std::string translate_name(const PropertyObject &self, std::string_view name) {
            const auto &registry = ClassRegistry::instance();
            for (auto definition = registry.resolve(self); definition != nullptr;
                 definition = registry.find_base(*definition)) {
                if (definition->translate) { return definition->translate(self, name); }
            }
            return std::string(name);
        }

    }  // namespace

    bool is_input_type(std::type_index cls) {
        const auto &registry = ClassRegistry::instance();
        const auto *definition = registry.find_decorated(registry.find(cls));
        return definition != nullptr && definition->is_input_type();
    }

    bool is_output_type(std::type_index cls) {
        const auto &registry = ClassRegistry::instance();
        const auto *definition = registry.find_decorated(registry.find(cls));
        return definition != nullptr && definition->is_output_type();
    }

    Value get(const PropertyObject &self, std::string_view name) {
        check_name(name);
        const auto *definition = decorated_definition(self);
        if (definition != nullptr && definition->is_input_type()) {
            return detail::ValueStoreAccess::store(self).get(name);
        }
        if (definition != nullptr && definition->is_output_type()) {
            auto key = translate_name(self, name);
            if (const auto *mapping = dynamic_cast<const MappingObject *>(&self)) { return mapping->lookup(key); }
            return detail::ValueStoreAccess::store(self).get(key);
        }
        throw_error<usage_error>(
            "get can only be used with classes decorated with mark_as_input_type or mark_as_output_type ('{}')",
            class_name(self));
    }

    void set(PropertyObject &self, std::string_view name, Value value) {
        check_name(name);
        const auto *definition = decorated_definition(self);
        if (definition == nullptr || !definition->is_input_type()) {
            throw_error<usage_error>("set can only be used with classes decorated with mark_as_input_type ('{}')",
                                     class_name(self));
        }
        detail::ValueStoreAccess::store(self).set(name, std::move(value));
    }

    ValueMap input_type_to_dict(const PropertyObject &value) {
        const auto *definition = decorated_definition(value);
        if (definition == nullptr || !definition->is_input_type()) {
            throw_error<usage_error>("input_type_to_dict can only be used with input types ('{}')", class_name(value));
        }
        return detail::ValueStoreAccess::store(value).snapshot();
    }

    Value get_attr(const PropertyObject &self, std::string_view accessor_name) {
        return require_accessor(self, accessor_name).getter.fn(self);
    }

    void set_attr(PropertyObject &self, std::string_view accessor_name, Value value) {
        const auto &accessor = require_accessor(self, accessor_name);
        if (accessor.read_only()) {
            throw_error<attribute_error>("Cannot set read only attribute '{}' of '{}'", accessor_name, class_name(self));
        }
        accessor.setter->fn(self, std::move(value));
    }

}  // namespace propmap
