#include <propmap/property/decorator.h>
#include <propmap/property/scanner.h>

#include <boost/core/demangle.hpp>

namespace propmap
{

    namespace
    {

        Accessor synthesize_accessor(const ClassDefinition &definition, const std::string &field,
                                     const PropertyDescriptor &descriptor, ClassKind kind) {
            const auto &wire_name = descriptor.name();
            Accessor accessor{
                field,
                Getter{[wire_name](const PropertyObject &self) { return propmap::get(self, wire_name); }, true,
                       wire_name, descriptor.type()},
                std::nullopt};
            if (kind == ClassKind::Input) {
                const auto *existing = definition.find_accessor(field);
                if (existing != nullptr && existing->setter && !existing->setter->placeholder) {
                    accessor.setter = existing->setter;
                } else {
                    accessor.setter = Setter{[wire_name](PropertyObject &self, Value value) {
                        propmap::set(self, wire_name, std::move(value));
                    }, false};
                }
            }
            return accessor;
        }

        void replace_placeholder_setters(ClassDefinition &definition) {
            for (auto &accessor : definition.accessors) {
                if (!accessor.getter.tagged || !accessor.setter || !accessor.setter->placeholder) { continue; }
                accessor.setter = Setter{[wire_name = accessor.getter.wire_name](PropertyObject &self, Value value) {
                    propmap::set(self, wire_name, std::move(value));
                }, false};
            }
        }

        void synthesized_output_initializer(PropertyObject &self, const Value &payload) {
            if (!payload.is_mapping()) {
                throw_error<type_mismatch_error>("Expected value to be a mapping, got '{}'", payload.type_name());
            }
            detail::ValueStoreAccess::store(self).assign(payload.as<ValueMap>());
        }

    }  // namespace

    const ClassDefinition &decorate(std::type_index cls, ClassKind kind) {
        auto &registry = ClassRegistry::instance();
        auto *definition = registry.find(cls);
        if (definition == nullptr) {
            throw_error<usage_error>("'{}' has not been defined", boost::core::demangle(cls.name()));
        }
        if (definition->is_decorated()) {
            throw_error<already_decorated_error>(
                "Cannot apply mark_as_input_type and mark_as_output_type more than once ('{}' is already an {} type)",
                definition->name, to_string(definition->metadata->kind));
        }
        registry.notify_before_decorate(*definition, kind);

        auto properties = properties_from_declarations(*definition);
        for (const auto &[field, _] : properties) {
            if (auto it = definition->attributes.find(field); it != definition->attributes.end()) {
                definition->attributes.erase(it);
            }
        }
        definition->metadata = ClassMetadata{kind, properties};

        for (const auto &[field, descriptor] : properties) {
            definition->put_accessor(synthesize_accessor(*definition, field, descriptor, kind));
            registry.notify_property_synthesized(*definition, field, descriptor);
        }

        if (kind == ClassKind::Input) {
            replace_placeholder_setters(*definition);
        } else if (!definition->is_mapping && !definition->has_explicit_initializer) {
            definition->initializer = synthesized_output_initializer;
        }

        definition->synthesized_equality = !definition->is_mapping && !definition->has_own_equality;

        registry.notify_after_decorate(*definition);
        return *definition;
    }

    void initialize_output(PropertyObject &self, const Value &payload) {
        const auto &registry = ClassRegistry::instance();
        const auto *definition = registry.resolve(self);
        while (definition != nullptr && !definition->initializer) { definition = registry.find_base(*definition); }
        if (definition == nullptr) {
            throw_error<usage_error>("'{}' has no synthesized output initializer",
                                     boost::core::demangle(self.class_id().name()));
        }
        definition->initializer(self, payload);
    }

}  // namespace propmap
