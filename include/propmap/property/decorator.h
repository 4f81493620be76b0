#ifndef PROPMAP_DECORATOR_H
#define PROPMAP_DECORATOR_H

#include <propmap/property/access.h>
#include <propmap/property/class_registry.h>
#include <propmap/util/errors.h>

#include <memory>
#include <type_traits>
#include <typeindex>

namespace propmap {

    /**
     * Tag a defined class as an input or output type and synthesize its accessors, equality and (output types
     * without an initializer of their own) its initializer.
     *
     * @throws usage_error if cls has not been defined
     * @throws already_decorated_error if the class already carries a kind tag
     */
    PROPMAP_EXPORT const ClassDefinition &decorate(std::type_index cls, ClassKind kind);

    /**
     * Run the synthesized output initializer of the runtime class of self, or the one it inherits: the payload
     * must hold a ValueMap, which becomes the instance's ValueStore.
     *
     * @throws usage_error if the class has no synthesized initializer
     * @throws type_mismatch_error if the payload is not a mapping
     */
    PROPMAP_EXPORT void initialize_output(PropertyObject &self, const Value &payload);

    /**
     * Build an output instance from a payload, through whichever initializer applies: the class's own constructor
     * from const Value&, the ValueMap constructor of a mapping type, or default construction followed by the
     * synthesized initializer.
     */
    template<typename T>
    T make_output(const Value &payload) {
        if constexpr (std::is_constructible_v<T, const Value &>) {
            return T(payload);
        } else if constexpr (std::is_base_of_v<MappingObject, T>) {
            static_assert(std::is_constructible_v<T, ValueMap>, "Mapping output types must be constructible from a ValueMap");
            if (!payload.is_mapping()) {
                throw_error<type_mismatch_error>("Expected value to be a mapping, got '{}'", payload.type_name());
            }
            return T(payload.as<ValueMap>());
        } else {
            static_assert(std::is_default_constructible_v<T>, "Output types must be default constructible");
            T instance;
            initialize_output(instance, payload);
            return instance;
        }
    }

    /**
     * Define T and mark it as an input type: its properties read from and write to the instance's ValueStore.
     */
    template<typename T>
    const ClassDefinition &mark_as_input_type() {
        ClassRegistry::instance().define<T>();
        return decorate(typeid(T), ClassKind::Input);
    }

    /**
     * Define T and mark it as an output type: its properties are read only, populated once from a payload.
     */
    template<typename T>
    const ClassDefinition &mark_as_output_type() {
        auto &definition = ClassRegistry::instance().define<T>();
        const auto &decorated = decorate(typeid(T), ClassKind::Output);
        if constexpr (std::is_move_constructible_v<T> &&
                      (std::is_constructible_v<T, const Value &> || std::is_base_of_v<MappingObject, T> ||
                       std::is_default_constructible_v<T>)) {
            definition.factory = [](const Value &payload) -> std::unique_ptr<PropertyObject> {
                return std::make_unique<T>(make_output<T>(payload));
            };
        }
        return decorated;
    }

} // namespace propmap

#endif  // PROPMAP_DECORATOR_H
