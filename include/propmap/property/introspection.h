#ifndef PROPMAP_INTROSPECTION_H
#define PROPMAP_INTROSPECTION_H

#include <propmap/property/class_registry.h>

#include <typeindex>

namespace propmap {

    /**
     * The declared types of the tagged getters of an output type, keyed by wire name, with forward references
     * resolved and Deferred / Optional unwrapped. Getters declared without a return type are skipped.
     *
     * @throws precondition_failed_error if cls is not an output type
     * @throws unresolved_reference_error if a forward reference names no registered type
     */
    PROPMAP_EXPORT PropertyTypeMap output_property_types(std::type_index cls);

    /**
     * The declared types of every field of a class, keyed by wire name, resolved and unwrapped. The class does not
     * need to be decorated.
     *
     * @throws precondition_failed_error if cls has not been defined
     * @throws unresolved_reference_error if a forward reference names no registered type
     */
    PROPMAP_EXPORT PropertyTypeMap resource_property_types(std::type_index cls);

    template<typename T>
    PropertyTypeMap output_property_types() {
        ClassRegistry::instance().define<T>();
        return output_property_types(typeid(T));
    }

    template<typename T>
    PropertyTypeMap resource_property_types() {
        ClassRegistry::instance().define<T>();
        return resource_property_types(typeid(T));
    }

} // namespace propmap

#endif  // PROPMAP_INTROSPECTION_H
