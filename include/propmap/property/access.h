#ifndef PROPMAP_ACCESS_H
#define PROPMAP_ACCESS_H

#include <propmap/property/property_object.h>
#include <propmap/types/value.h>

#include <string_view>
#include <typeindex>

namespace propmap {

    // ============================================================================
    // Kind Queries
    // ============================================================================

    /// True when cls, or the nearest of its recorded bases carrying a kind tag, is an input type.
    /// The template forms are declared in class_registry.h.
    PROPMAP_EXPORT bool is_input_type(std::type_index cls);

    PROPMAP_EXPORT bool is_output_type(std::type_index cls);

    // ============================================================================
    // Access Protocol
    // ============================================================================

    /**
     * Read the property stored under its wire name.
     *
     * Input types read from the ValueStore; output types first translate the name through the class's translation
     * hook and then read from their own items (mapping types) or from the ValueStore. Missing values read as a null
     * Value.
     *
     * @throws invalid_argument_error if name is empty
     * @throws usage_error if the class of self is neither an input nor an output type
     */
    PROPMAP_EXPORT Value get(const PropertyObject &self, std::string_view name);

    /**
     * Write the property stored under its wire name, creating the ValueStore on first use.
     *
     * @throws invalid_argument_error if name is empty
     * @throws usage_error if the class of self is not an input type
     */
    PROPMAP_EXPORT void set(PropertyObject &self, std::string_view name, Value value);

    /**
     * A copy of the values of an input type instance, keyed by wire name.
     *
     * @throws usage_error if the class of value is not an input type
     */
    PROPMAP_EXPORT ValueMap input_type_to_dict(const PropertyObject &value);

    // ============================================================================
    // Attribute Access
    // ============================================================================

    /**
     * Read through the accessor named accessor_name (the in-memory field name).
     *
     * @throws attribute_error if the class has no such accessor
     */
    PROPMAP_EXPORT Value get_attr(const PropertyObject &self, std::string_view accessor_name);

    /**
     * Write through the accessor named accessor_name.
     *
     * @throws attribute_error if the class has no such accessor or it is read only
     */
    PROPMAP_EXPORT void set_attr(PropertyObject &self, std::string_view accessor_name, Value value);

} // namespace propmap

#endif  // PROPMAP_ACCESS_H
