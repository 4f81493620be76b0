#ifndef PROPMAP_CLASS_DEFINITION_H
#define PROPMAP_CLASS_DEFINITION_H

#include <propmap/property/property.h>
#include <propmap/property/property_object.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace propmap {

    enum class ClassKind : uint8_t {
        Input,
        Output,
    };

    PROPMAP_EXPORT std::string_view to_string(ClassKind kind);

    using GetterFn = std::function<Value(const PropertyObject &)>;
    using SetterFn = std::function<void(PropertyObject &, Value)>;
    using TranslateFn = std::function<std::string(const PropertyObject &, std::string_view)>;
    using InitializerFn = std::function<void(PropertyObject &, const Value &)>;
    using FactoryFn = std::function<std::unique_ptr<PropertyObject>(const Value &)>;

    /**
     * The read half of an accessor.
     *
     * A tagged getter was produced by getter() or synthesized for a field: it records the wire name it reads and
     * the declared return type (nullptr when not declared), which the introspection queries consume.
     */
    struct Getter {
        GetterFn fn;
        bool tagged{false};
        std::string wire_name;
        type_expr_ptr return_type{nullptr};
    };

    /**
     * The write half of an accessor. A placeholder setter has an empty body; on input types the decorator replaces
     * it with one writing to the ValueStore.
     */
    struct Setter {
        SetterFn fn;
        bool placeholder{false};
    };

    /**
     * Accessor - a named getter with an optional setter, the C++ counterpart of a class property.
     */
    struct Accessor {
        std::string name;
        Getter getter;
        std::optional<Setter> setter;

        [[nodiscard]] bool read_only() const { return !setter.has_value(); }
    };

    /// A class-level default: a plain value, or an explicit descriptor overriding the wire name.
    using ClassAttribute = std::variant<Value, PropertyDescriptor>;

    /**
     * ClassMetadata - what decoration attaches to a class: its kind and its properties.
     */
    struct ClassMetadata {
        ClassKind kind;
        PropertyMap properties;
    };

    /**
     * ClassDefinition - the side table entry describing one C++ class.
     *
     * Built from the class's own declare(ClassBuilder<T>&) and kept by the ClassRegistry. Decoration mutates it
     * once (stripping field defaults, synthesizing accessors, equality and the initializer, attaching metadata);
     * after that it is treated as read only.
     */
    struct PROPMAP_EXPORT ClassDefinition {
        std::type_index id;
        std::string name;
        /// The nearest defined base class, whose kind tag and accessors this class inherits.
        std::optional<std::type_index> base;
        /// True when an instance is of this class or of one derived from it.
        std::function<bool(const PropertyObject &)> is_instance;

        /// The class's own field declarations, in declaration order.
        std::vector<std::pair<std::string, type_expr_ptr>> annotations;
        /// Class-level defaults, keyed by field name.
        std::map<std::string, ClassAttribute, std::less<>> attributes;
        /// Accessors, in declaration order.
        std::vector<Accessor> accessors;

        TranslateFn translate;        // Output kind property name translation, identity when empty
        bool is_mapping{false};       // Derives from MappingObject
        bool has_own_equality{false}; // Overrides PropertyObject::equals
        bool has_explicit_initializer{false};  // Constructible from const Value&

        // Set by decoration
        std::optional<ClassMetadata> metadata;
        bool synthesized_equality{false};
        InitializerFn initializer;    // The synthesized output initializer, when one was synthesized
        FactoryFn factory;            // Builds an output instance from a payload

        explicit ClassDefinition(std::type_index id_) : id{id_} {}

        [[nodiscard]] bool is_decorated() const { return metadata.has_value(); }
        [[nodiscard]] bool is_input_type() const { return metadata && metadata->kind == ClassKind::Input; }
        [[nodiscard]] bool is_output_type() const { return metadata && metadata->kind == ClassKind::Output; }

        [[nodiscard]] const Accessor *find_accessor(std::string_view accessor_name) const;
        [[nodiscard]] Accessor *find_accessor(std::string_view accessor_name);

        /// Add, or replace an accessor of the same name in place.
        Accessor &put_accessor(Accessor accessor);

        [[nodiscard]] const ClassAttribute *find_attribute(std::string_view attribute_name) const;
    };

} // namespace propmap

#endif  // PROPMAP_CLASS_DEFINITION_H
