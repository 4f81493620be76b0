#ifndef PROPMAP_FORWARD_DECLARATIONS_H
#define PROPMAP_FORWARD_DECLARATIONS_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace propmap {
    // Values
    class Value;
    using ValueMap = std::map<std::string, Value, std::less<>>;
    using ValueList = std::vector<Value>;
    class ValueStore;

    // Type expressions - interned, always handled as const raw pointers
    struct TypeExpr;
    using type_expr_ptr = const TypeExpr*;
    class TypeRegistry;
    using PropertyTypeMap = std::map<std::string, type_expr_ptr, std::less<>>;

    // Properties
    class PropertyDescriptor;
    class PropertyObject;
    class MappingObject;

    // Class side table
    enum class ClassKind : uint8_t;
    struct Accessor;
    struct ClassDefinition;
    using class_definition_ptr = ClassDefinition*;
    using const_class_definition_ptr = const ClassDefinition*;
    class ClassRegistry;
    template<typename T>
    class ClassBuilder;

    // Observers
    struct RegistrationObserver;
    using registration_observer_s_ptr = std::shared_ptr<RegistrationObserver>;
} // namespace propmap

#endif  // PROPMAP_FORWARD_DECLARATIONS_H
