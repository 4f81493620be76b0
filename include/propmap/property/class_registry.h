#pragma once

/**
 * @file class_registry.h
 * @brief Side table of class definitions, keyed by the runtime class.
 *
 * C++ classes cannot grow attributes at runtime, so everything decoration attaches to a class (its kind tag,
 * its properties, its synthesized accessors, equality and initializer) lives in a ClassDefinition owned here.
 */

#include <propmap/property/class_builder.h>
#include <propmap/property/class_definition.h>
#include <propmap/runtime/registration_observer.h>
#include <propmap/types/type_api.h>

#include <memory>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace propmap {

namespace detail {

    /// The class has a declare() of its own (a base class's declare never accepts ClassBuilder<T>).
    template<typename T>
    concept has_own_declarations = requires(ClassBuilder<T> &builder) { T::declare(builder); };

    /// The class overrides PropertyObject::equals itself.
    template<typename T>
    inline constexpr bool declares_own_equals =
        std::is_same_v<decltype(&T::equals), bool (T::*)(const PropertyObject &) const>;

    template<typename B>
    B declaring_class_of(void (*)(ClassBuilder<B> &));

    /// The class has no declare() of its own but inherits one; Declaring is the class that owns it.
    template<typename T>
    concept inherits_declarations = !has_own_declarations<T> && requires { declaring_class_of(&T::declare); };

    template<typename T>
    using declaring_class_t = decltype(declaring_class_of(&T::declare));

} // namespace detail

// ============================================================================
// Class Registry
// ============================================================================

/**
 * @brief Owner of all class definitions.
 *
 * Usage:
 * @code
 * auto& registry = ClassRegistry::instance();
 *
 * ClassDefinition& definition = registry.define<BucketArgs>();   // built from BucketArgs::declare
 * const ClassDefinition* found = registry.find(typeid(BucketArgs));
 * @endcode
 *
 * Definitions are built and decorated before instances are shared between threads; the registry itself is not
 * locked.
 */
class PROPMAP_EXPORT ClassRegistry {
public:
    /// Get the singleton instance
    static ClassRegistry& instance();

    // Deleted copy/move
    ClassRegistry(const ClassRegistry&) = delete;
    ClassRegistry& operator=(const ClassRegistry&) = delete;
    ClassRegistry(ClassRegistry&&) = delete;
    ClassRegistry& operator=(ClassRegistry&&) = delete;

    /**
     * @brief The definition of T, built from T's own declarations on first request.
     *
     * Defining a class also registers its name (fully qualified and unqualified) with the TypeRegistry, so
     * forward references to it resolve.
     */
    template<typename T>
    ClassDefinition& define();

    [[nodiscard]] ClassDefinition* find(std::type_index cls);
    [[nodiscard]] const ClassDefinition* find(std::type_index cls) const;

    /**
     * @brief The definition of the runtime class of self, or else of its most derived defined base class.
     *
     * Instances of classes that were never defined themselves (a subclass adding nothing) resolve to the
     * definition they inherit from. Returns nullptr when no defined class matches.
     */
    [[nodiscard]] const ClassDefinition* resolve(const PropertyObject& self) const;

    /// The definition of the recorded base class, nullptr at the root.
    [[nodiscard]] const ClassDefinition* find_base(const ClassDefinition& definition) const;

    /// The first definition from definition up through its bases carrying a kind tag, nullptr if none does.
    [[nodiscard]] const ClassDefinition* find_decorated(const ClassDefinition* definition) const;

    /// The accessor named accessor_name on definition or the nearest of its bases declaring it.
    [[nodiscard]] const Accessor* find_accessor(const ClassDefinition* definition,
                                                std::string_view accessor_name) const;

    /// The definition of cls, throws usage_error if the class was never defined.
    [[nodiscard]] const ClassDefinition& get(std::type_index cls) const;

    /**
     * @brief Construct an instance of an output type from a payload.
     *
     * @throws usage_error if cls is not an output type with a factory
     */
    [[nodiscard]] std::unique_ptr<PropertyObject> construct(std::type_index cls, const Value& payload) const;

    // ========== Observers ==========

    void add_observer(registration_observer_s_ptr observer);
    void remove_observer(const registration_observer_s_ptr& observer);

    void notify_before_decorate(const ClassDefinition& definition, ClassKind kind) const;
    void notify_property_synthesized(const ClassDefinition& definition, const std::string& field,
                                     const PropertyDescriptor& descriptor) const;
    void notify_after_decorate(const ClassDefinition& definition) const;

private:
    ClassRegistry() = default;

    ClassDefinition& insert(std::unique_ptr<ClassDefinition> definition, type_expr_ptr type);

    std::unordered_map<std::type_index, std::unique_ptr<ClassDefinition>> _definitions;
    std::vector<registration_observer_s_ptr> _observers;
};

template<typename T>
ClassDefinition& ClassRegistry::define() {
    static_assert(std::is_base_of_v<PropertyObject, T>, "Declared classes must derive from PropertyObject");
    if (auto existing = find(typeid(T))) { return *existing; }

    auto definition = std::make_unique<ClassDefinition>(typeid(T));
    definition->name = TypeName<T>::name();
    definition->is_mapping = std::is_base_of_v<MappingObject, T>;
    definition->has_own_equality = detail::declares_own_equals<T>;
    definition->has_explicit_initializer = std::is_constructible_v<T, const Value&>;
    definition->is_instance = [](const PropertyObject& self) { return dynamic_cast<const T*>(&self) != nullptr; };

    if constexpr (detail::has_own_declarations<T>) {
        ClassBuilder<T> builder{*definition};
        T::declare(builder);
    } else if constexpr (detail::inherits_declarations<T>) {
        using Declaring = detail::declaring_class_t<T>;
        if constexpr (std::is_base_of_v<Declaring, T> && !std::is_same_v<Declaring, T>) {
            define<Declaring>();
            definition->base = std::type_index(typeid(Declaring));
        }
    }
    return insert(std::move(definition), type_of<T>());
}

template<typename T>
template<typename B>
ClassBuilder<T>& ClassBuilder<T>::base() {
    static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>, "base<B>() requires a proper base class of T");
    ClassRegistry::instance().define<B>();
    _definition.base = std::type_index(typeid(B));
    return *this;
}

// ============================================================================
// Kind Queries
// ============================================================================

/// Defines T when needed, so a subclass adding nothing reports the kind it inherits.
template<typename T>
bool is_input_type() {
    if constexpr (std::is_base_of_v<PropertyObject, T>) { ClassRegistry::instance().define<T>(); }
    return is_input_type(typeid(T));
}

template<typename T>
bool is_output_type() {
    if constexpr (std::is_base_of_v<PropertyObject, T>) { ClassRegistry::instance().define<T>(); }
    return is_output_type(typeid(T));
}

} // namespace propmap
