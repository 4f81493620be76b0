#ifndef PROPMAP_CLASS_BUILDER_H
#define PROPMAP_CLASS_BUILDER_H

#include <propmap/property/access.h>
#include <propmap/property/class_definition.h>
#include <propmap/types/type_api.h>
#include <propmap/util/errors.h>

#include <boost/cast.hpp>

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace propmap {

    // ============================================================================
    // Getter / Setter Specifications
    // ============================================================================

    /// Marks an accessor body as empty, to be synthesized.
    struct EmptyBody {};

    inline constexpr EmptyBody empty_body{};

    template<typename F>
    struct GetterSpec {
        F fn;
        std::optional<std::string> wire_name;
        type_expr_ptr return_type;
    };

    template<typename F>
    struct SetterSpec {
        F fn;
    };

    /**
     * Tag a getter as a property getter.
     *
     * @tparam R The declared return type (a C++ type or type descriptor), void if undeclared
     * @param fn The body, callable with the const instance, or empty_body to read the property
     * @param name The wire name; when omitted the name of the accessor the getter is attached to is used
     */
    template<typename R = void, typename F>
    GetterSpec<std::decay_t<F>> getter(F &&fn, std::optional<std::string> name = std::nullopt) {
        if (name && name->empty()) { throw_error<invalid_argument_error>("Missing name argument"); }
        type_expr_ptr return_type{nullptr};
        if constexpr (!std::is_void_v<R>) { return_type = type_of<R>(); }
        return {std::forward<F>(fn), std::move(name), return_type};
    }

    /**
     * A setter, callable with the instance and the new Value, or empty_body for a placeholder.
     */
    template<typename F>
    SetterSpec<std::decay_t<F>> setter(F &&fn) {
        return {std::forward<F>(fn)};
    }

    namespace detail {
        template<typename T>
        struct is_getter_spec : std::false_type {};

        template<typename F>
        struct is_getter_spec<GetterSpec<F>> : std::true_type {};

        template<typename T>
        struct is_setter_spec : std::false_type {};

        template<typename F>
        struct is_setter_spec<SetterSpec<F>> : std::true_type {};
    } // namespace detail

    // ============================================================================
    // Class Builder
    // ============================================================================

    /**
     * @brief Receives the declarations of a class.
     *
     * A class declares its own fields and accessors in a static member taking a builder of its own type:
     * @code
     * struct BucketArgs : PropertyObject {
     *     static void declare(ClassBuilder<BucketArgs>& cls) {
     *         cls.field<std::string>("bucket", property("bucketName"))
     *            .field<Optional<bool>>("versioning", false)
     *            .accessor("region", getter<std::string>(empty_body, "regionName"), setter(empty_body));
     *     }
     * };
     * @endcode
     * A subclass without its own declare() has no declarations of its own: ClassBuilder<Derived> never binds to a
     * base class's declare(ClassBuilder<Base>&). Such a subclass inherits from the class that owns that declare().
     * A subclass with declarations of its own names its base with base<Base>().
     */
    template<typename T>
    class ClassBuilder {
    public:
        explicit ClassBuilder(ClassDefinition &definition) : _definition(definition) {}

        /// Declare a field with no default.
        template<typename FieldT>
        ClassBuilder &field(std::string field_name) {
            return field(std::move(field_name), type_of<FieldT>());
        }

        /// Declare a field whose default is an explicit descriptor.
        template<typename FieldT>
        ClassBuilder &field(std::string field_name, PropertyDescriptor descriptor) {
            return field(std::move(field_name), type_of<FieldT>(), ClassAttribute{std::move(descriptor)});
        }

        /// Declare a field with a plain default.
        template<typename FieldT>
        ClassBuilder &field(std::string field_name, Value default_value) {
            return field(std::move(field_name), type_of<FieldT>(), ClassAttribute{std::move(default_value)});
        }

        /// Runtime form: declare a field of the given type, with an optional class-level attribute as its default.
        ClassBuilder &field(std::string field_name, type_expr_ptr type,
                            std::optional<ClassAttribute> attribute = std::nullopt) {
            if (field_name.empty()) { throw_error<invalid_argument_error>("Missing field name"); }
            if (type == nullptr) { throw_error<invalid_argument_error>("Missing type for field '{}'", field_name); }
            auto &annotations = _definition.annotations;
            auto it = std::ranges::find_if(annotations, [&](const auto &a) { return a.first == field_name; });
            if (it != annotations.end()) {
                it->second = type;
            } else {
                annotations.emplace_back(field_name, type);
            }
            if (attribute) {
                _definition.attributes.insert_or_assign(std::move(field_name), std::move(*attribute));
            } else {
                _definition.attributes.erase(field_name);
            }
            return *this;
        }

        /// A read-only accessor.
        template<typename G>
        ClassBuilder &accessor(std::string accessor_name, G &&get_fn) {
            Getter g = make_getter(accessor_name, std::forward<G>(get_fn));
            _definition.put_accessor(Accessor{std::move(accessor_name), std::move(g), std::nullopt});
            return *this;
        }

        /// A read-write accessor.
        template<typename G, typename S>
        ClassBuilder &accessor(std::string accessor_name, G &&get_fn, S &&set_fn) {
            Getter g = make_getter(accessor_name, std::forward<G>(get_fn));
            Setter s = make_setter(std::forward<S>(set_fn));
            _definition.put_accessor(Accessor{std::move(accessor_name), std::move(g), std::move(s)});
            return *this;
        }

        /**
         * Install the property name translation hook of an output type: fn(const T&, std::string_view) returns
         * the key to look the wire name up under.
         */
        template<typename F>
        ClassBuilder &translate_property(F &&fn) {
            _definition.translate = [fn = std::forward<F>(fn)](const PropertyObject &self, std::string_view name) {
                return std::string(std::invoke(fn, downcast(self), name));
            };
            return *this;
        }

        /**
         * Record B as the base class this class inherits its kind tag and accessors from. B is defined if it was
         * not already. Defined in class_registry.h.
         */
        template<typename B>
        ClassBuilder &base();

        [[nodiscard]] const ClassDefinition &definition() const { return _definition; }

    private:
        static const T &downcast(const PropertyObject &self) { return *boost::polymorphic_downcast<const T *>(&self); }

        static T &downcast(PropertyObject &self) { return *boost::polymorphic_downcast<T *>(&self); }

        template<typename G>
        static Getter make_getter(const std::string &accessor_name, G &&get_fn) {
            using GD = std::decay_t<G>;
            if constexpr (detail::is_getter_spec<GD>::value) {
                auto wire_name = get_fn.wire_name.value_or(accessor_name);
                Getter g{wrap_getter(std::forward<G>(get_fn).fn, wire_name), true, wire_name, get_fn.return_type};
                return g;
            } else {
                return Getter{wrap_getter(std::forward<G>(get_fn), accessor_name), false, {}, nullptr};
            }
        }

        template<typename F>
        static GetterFn wrap_getter(F &&fn, const std::string &wire_name) {
            if constexpr (std::is_same_v<std::decay_t<F>, EmptyBody>) {
                return [wire_name](const PropertyObject &self) { return propmap::get(self, wire_name); };
            } else {
                return [fn = std::forward<F>(fn)](const PropertyObject &self) {
                    return Value(std::invoke(fn, downcast(self)));
                };
            }
        }

        template<typename S>
        static Setter make_setter(S &&set_fn) {
            using SD = std::decay_t<S>;
            if constexpr (detail::is_setter_spec<SD>::value) {
                return make_setter(std::forward<S>(set_fn).fn);
            } else if constexpr (std::is_same_v<SD, EmptyBody>) {
                return Setter{[](PropertyObject &, Value) {}, true};
            } else {
                return Setter{[fn = std::forward<S>(set_fn)](PropertyObject &self, Value value) {
                    std::invoke(fn, downcast(self), std::move(value));
                }, false};
            }
        }

        ClassDefinition &_definition;
    };

} // namespace propmap

#endif  // PROPMAP_CLASS_BUILDER_H
