//
// Type API - Declarative type expression construction with automatic interning (C++20)
//
// COMPILE-TIME API (template-based):
//
//   auto* s     = type_of<std::string>();                         // str
//   auto* maybe = type_of<Optional<int64_t>>();                   // Union[int, None]
//   auto* out   = type_of<Deferred<Optional<std::string>>>();     // Deferred[Union[str, None]]
//   auto* tags  = type_of<Mapping<std::string, std::string>>();   // Mapping[str, str]
//   auto* other = type_of<ForwardRef<"BucketArgs">>();            // 'BucketArgs'
//
// RUNTIME API (for dynamic construction) is the TypeRegistry:
//
//   auto* out = TypeRegistry::instance().deferred(TypeRegistry::instance().optional(type_of<std::string>()));
//
// Both return interned pointers - same type = same pointer.
//

#ifndef PROPMAP_TYPE_API_H
#define PROPMAP_TYPE_API_H

#include <propmap/types/type_expr.h>
#include <propmap/types/type_registry.h>
#include <propmap/types/value.h>

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <type_traits>

namespace propmap {

// ============================================================================
// Compile-time String Support (C++20 NTTPs)
// ============================================================================

/**
 * StringLiteral - C++20 structural type for string literal template parameters
 *
 * Usage: ForwardRef<"BucketArgs"> - string literals work directly!
 */
template<std::size_t N>
struct StringLiteral {
    char value[N];

    constexpr StringLiteral(const char (&str)[N]) {
        std::copy_n(str, N, value);
    }

    [[nodiscard]] constexpr const char* c_str() const { return value; }
    [[nodiscard]] constexpr std::size_t size() const { return N - 1; }
};

// ============================================================================
// Type Descriptors
// ============================================================================

/// The absent type, the explicit "no value" alternative.
struct Absent;

/// Unconstrained payload.
struct Any;

template<typename T> struct Deferred;
template<typename... Ts> struct Union;
template<typename T> using Optional = Union<T, Absent>;
template<typename T> struct List;
template<typename K, typename V> struct Mapping;
template<StringLiteral Name> struct ForwardRef;

// ============================================================================
// Type Names
// ============================================================================

/**
 * TypeName - the name a C++ type is registered under when used as a plain type.
 *
 * Specialise to give a type a stable name; otherwise the demangled C++ name is used.
 */
template<typename T>
struct TypeName {
    static std::string name() { return boost::core::demangle(typeid(T).name()); }
};

template<> struct TypeName<bool> { static std::string name() { return "bool"; } };
template<> struct TypeName<pm_int> { static std::string name() { return "int"; } };
template<> struct TypeName<int> { static std::string name() { return "int"; } };
template<> struct TypeName<pm_float> { static std::string name() { return "float"; } };
template<> struct TypeName<pm_string> { static std::string name() { return "str"; } };
template<> struct TypeName<Any> { static std::string name() { return "Any"; } };
template<> struct TypeName<Value> { static std::string name() { return "Any"; } };

// ============================================================================
// Type Construction
// ============================================================================

namespace detail {

    template<typename T>
    struct TypeOf {
        static type_expr_ptr get() { return TypeRegistry::instance().plain(TypeName<T>::name()); }
    };

    template<>
    struct TypeOf<Absent> {
        static type_expr_ptr get() { return TypeRegistry::instance().absent(); }
    };

    template<typename T>
    struct TypeOf<Deferred<T>> {
        static type_expr_ptr get() { return TypeRegistry::instance().deferred(TypeOf<T>::get()); }
    };

    template<typename... Ts>
    struct TypeOf<Union<Ts...>> {
        static_assert(sizeof...(Ts) > 0, "Union requires at least one alternative");

        static type_expr_ptr get() { return TypeRegistry::instance().union_of({TypeOf<Ts>::get()...}); }
    };

    template<typename T>
    struct TypeOf<List<T>> {
        static type_expr_ptr get() { return TypeRegistry::instance().plain("List", {TypeOf<T>::get()}); }
    };

    template<typename K, typename V>
    struct TypeOf<Mapping<K, V>> {
        static type_expr_ptr get() {
            return TypeRegistry::instance().plain("Mapping", {TypeOf<K>::get(), TypeOf<V>::get()});
        }
    };

    template<>
    struct TypeOf<ValueMap> : TypeOf<Mapping<pm_string, Any>> {};

    template<>
    struct TypeOf<ValueList> : TypeOf<List<Any>> {};

    template<StringLiteral Name>
    struct TypeOf<ForwardRef<Name>> {
        static type_expr_ptr get() { return TypeRegistry::instance().forward_ref(Name.c_str()); }
    };

} // namespace detail

/**
 * The interned type expression for a C++ type or type descriptor.
 * Computed once per T; the registry keeps every expression alive for the process.
 */
template<typename T>
type_expr_ptr type_of() {
    static const type_expr_ptr type = detail::TypeOf<std::remove_cvref_t<T>>::get();
    return type;
}

} // namespace propmap

#endif // PROPMAP_TYPE_API_H
