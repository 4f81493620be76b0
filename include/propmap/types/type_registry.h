#pragma once

/**
 * @file type_registry.h
 * @brief Central registry for declared type expressions.
 *
 * The TypeRegistry is the single owner of TypeExpr instances. Every builder interns its result, so the returned
 * pointers are stable for the lifetime of the process and identical for structurally identical types.
 * It also holds the name table used to resolve forward references.
 */

#include <propmap/types/type_expr.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace propmap {

// ============================================================================
// Type Registry
// ============================================================================

/**
 * @brief Central registry for all type expressions.
 *
 * Usage:
 * @code
 * auto& registry = TypeRegistry::instance();
 *
 * const TypeExpr* str = registry.plain("str");
 * const TypeExpr* maybe_str = registry.optional(str);           // Union[str, None]
 * const TypeExpr* output = registry.deferred(maybe_str);         // Deferred[Union[str, None]]
 * const TypeExpr* tags = registry.plain("Mapping", {str, str});  // Mapping[str, str]
 * @endcode
 *
 * Interning is guarded by a mutex, types are commonly first requested lazily at query time.
 */
class PROPMAP_EXPORT TypeRegistry {
public:
    /// Get the singleton instance
    static TypeRegistry& instance();

    // Deleted copy/move
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;
    TypeRegistry(TypeRegistry&&) = delete;
    TypeRegistry& operator=(TypeRegistry&&) = delete;

    // ========== Builders ==========

    /**
     * @brief A named type, optionally generic.
     *
     * @param name The type name, must not be empty
     * @param args Generic arguments, may be empty
     */
    type_expr_ptr plain(std::string_view name, std::vector<type_expr_ptr> args = {});

    /// The absent type (Python's NoneType).
    type_expr_ptr absent();

    /// The single-argument deferred value wrapper around arg.
    type_expr_ptr deferred(type_expr_ptr arg);

    /**
     * @brief A union of the given alternatives.
     *
     * Nested unions are flattened, duplicates removed keeping the first occurrence, and a union left with a
     * single alternative collapses to that alternative.
     */
    type_expr_ptr union_of(const std::vector<type_expr_ptr>& alternatives);

    /// Optional[arg], i.e. union_of({arg, absent()}).
    type_expr_ptr optional(type_expr_ptr arg);

    /// A reference to a name registered later with register_named().
    type_expr_ptr forward_ref(std::string_view name);

    // ========== Name Table ==========

    /**
     * @brief Bind a name for forward reference resolution, replacing any earlier binding.
     */
    void register_named(std::string_view name, type_expr_ptr type);

    /**
     * @brief Look up a bound name.
     * @return The bound type, or nullptr when the name is unknown
     */
    [[nodiscard]] type_expr_ptr named(std::string_view name) const;

    /**
     * @brief Replace every forward reference in type by its bound type, recursively.
     *
     * @throws unresolved_reference_error when a name is unbound or the bindings are cyclic
     */
    [[nodiscard]] type_expr_ptr resolve(type_expr_ptr type);

private:
    TypeRegistry() = default;
    ~TypeRegistry() = default;

    type_expr_ptr intern(TypeExpr expr);
    type_expr_ptr resolve(type_expr_ptr type, std::vector<std::string>& resolving);

    mutable std::mutex _mutex;

    /// All expressions, keyed by kind, name and argument identity
    std::unordered_map<std::string, std::unique_ptr<TypeExpr>> _interned;

    /// Forward reference bindings
    std::unordered_map<std::string, type_expr_ptr> _named;
};

} // namespace propmap
