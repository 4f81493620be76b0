#ifndef PROPMAP_TYPE_EXPR_H
#define PROPMAP_TYPE_EXPR_H

#include <propmap/propmap_base.h>

#include <string>
#include <vector>

namespace propmap {

    /**
     * TypeKind - Classification of declared types
     */
    enum class TypeKind : uint8_t {
        Plain,       // A named type, optionally with generic arguments (str, List[str], Mapping[str, int])
        Absent,      // The explicit "no value" type, the second alternative of an Optional
        Deferred,    // Single-argument wrapper for a value produced later
        Union,       // Two or more alternatives, already flattened
        ForwardRef,  // A name resolved against the TypeRegistry at query time
    };

    /**
     * TypeExpr - A declared type expression.
     *
     * Instances are only created by the TypeRegistry, which interns them: two structurally equal expressions are
     * the same object, so comparing type_expr_ptr values compares types.
     */
    struct PROPMAP_EXPORT TypeExpr {
        TypeKind kind;
        std::string name;                  // Plain: type name; ForwardRef: referenced name; empty otherwise
        std::vector<type_expr_ptr> args;   // Plain: generic arguments; Deferred: one; Union: the alternatives

        [[nodiscard]] bool is_plain() const { return kind == TypeKind::Plain; }
        [[nodiscard]] bool is_absent() const { return kind == TypeKind::Absent; }
        [[nodiscard]] bool is_deferred() const { return kind == TypeKind::Deferred; }
        [[nodiscard]] bool is_union() const { return kind == TypeKind::Union; }
        [[nodiscard]] bool is_forward_ref() const { return kind == TypeKind::ForwardRef; }

        [[nodiscard]] size_t arity() const { return args.size(); }

        /// Python typing style rendering, e.g. Deferred[Union[str, None]].
        [[nodiscard]] std::string to_string() const;
    };

    PROPMAP_EXPORT std::string_view to_string(TypeKind kind);

} // namespace propmap

namespace fmt {
    template<>
    struct formatter<propmap::TypeExpr> : formatter<string_view> {
        template<typename FormatContext>
        auto format(const propmap::TypeExpr &t, FormatContext &ctx) const {
            return formatter<string_view>::format(t.to_string(), ctx);
        }
    };
} // namespace fmt

#endif  // PROPMAP_TYPE_EXPR_H
