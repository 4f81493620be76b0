#ifndef PROPMAP_UNWRAP_H
#define PROPMAP_UNWRAP_H

#include <propmap/types/type_expr.h>

namespace propmap {

    /**
     * True for the absent type, and for a union any of whose alternatives is itself optional.
     */
    PROPMAP_EXPORT bool is_optional_type(type_expr_ptr type);

    /**
     * Unwraps T in Optional[T].
     *
     * Only the two alternative form {T, Absent} is unwrapped (the absent alternative may be in either position).
     * Wider unions are returned unchanged even when they contain Absent, as is everything that is not optional.
     */
    PROPMAP_EXPORT type_expr_ptr unwrap_optional_type(type_expr_ptr type);

    /**
     * Unwraps T in Deferred[T] and then in Optional[T].
     *
     * Each step is applied exactly once, so Deferred[Optional[str]] gives str while Deferred[Deferred[str]] gives
     * Deferred[str] and Optional[Deferred[str]] gives Deferred[str].
     */
    PROPMAP_EXPORT type_expr_ptr unwrap_type(type_expr_ptr type);

} // namespace propmap

#endif  // PROPMAP_UNWRAP_H
