#include <propmap/types/unwrap.h>
#include <propmap/util/errors.h>

#include <algorithm>

namespace propmap
{

    bool is_optional_type(type_expr_ptr type) {
        if (type == nullptr) { throw_error<invalid_argument_error>("Cannot inspect a null type"); }
        if (type->is_absent()) { return true; }
        if (type->is_union()) { return std::ranges::any_of(type->args, is_optional_type); }
        return false;
    }

    type_expr_ptr unwrap_optional_type(type_expr_ptr type) {
        if (type == nullptr) { throw_error<invalid_argument_error>("Cannot unwrap a null type"); }
        if (!type->is_union() || type->arity() != 2 || !is_optional_type(type)) { return type; }
        // Unions are flattened on construction, so an optional pair holds Absent directly
        if (type->args[1]->is_absent()) { return type->args[0]; }
        if (type->args[0]->is_absent()) { return type->args[1]; }
        return type;
    }

    type_expr_ptr unwrap_type(type_expr_ptr type) {
        if (type == nullptr) { throw_error<invalid_argument_error>("Cannot unwrap a null type"); }
        if (type->is_deferred()) { type = type->args.front(); }
        return unwrap_optional_type(type);
    }

}  // namespace propmap
