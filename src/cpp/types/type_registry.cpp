#include <propmap/types/type_registry.h>
#include <propmap/util/errors.h>

#include <algorithm>

namespace propmap {

// ============================================================================
// TypeRegistry Singleton
// ============================================================================

TypeRegistry& TypeRegistry::instance() {
    static TypeRegistry registry;
    return registry;
}

// ============================================================================
// Builders
// ============================================================================

type_expr_ptr TypeRegistry::plain(std::string_view name, std::vector<type_expr_ptr> args) {
    if (name.empty()) { throw_error<invalid_argument_error>("A plain type requires a name"); }
    if (std::ranges::any_of(args, [](auto arg) { return arg == nullptr; })) {
        throw_error<invalid_argument_error>("Generic arguments of '{}' must not be null", name);
    }
    return intern(TypeExpr{TypeKind::Plain, std::string(name), std::move(args)});
}

type_expr_ptr TypeRegistry::absent() {
    return intern(TypeExpr{TypeKind::Absent, {}, {}});
}

type_expr_ptr TypeRegistry::deferred(type_expr_ptr arg) {
    if (arg == nullptr) { throw_error<invalid_argument_error>("Deferred requires exactly one argument"); }
    return intern(TypeExpr{TypeKind::Deferred, {}, {arg}});
}

type_expr_ptr TypeRegistry::union_of(const std::vector<type_expr_ptr>& alternatives) {
    std::vector<type_expr_ptr> flat;
    for (auto alternative : alternatives) {
        if (alternative == nullptr) { throw_error<invalid_argument_error>("Union alternatives must not be null"); }
        if (alternative->is_union()) {
            for (auto nested : alternative->args) {
                if (std::ranges::find(flat, nested) == flat.end()) { flat.push_back(nested); }
            }
        } else if (std::ranges::find(flat, alternative) == flat.end()) {
            flat.push_back(alternative);
        }
    }
    if (flat.empty()) { throw_error<invalid_argument_error>("Union requires at least one alternative"); }
    if (flat.size() == 1) { return flat.front(); }
    return intern(TypeExpr{TypeKind::Union, {}, std::move(flat)});
}

type_expr_ptr TypeRegistry::optional(type_expr_ptr arg) {
    return union_of({arg, absent()});
}

type_expr_ptr TypeRegistry::forward_ref(std::string_view name) {
    if (name.empty()) { throw_error<invalid_argument_error>("A forward reference requires a name"); }
    return intern(TypeExpr{TypeKind::ForwardRef, std::string(name), {}});
}

// ============================================================================
// Name Table
// ============================================================================

void TypeRegistry::register_named(std::string_view name, type_expr_ptr type) {
    if (name.empty()) { throw_error<invalid_argument_error>("Cannot register a type under an empty name"); }
    std::lock_guard<std::mutex> lock(_mutex);
    _named.insert_or_assign(std::string(name), type);
}

type_expr_ptr TypeRegistry::named(std::string_view name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _named.find(std::string(name));
    return it != _named.end() ? it->second : nullptr;
}

type_expr_ptr TypeRegistry::resolve(type_expr_ptr type) {
    if (type == nullptr) { throw_error<invalid_argument_error>("Cannot resolve a null type"); }
    std::vector<std::string> resolving;
    return resolve(type, resolving);
}

type_expr_ptr TypeRegistry::resolve(type_expr_ptr type, std::vector<std::string>& resolving) {
    switch (type->kind) {
        case TypeKind::Absent:
            return type;
        case TypeKind::Plain: {
            if (type->args.empty()) { return type; }
            std::vector<type_expr_ptr> args;
            args.reserve(type->args.size());
            for (auto arg : type->args) { args.push_back(resolve(arg, resolving)); }
            return plain(type->name, std::move(args));
        }
        case TypeKind::Deferred:
            return deferred(resolve(type->args.front(), resolving));
        case TypeKind::Union: {
            std::vector<type_expr_ptr> alternatives;
            alternatives.reserve(type->args.size());
            for (auto arg : type->args) { alternatives.push_back(resolve(arg, resolving)); }
            return union_of(alternatives);
        }
        case TypeKind::ForwardRef: {
            if (std::ranges::find(resolving, type->name) != resolving.end()) {
                throw_error<unresolved_reference_error>("Cyclic forward reference '{}' ({})", type->name,
                                                        fmt::join(resolving, " -> "));
            }
            auto target = named(type->name);
            if (target == nullptr) {
                throw_error<unresolved_reference_error>("Forward reference '{}' is not defined", type->name);
            }
            resolving.push_back(type->name);
            auto resolved = resolve(target, resolving);
            resolving.pop_back();
            return resolved;
        }
    }
    return type;
}

// ============================================================================
// Interning
// ============================================================================

type_expr_ptr TypeRegistry::intern(TypeExpr expr) {
    // Arguments are interned already, so their addresses identify them
    std::vector<uintptr_t> arg_ids;
    arg_ids.reserve(expr.args.size());
    for (auto arg : expr.args) { arg_ids.push_back(reinterpret_cast<uintptr_t>(arg)); }
    auto key = fmt::format("{}|{}|{}", static_cast<int>(expr.kind), expr.name, fmt::join(arg_ids, ","));
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _interned.find(key);
    if (it != _interned.end()) { return it->second.get(); }
    auto stored = std::make_unique<TypeExpr>(std::move(expr));
    type_expr_ptr ptr = stored.get();
    _interned.emplace(std::move(key), std::move(stored));
    return ptr;
}

} // namespace propmap
