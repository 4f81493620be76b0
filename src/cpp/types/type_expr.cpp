#include <propmap/types/type_expr.h>

namespace propmap
{

    std::string TypeExpr::to_string() const {
        std::vector<std::string> arg_names;
        arg_names.reserve(args.size());
        for (auto arg : args) { arg_names.push_back(arg->to_string()); }

        switch (kind) {
            case TypeKind::Plain:
                if (args.empty()) { return name; }
                return fmt::format("{}[{}]", name, fmt::join(arg_names, ", "));
            case TypeKind::Absent:
                return "None";
            case TypeKind::Deferred:
                return fmt::format("Deferred[{}]", fmt::join(arg_names, ", "));
            case TypeKind::Union:
                return fmt::format("Union[{}]", fmt::join(arg_names, ", "));
            case TypeKind::ForwardRef:
                return fmt::format("'{}'", name);
        }
        return "<unknown>";
    }

    std::string_view to_string(TypeKind kind) {
        switch (kind) {
            case TypeKind::Plain: return "Plain";
            case TypeKind::Absent: return "Absent";
            case TypeKind::Deferred: return "Deferred";
            case TypeKind::Union: return "Union";
            case TypeKind::ForwardRef: return "ForwardRef";
        }
        return "<unknown>";
    }

}  // namespace propmap
