#include <propmap/property/class_definition.h>

#include <algorithm>

namespace propmap
{

    std::string_view to_string(ClassKind kind) {
        switch (kind) {
            case ClassKind::Input: return "input";
            case ClassKind::Output: return "output";
        }
        return "<unknown>";
    }

    const Accessor *ClassDefinition::find_accessor(std::string_view accessor_name) const {
        auto it = std::ranges::find_if(accessors, [&](const Accessor &a) { return a.name == accessor_name; });
        return it != accessors.end() ? &*it : nullptr;
    }

    Accessor *ClassDefinition::find_accessor(std::string_view accessor_name) {
        auto it = std::ranges::find_if(accessors, [&](const Accessor &a) { return a.name == accessor_name; });
        return it != accessors.end() ? &*it : nullptr;
    }

    Accessor &ClassDefinition::put_accessor(Accessor accessor) {
        if (auto existing = find_accessor(accessor.name)) {
            *existing = std::move(accessor);
            return *existing;
        }
        return accessors.emplace_back(std::move(accessor));
    }

    const ClassAttribute *ClassDefinition::find_attribute(std::string_view attribute_name) const {
        auto it = attributes.find(attribute_name);
        return it != attributes.end() ? &it->second : nullptr;
    }

}  // namespace propmap
