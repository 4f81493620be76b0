#include <propmap/property/scanner.h>

namespace propmap
{

    PropertyMap properties_from_declarations(const ClassDefinition &definition) {
        PropertyMap properties;
        properties.reserve(definition.annotations.size());
        for (const auto &[field, type] : definition.annotations) {
            const auto *attribute = definition.find_attribute(field);
            if (attribute == nullptr) {
                properties.emplace_back(field, PropertyDescriptor{field}.with_type(type));
            } else if (const auto *descriptor = std::get_if<PropertyDescriptor>(attribute)) {
                properties.emplace_back(field, descriptor->with_type(type));
            } else {
                properties.emplace_back(field, PropertyDescriptor{field, std::get<Value>(*attribute)}.with_type(type));
            }
        }
        return properties;
    }

}  // namespace propmap
