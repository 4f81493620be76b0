#include <propmap/property/class_registry.h>
#include <propmap/property/property_object.h>

namespace propmap
{

    bool PropertyObject::equals(const PropertyObject &other) const { return this == &other; }

    bool PropertyObject::operator==(const PropertyObject &other) const {
        const auto &registry = ClassRegistry::instance();
        for (auto definition = registry.resolve(*this); definition != nullptr;
             definition = registry.find_base(*definition)) {
            if (definition->has_own_equality) { break; }
            if (definition->synthesized_equality) {
                return class_id() == other.class_id() && _values == other._values;
            }
        }
        return equals(other);
    }

    MappingObject::MappingObject(ValueMap items) : _items{std::move(items)} {}

    Value MappingObject::lookup(std::string_view key) const {
        auto it = _items.find(key);
        return it != _items.end() ? it->second : Value{};
    }

    bool MappingObject::contains(std::string_view key) const { return _items.find(key) != _items.end(); }

    void MappingObject::insert_or_assign(std::string key, Value value) {
        _items.insert_or_assign(std::move(key), std::move(value));
    }

    bool MappingObject::equals(const PropertyObject &other) const {
        if (this == &other) { return true; }
        const auto *mapping = dynamic_cast<const MappingObject *>(&other);
        return mapping != nullptr && _items == mapping->_items;
    }

}  // namespace propmap
