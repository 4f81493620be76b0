#ifndef PROPMAP_PROPERTY_OBJECT_H
#define PROPMAP_PROPERTY_OBJECT_H

#include <propmap/types/value.h>
#include <propmap/types/value_store.h>

#include <typeindex>

namespace propmap {

    namespace detail {
        struct ValueStoreAccess;
    }

    /**
     * Base of every instance whose properties live in a ValueStore.
     *
     * Declaring fields is done through the class's own static declare(ClassBuilder<Self>&), not through this base;
     * the base only owns the store and routes equality through the class's registered definition.
     *
     * Equality (operator==): the nearest class up the inheritance chain that either overrides equals() or was given
     * synthesized equality by decoration decides. Synthesized equality compares structurally (same runtime class and
     * equal stores), so a decorated subclass compares structurally even when a base overrides equals(). When neither
     * applies equals() is called, which compares by identity unless overridden.
     */
    class PROPMAP_EXPORT PropertyObject {
    public:
        PropertyObject() = default;

        PropertyObject(const PropertyObject &) = default;

        PropertyObject(PropertyObject &&) noexcept = default;

        PropertyObject &operator=(const PropertyObject &) = default;

        PropertyObject &operator=(PropertyObject &&) noexcept = default;

        virtual ~PropertyObject() = default;

        /// User-defined equality, identity by default.
        [[nodiscard]] virtual bool equals(const PropertyObject &other) const;

        [[nodiscard]] bool operator==(const PropertyObject &other) const;

        /// The identity of the runtime class, the key into the ClassRegistry.
        [[nodiscard]] std::type_index class_id() const { return typeid(*this); }

    private:
        friend struct detail::ValueStoreAccess;

        ValueStore _values;
    };

    /**
     * Base for native mapping types: instances are themselves a wire name -> Value mapping.
     *
     * Output-kind mapping classes answer property reads from their own items, and compare as mappings
     * (equal items are equal whatever the runtime classes).
     */
    class PROPMAP_EXPORT MappingObject : public PropertyObject {
    public:
        using iterator = ValueMap::const_iterator;

        MappingObject() = default;

        explicit MappingObject(ValueMap items);

        /// The item stored under key, or a null Value.
        [[nodiscard]] Value lookup(std::string_view key) const;

        [[nodiscard]] bool contains(std::string_view key) const;

        [[nodiscard]] size_t size() const { return _items.size(); }

        [[nodiscard]] bool empty() const { return _items.empty(); }

        [[nodiscard]] iterator begin() const { return _items.begin(); }

        [[nodiscard]] iterator end() const { return _items.end(); }

        void insert_or_assign(std::string key, Value value);

        [[nodiscard]] const ValueMap &items() const { return _items; }

        [[nodiscard]] bool equals(const PropertyObject &other) const override;

    private:
        ValueMap _items;
    };

    namespace detail {
        // Internal access to the store of an instance, for the access protocol and the decorators only.
        struct ValueStoreAccess {
            static ValueStore &store(PropertyObject &self) { return self._values; }
            static const ValueStore &store(const PropertyObject &self) { return self._values; }
        };
    } // namespace detail

} // namespace propmap

#endif  // PROPMAP_PROPERTY_OBJECT_H
