#ifndef PROPMAP_VALUE_STORE_H
#define PROPMAP_VALUE_STORE_H

#include <propmap/types/value.h>

#include <mutex>
#include <optional>

namespace propmap {

    /**
     * ValueStore - the per-instance wire name -> Value container behind every property.
     *
     * The underlying mapping is created lazily on the first write, or supplied wholesale. A store that was never
     * created is distinguishable from an empty one and the two compare unequal.
     *
     * Each store owns its own mutex so a single instance can be read and written from several threads.
     * Copies take a snapshot of the source under its lock and get a fresh mutex.
     */
    class PROPMAP_EXPORT ValueStore {
    public:
        ValueStore() = default;

        explicit ValueStore(ValueMap values);

        ValueStore(const ValueStore &other);

        ValueStore(ValueStore &&other) noexcept;

        ValueStore &operator=(const ValueStore &other);

        ValueStore &operator=(ValueStore &&other) noexcept;

        ~ValueStore() = default;

        /// True once the mapping has been created, either by a write or by assign().
        [[nodiscard]] bool has_values() const;

        /// The value stored under name, or a null Value when absent (or never created).
        [[nodiscard]] Value get(std::string_view name) const;

        [[nodiscard]] bool contains(std::string_view name) const;

        /// Create the mapping if required, then write name -> value, replacing any prior value.
        void set(std::string_view name, Value value);

        /// Replace the whole mapping.
        void assign(ValueMap values);

        /// A copy of the mapping, empty if never created.
        [[nodiscard]] ValueMap snapshot() const;

        [[nodiscard]] bool operator==(const ValueStore &other) const;

    private:
        mutable std::mutex _mutex;
        std::optional<ValueMap> _values;
    };

} // namespace propmap

#endif  // PROPMAP_VALUE_STORE_H
