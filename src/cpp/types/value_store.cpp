#include <propmap/types/value_store.h>

namespace propmap
{

    ValueStore::ValueStore(ValueMap values) : _values{std::move(values)} {}

    ValueStore::ValueStore(const ValueStore &other) {
        std::lock_guard<std::mutex> lock(other._mutex);
        _values = other._values;
    }

    ValueStore::ValueStore(ValueStore &&other) noexcept {
        std::lock_guard<std::mutex> lock(other._mutex);
        _values = std::move(other._values);
        other._values.reset();
    }

    ValueStore &ValueStore::operator=(const ValueStore &other) {
        if (this != &other) {
            std::scoped_lock lock(_mutex, other._mutex);
            _values = other._values;
        }
        return *this;
    }

    ValueStore &ValueStore::operator=(ValueStore &&other) noexcept {
        if (this != &other) {
            std::scoped_lock lock(_mutex, other._mutex);
            _values = std::move(other._values);
            other._values.reset();
        }
        return *this;
    }

    bool ValueStore::has_values() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _values.has_value();
    }

    Value ValueStore::get(std::string_view name) const {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_values) { return {}; }
        auto it = _values->find(name);
        return it != _values->end() ? it->second : Value{};
    }

    bool ValueStore::contains(std::string_view name) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _values && _values->find(name) != _values->end();
    }

    void ValueStore::set(std::string_view name, Value value) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_values) { _values.emplace(); }
        _values->insert_or_assign(std::string(name), std::move(value));
    }

    void ValueStore::assign(ValueMap values) {
        std::lock_guard<std::mutex> lock(_mutex);
        _values = std::move(values);
    }

    ValueMap ValueStore::snapshot() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _values ? *_values : ValueMap{};
    }

    bool ValueStore::operator==(const ValueStore &other) const {
        if (this == &other) { return true; }
        std::scoped_lock lock(_mutex, other._mutex);
        return _values == other._values;
    }

}  // namespace propmap
