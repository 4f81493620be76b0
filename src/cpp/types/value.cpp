#include <propmap/types/value.h>

namespace propmap
{

    Value::Value(const Value &other) : m_pimpl{other.m_pimpl ? other.m_pimpl->clone() : nullptr} {}

    Value &Value::operator=(const Value &other) {
        if (this != &other) {
            auto value_concept{other.m_pimpl ? other.m_pimpl->clone() : nullptr};
            m_pimpl.swap(value_concept);
        }
        return *this;
    }

    bool Value::operator==(const Value &other) const {
        if (is_null() || other.is_null()) { return is_null() == other.is_null(); }
        return m_pimpl->equals(*other.m_pimpl);
    }

    std::string Value::type_name() const {
        if (is_null()) { return "null"; }
        return boost::core::demangle(m_pimpl->type().name());
    }

    std::string Value::to_string() const { return is_null() ? "null" : m_pimpl->to_string(); }

}  // namespace propmap
