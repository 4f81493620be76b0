#include <propmap/property/property.h>
#include <propmap/util/errors.h>

namespace propmap
{

    PropertyDescriptor::PropertyDescriptor(std::string name, std::optional<Value> default_value)
        : _name{std::move(name)}, _default{std::move(default_value)} {
        if (_name.empty()) { throw_error<invalid_argument_error>("Missing name argument"); }
    }

    PropertyDescriptor PropertyDescriptor::with_type(type_expr_ptr type) const {
        PropertyDescriptor result{*this};
        result._type = type;
        return result;
    }

    PropertyDescriptor property(std::string name, std::optional<Value> default_value) {
        return PropertyDescriptor{std::move(name), std::move(default_value)};
    }

}  // namespace propmap
