#include <propmap/property/property.h>
#include <propmap/types/type_expr.h>
#include <propmap/types/type_registry.h>
#include <propmap/types/unwrap.h>
#include <propmap/types/value.h>
#include <propmap/util/errors.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace propmap {

    namespace {

        Value value_from_python(const nb::handle &src) {
            if (src.is_none()) { return Value{}; }
            if (nb::isinstance<nb::bool_>(src)) { return Value{nb::cast<bool>(src)}; }
            if (nb::isinstance<nb::int_>(src)) { return Value{nb::cast<pm_int>(src)}; }
            if (nb::isinstance<nb::float_>(src)) { return Value{nb::cast<pm_float>(src)}; }
            if (nb::isinstance<nb::str>(src)) { return Value{nb::cast<std::string>(src)}; }
            if (nb::isinstance<nb::dict>(src)) {
                ValueMap items;
                for (auto [key, item] : nb::borrow<nb::dict>(src)) {
                    if (!nb::isinstance<nb::str>(key)) {
                        throw_error<type_mismatch_error>("Expected mapping keys to be str");
                    }
                    items.insert_or_assign(nb::cast<std::string>(key), value_from_python(item));
                }
                return Value{std::move(items)};
            }
            if (nb::isinstance<nb::list>(src) || nb::isinstance<nb::tuple>(src)) {
                ValueList items;
                for (auto item : src) { items.push_back(value_from_python(item)); }
                return Value{std::move(items)};
            }
            throw_error<type_mismatch_error>("Unsupported value type '{}'",
                                             nb::cast<std::string>(nb::str(src.type().attr("__name__"))));
        }

        nb::object value_to_python(const Value &value) {
            if (value.is_null()) { return nb::none(); }
            if (value.is<bool>()) { return nb::bool_(value.as<bool>()); }
            if (value.is<pm_int>()) { return nb::int_(value.as<pm_int>()); }
            if (value.is<pm_float>()) { return nb::float_(value.as<pm_float>()); }
            if (value.is<pm_string>()) { return nb::str(value.as<pm_string>().c_str()); }
            if (value.is<ValueMap>()) {
                nb::dict result;
                for (const auto &[key, item] : value.as<ValueMap>()) { result[key.c_str()] = value_to_python(item); }
                return result;
            }
            if (value.is<ValueList>()) {
                nb::list result;
                for (const auto &item : value.as<ValueList>()) { result.append(value_to_python(item)); }
                return result;
            }
            return nb::str(value.to_string().c_str());
        }

        // Marks a property without a default, distinct from a None default
        struct Missing {};

    }  // namespace

}  // namespace propmap

void export_types(nb::module_ &m) {
    using namespace propmap;

    nb::enum_<TypeKind>(m, "TypeKind")
        .value("Plain", TypeKind::Plain)
        .value("Absent", TypeKind::Absent)
        .value("Deferred", TypeKind::Deferred)
        .value("Union", TypeKind::Union)
        .value("ForwardRef", TypeKind::ForwardRef);

    // Interned and owned by the TypeRegistry, so always returned by reference
    nb::class_<TypeExpr>(m, "TypeExpr")
        .def_ro("kind", &TypeExpr::kind)
        .def_ro("name", &TypeExpr::name)
        .def_prop_ro("args", [](const TypeExpr &self) { return self.args; }, nb::rv_policy::reference)
        .def_prop_ro("is_plain", &TypeExpr::is_plain)
        .def_prop_ro("is_absent", &TypeExpr::is_absent)
        .def_prop_ro("is_deferred", &TypeExpr::is_deferred)
        .def_prop_ro("is_union", &TypeExpr::is_union)
        .def_prop_ro("is_forward_ref", &TypeExpr::is_forward_ref)
        .def("__str__", &TypeExpr::to_string)
        .def("__repr__", [](const TypeExpr &self) { return fmt::format("TypeExpr({})", self.to_string()); })
        .def("__eq__", [](const TypeExpr &self, const TypeExpr &other) { return &self == &other; })
        .def("__hash__", [](const TypeExpr &self) { return std::hash<const TypeExpr *>{}(&self); });

    auto reference = nb::rv_policy::reference;
    m.def("plain", [](const std::string &name, std::vector<type_expr_ptr> args) {
        return TypeRegistry::instance().plain(name, std::move(args));
    }, "name"_a, "args"_a = std::vector<type_expr_ptr>{}, reference);
    m.def("absent", [] { return TypeRegistry::instance().absent(); }, reference);
    m.def("deferred", [](type_expr_ptr arg) { return TypeRegistry::instance().deferred(arg); }, "arg"_a, reference);
    m.def("union_of", [](const std::vector<type_expr_ptr> &alternatives) {
        return TypeRegistry::instance().union_of(alternatives);
    }, "alternatives"_a, reference);
    m.def("optional", [](type_expr_ptr arg) { return TypeRegistry::instance().optional(arg); }, "arg"_a, reference);
    m.def("forward_ref", [](const std::string &name) { return TypeRegistry::instance().forward_ref(name); },
          "name"_a, reference);
    m.def("register_named", [](const std::string &name, type_expr_ptr type) {
        TypeRegistry::instance().register_named(name, type);
    }, "name"_a, "type"_a);
    m.def("resolve", [](type_expr_ptr type) { return TypeRegistry::instance().resolve(type); }, "type"_a, reference);

    m.def("is_optional_type", &is_optional_type, "type"_a);
    m.def("unwrap_optional_type", &unwrap_optional_type, "type"_a, reference,
          "Unwraps the type T in Optional[T].");
    m.def("unwrap_type", &unwrap_type, "type"_a, reference,
          "Unwraps the type T in Deferred[T] and Optional[T].");
}

void export_properties(nb::module_ &m) {
    using namespace propmap;

    nb::class_<Missing>(m, "_Missing").def("__repr__", [](const Missing &) { return "MISSING"; });
    nb::object missing = nb::cast(Missing{});
    m.attr("MISSING") = missing;

    nb::class_<PropertyDescriptor>(m, "PropertyDescriptor")
        .def_prop_ro("name", &PropertyDescriptor::name)
        .def_prop_ro("has_default", &PropertyDescriptor::has_default)
        .def_prop_ro("default", [missing](const PropertyDescriptor &self) -> nb::object {
            return self.has_default() ? value_to_python(*self.default_value()) : missing;
        })
        .def_prop_ro("type", &PropertyDescriptor::type, nb::rv_policy::reference)
        .def("__eq__", [](const PropertyDescriptor &self, const PropertyDescriptor &other) { return self == other; })
        .def("__repr__", [](const PropertyDescriptor &self) {
            return self.has_default() ? fmt::format("property('{}', {})", self.name(), *self.default_value())
                                      : fmt::format("property('{}')", self.name());
        });

    m.def("property", [](const nb::object &name, const nb::object &default_value) {
        if (!nb::isinstance<nb::str>(name)) { throw_error<invalid_argument_error>("Expected name to be a str"); }
        std::optional<Value> default_ = std::nullopt;
        if (!nb::isinstance<Missing>(default_value)) { default_ = value_from_python(default_value); }
        return property(nb::cast<std::string>(name), std::move(default_));
    }, "name"_a, "default"_a = missing,
       "Return a property descriptor naming the wire name of a field, with an optional default value.");
}
