#include <propmap/property/introspection.h>
#include <propmap/property/scanner.h>
#include <propmap/types/type_registry.h>
#include <propmap/types/unwrap.h>
#include <propmap/util/errors.h>

#include <boost/core/demangle.hpp>

namespace propmap
{

    namespace
    {

        type_expr_ptr resolve_and_unwrap(type_expr_ptr type) {
            return unwrap_type(TypeRegistry::instance().resolve(type));
        }

    }  // namespace

    PropertyTypeMap output_property_types(std::type_index cls) {
        const auto &registry = ClassRegistry::instance();
        const auto *definition = registry.find(cls);
        const auto *decorated = registry.find_decorated(definition);
        if (decorated == nullptr || !decorated->is_output_type()) {
            throw_error<precondition_failed_error>(
                "output_property_types requires a class decorated with mark_as_output_type ('{}')",
                definition != nullptr ? definition->name : boost::core::demangle(cls.name()));
        }
        // Only the getters the class declares itself
        PropertyTypeMap types;
        for (const auto &accessor : definition->accessors) {
            const auto &getter = accessor.getter;
            if (!getter.tagged || getter.return_type == nullptr) { continue; }
            types.insert_or_assign(getter.wire_name, resolve_and_unwrap(getter.return_type));
        }
        return types;
    }

    PropertyTypeMap resource_property_types(std::type_index cls) {
        const auto *definition = ClassRegistry::instance().find(cls);
        if (definition == nullptr) {
            throw_error<precondition_failed_error>("'{}' has not been defined", boost::core::demangle(cls.name()));
        }
        // Once decorated the field defaults are stripped, the recorded properties keep the wire names.
        const auto properties = definition->metadata ? definition->metadata->properties
                                                     : properties_from_declarations(*definition);
        PropertyTypeMap types;
        for (const auto &[field, descriptor] : properties) {
            types.insert_or_assign(descriptor.name(), resolve_and_unwrap(descriptor.type()));
        }
        return types;
    }

}  // namespace propmap
