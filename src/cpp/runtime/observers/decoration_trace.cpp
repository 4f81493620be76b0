#include <propmap/runtime/observers/decoration_trace.h>
#include <propmap/property/class_definition.h>
#include <propmap/types/type_expr.h>
#include <fmt/format.h>
#include <iostream>

namespace propmap {

    // Static member initialization
    bool DecorationTrace::_print_defaults = false;
    bool DecorationTrace::_use_logger = true;

    DecorationTrace::DecorationTrace(const std::optional<std::string>& filter, bool decorate, bool property)
        : _filter(filter), _decorate(decorate), _property(property) {
    }

    void DecorationTrace::set_print_defaults(bool value) {
        _print_defaults = value;
    }

    void DecorationTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void DecorationTrace::_print(const std::string& msg) const {
        std::string formatted = fmt::format("[propmap] {}", msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool DecorationTrace::_should_log(const ClassDefinition& definition) const {
        if (!_filter.has_value()) {
            return true;
        }
        return definition.name.find(_filter.value()) != std::string::npos;
    }

    void DecorationTrace::on_before_decorate(const ClassDefinition& definition, ClassKind kind) {
        if (_decorate && _should_log(definition)) {
            _print(fmt::format(">> Decorating {} as {} type", definition.name, to_string(kind)));
        }
    }

    void DecorationTrace::on_property_synthesized(const ClassDefinition& definition, const std::string& field,
                                                  const PropertyDescriptor& descriptor) {
        if (!_property || !_should_log(definition)) {
            return;
        }
        std::string type = descriptor.type() != nullptr ? descriptor.type()->to_string() : "<undeclared>";
        std::string default_msg;
        if (_print_defaults && descriptor.has_default()) {
            default_msg = fmt::format(" = {}", *descriptor.default_value());
        }
        _print(fmt::format("   {}.{} -> '{}': {}{}", definition.name, field, descriptor.name(), type, default_msg));
    }

    void DecorationTrace::on_after_decorate(const ClassDefinition& definition) {
        if (_decorate && _should_log(definition)) {
            auto count = definition.metadata ? definition.metadata->properties.size() : 0;
            _print(fmt::format("<< Decorated {} ({} properties)", definition.name, count));
        }
    }

} // namespace propmap
