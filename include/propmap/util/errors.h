#ifndef PROPMAP_UTIL_ERRORS
#define PROPMAP_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace propmap {

    /**
     * Base of every error raised by propmap. All of them signal a programming-time contract violation,
     * none are transient, so they derive from std::logic_error and are never retried internally.
     */
    struct property_error : std::logic_error {
        using std::logic_error::logic_error;
    };

    /// A property name was empty or not textual.
    struct invalid_argument_error : property_error {
        using property_error::property_error;
    };

    /// mark_as_input_type / mark_as_output_type applied to a class that already carries a kind tag.
    struct already_decorated_error : property_error {
        using property_error::property_error;
    };

    /// An operation was invoked against the wrong class kind, or against a class with no kind tag.
    struct usage_error : property_error {
        using property_error::property_error;
    };

    /// The output initializer was given a payload that is not a mapping.
    struct type_mismatch_error : property_error {
        using property_error::property_error;
    };

    /// A type introspection query was run against a class lacking the required kind tag.
    struct precondition_failed_error : property_error {
        using property_error::property_error;
    };

    /// A forward reference in a declared type names nothing registered.
    struct unresolved_reference_error : property_error {
        using property_error::property_error;
    };

    /// Unknown accessor, or a write through a read-only accessor.
    struct attribute_error : property_error {
        using property_error::property_error;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace propmap

#endif // PROPMAP_UTIL_ERRORS
