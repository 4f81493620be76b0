#ifndef PROPMAP_PROPERTY_H
#define PROPMAP_PROPERTY_H

#include <propmap/types/type_expr.h>
#include <propmap/types/value.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace propmap {

    /// Sentinel for "no default supplied"; distinct from every Value, including the null Value.
    inline constexpr std::nullopt_t MISSING = std::nullopt;

    /**
     * PropertyDescriptor - the metadata of one property: its wire name, its default and its declared type.
     *
     * Descriptors are immutable. The declared type is attached by the declaration scanner through with_type(),
     * which returns a new descriptor.
     */
    class PROPMAP_EXPORT PropertyDescriptor {
    public:
        /**
         * @param name The wire name, must not be empty
         * @param default_value The default, or MISSING
         * @throws invalid_argument_error if name is empty
         */
        explicit PropertyDescriptor(std::string name, std::optional<Value> default_value = MISSING);

        [[nodiscard]] const std::string &name() const { return _name; }

        [[nodiscard]] bool has_default() const { return _default.has_value(); }

        [[nodiscard]] const std::optional<Value> &default_value() const { return _default; }

        /// The declared type, nullptr until attached.
        [[nodiscard]] type_expr_ptr type() const { return _type; }

        [[nodiscard]] PropertyDescriptor with_type(type_expr_ptr type) const;

        [[nodiscard]] bool operator==(const PropertyDescriptor &other) const = default;

    private:
        std::string _name;
        std::optional<Value> _default;
        type_expr_ptr _type{nullptr};
    };

    /// Ordered field name -> descriptor, in declaration order.
    using PropertyMap = std::vector<std::pair<std::string, PropertyDescriptor>>;

    /**
     * Return a descriptor identifying a property by its wire name.
     *
     * Used as a field default to give a field a wire name that differs from its in-memory name.
     */
    PROPMAP_EXPORT PropertyDescriptor property(std::string name, std::optional<Value> default_value = MISSING);

} // namespace propmap

#endif  // PROPMAP_PROPERTY_H
