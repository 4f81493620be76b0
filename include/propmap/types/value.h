#ifndef PROPMAP_VALUE_H
#define PROPMAP_VALUE_H

#include <propmap/propmap_base.h>
#include <propmap/util/errors.h>

#include <boost/cast.hpp>
#include <boost/core/demangle.hpp>

#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace propmap {
    /*
     * Value uses the Type Erasure Pattern:
     * i.   a class to represent the thing (Value),
     * ii.  a concept class with the key behaviours as polymorphic methods,
     * iii. a model template implementing the concept for the held type.
     *
     * A default constructed Value holds nothing and is the null-equivalent returned for unset properties.
     * Scalars are normalised on construction so that a literal 3 and an int64_t 3 compare equal.
     */
    using pm_int = int64_t;
    using pm_float = double;
    using pm_string = std::string;

    namespace detail {
        struct ValueConcept {
            using u_ptr = std::unique_ptr<ValueConcept>;

            virtual ~ValueConcept() = default;

            [[nodiscard]] virtual bool equals(const ValueConcept &other) const = 0;

            [[nodiscard]] virtual u_ptr clone() const = 0;

            [[nodiscard]] virtual const std::type_info &type() const = 0;

            [[nodiscard]] virtual std::string to_string() const = 0;
        };

        template<typename T>
        struct ValueModel final : ValueConcept {
            explicit ValueModel(T value) : object{std::move(value)} {
            }

            [[nodiscard]] bool equals(const ValueConcept &other) const override {
                if (typeid(other) != typeid(*this)) return false;
                if constexpr (std::equality_comparable<T>) {
                    return object == boost::polymorphic_downcast<const ValueModel *>(&other)->object;
                } else {
                    return this == &other;
                }
            }

            [[nodiscard]] u_ptr clone() const override { return std::make_unique<ValueModel>(*this); }

            [[nodiscard]] const std::type_info &type() const override { return typeid(T); }

            [[nodiscard]] std::string to_string() const override;

            T object;
        };

        // The storage type used for a raw C++ value.
        template<typename T, typename U = std::remove_cvref_t<T>>
        struct value_storage {
            using type = U;
        };

        template<typename T, typename U>
            requires (std::integral<U> && !std::same_as<U, bool> && !std::same_as<U, char>)
        struct value_storage<T, U> {
            using type = pm_int;
        };

        template<typename T, typename U>
            requires std::floating_point<U>
        struct value_storage<T, U> {
            using type = pm_float;
        };

        template<typename T, typename U>
            requires (std::convertible_to<T, std::string_view> && !std::same_as<U, std::string>)
        struct value_storage<T, U> {
            using type = pm_string;
        };

        template<typename T>
        using value_storage_t = typename value_storage<T>::type;
    } // namespace detail

    /**
     * A dynamically typed value as held in a ValueStore.
     */
    class PROPMAP_EXPORT Value {
        std::unique_ptr<detail::ValueConcept> m_pimpl;

    public:
        Value() = default;

        Value(std::nullptr_t) : Value() {
        }

        template<typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value> &&
                      !std::same_as<std::remove_cvref_t<T>, std::nullptr_t> &&
                      !std::same_as<std::remove_cvref_t<T>, std::nullopt_t>)
        Value(T &&value)
            : m_pimpl{std::make_unique<detail::ValueModel<detail::value_storage_t<T>>>(
                detail::value_storage_t<T>(std::forward<T>(value)))} {
        }

        Value(const Value &other);

        Value(Value &&) noexcept = default;

        Value &operator=(const Value &other);

        Value &operator=(Value &&) noexcept = default;

        [[nodiscard]] bool operator==(const Value &other) const;

        /// True when nothing is held, the null-equivalent.
        [[nodiscard]] bool is_null() const { return !m_pimpl; }

        [[nodiscard]] explicit operator bool() const { return !is_null(); }

        template<typename T>
        [[nodiscard]] bool is() const {
            return m_pimpl && m_pimpl->type() == typeid(detail::value_storage_t<T>);
        }

        [[nodiscard]] bool is_mapping() const { return is<ValueMap>(); }

        template<typename T>
        [[nodiscard]] const detail::value_storage_t<T> &as() const {
            using S = detail::value_storage_t<T>;
            if (!is<S>()) {
                throw_error<type_mismatch_error>("Value of type '{}' does not contain a value of type '{}'",
                                                 type_name(), boost::core::demangle(typeid(S).name()));
            }
            return boost::polymorphic_downcast<const detail::ValueModel<S> *>(m_pimpl.get())->object;
        }

        /// The held value, or nullopt when null. Still throws if a value of another type is held.
        template<typename T>
        [[nodiscard]] std::optional<detail::value_storage_t<T>> as_optional() const {
            if (is_null()) return std::nullopt;
            return as<T>();
        }

        [[nodiscard]] std::string type_name() const;

        [[nodiscard]] std::string to_string() const;
    };
} // namespace propmap

namespace fmt {
    template<>
    struct formatter<propmap::Value> : formatter<string_view> {
        // parse is inherited from formatter<string_view>.
        template<typename FormatContext>
        auto format(const propmap::Value &v, FormatContext &ctx) const {
            return formatter<string_view>::format(v.to_string(), ctx);
        }
    };
} // namespace fmt

namespace propmap::detail {
    template<typename T>
    std::string ValueModel<T>::to_string() const {
        if constexpr (std::same_as<T, bool>) {
            return object ? "true" : "false";
        } else if constexpr (std::same_as<T, pm_string>) {
            return fmt::format("'{}'", object);
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("{}", object);
        } else {
            return fmt::format("<{}>", boost::core::demangle(typeid(T).name()));
        }
    }
} // namespace propmap::detail

#endif  // PROPMAP_VALUE_H
