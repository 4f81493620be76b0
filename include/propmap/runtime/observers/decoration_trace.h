#pragma once

#include <propmap/runtime/registration_observer.h>
#include <optional>
#include <string>

namespace propmap {

    /**
     * @brief Logs out the different steps as classes are decorated.
     *
     * Reports each decoration and every property it synthesizes, with its wire name and declared type. Helpful when
     * tracing down why a field does not read or write under the expected name.
     */
    class PROPMAP_EXPORT DecorationTrace : public RegistrationObserver {
    public:
        /**
         * @brief Construct a new Decoration Trace object
         *
         * @param filter Used to restrict which classes to report (substring match on the class name)
         * @param decorate Log the start and end of each decoration
         * @param property Log each synthesized property
         */
        explicit DecorationTrace(const std::optional<std::string>& filter = std::nullopt,
                                 bool decorate = true, bool property = true);

        void on_before_decorate(const ClassDefinition& definition, ClassKind kind) override;
        void on_property_synthesized(const ClassDefinition& definition, const std::string& field,
                                     const PropertyDescriptor& descriptor) override;
        void on_after_decorate(const ClassDefinition& definition) override;

        // Static configuration
        static void set_print_defaults(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _decorate;
        bool _property;

        static bool _print_defaults;
        static bool _use_logger;

        void _print(const std::string& msg) const;
        bool _should_log(const ClassDefinition& definition) const;
    };

} // namespace propmap
