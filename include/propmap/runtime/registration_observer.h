#ifndef PROPMAP_REGISTRATION_OBSERVER_H
#define PROPMAP_REGISTRATION_OBSERVER_H

#include <propmap/propmap_base.h>

#include <memory>
#include <string>

namespace propmap {

    /**
     * Receives the steps of class decoration. Every hook is a no-op by default, override the ones of interest and
     * register the observer with ClassRegistry::add_observer.
     */
    struct PROPMAP_EXPORT RegistrationObserver {
        using s_ptr = std::shared_ptr<RegistrationObserver>;

        virtual ~RegistrationObserver() = default;

        virtual void on_before_decorate(const ClassDefinition &, ClassKind) {
        };

        virtual void on_property_synthesized(const ClassDefinition &, const std::string &, const PropertyDescriptor &) {
        };

        virtual void on_after_decorate(const ClassDefinition &) {
        };
    };

} // namespace propmap

#endif  // PROPMAP_REGISTRATION_OBSERVER_H
