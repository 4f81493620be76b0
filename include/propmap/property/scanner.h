#ifndef PROPMAP_SCANNER_H
#define PROPMAP_SCANNER_H

#include <propmap/property/class_definition.h>
#include <propmap/property/property.h>

namespace propmap {

    /**
     * The properties of a class, one per field it declares itself, in declaration order.
     *
     * A field whose class-level attribute is a PropertyDescriptor keeps that descriptor (with the declared type
     * attached); any other field gets a descriptor named after the field, defaulting to the plain attribute value,
     * or to MISSING when there is no attribute.
     */
    PROPMAP_EXPORT PropertyMap properties_from_declarations(const ClassDefinition &definition);

} // namespace propmap

#endif  // PROPMAP_SCANNER_H
