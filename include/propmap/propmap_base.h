/*
 * The core imports for propmap. Use this to ensure the correct import order can be maintained.
 */

#ifndef PROPMAP_BASE_H
#define PROPMAP_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <typeindex>

#include <propmap/propmap_export.h>
#include <propmap/propmap_forward_declarations.h>

#endif //PROPMAP_BASE_H
