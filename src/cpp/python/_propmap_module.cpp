/*
 * The entry point into the python _propmap module exposing the type expression algebra, the type unwrapping
 * functions and the property descriptor factory to python.
 *
 * Errors raised by propmap are translated into the built-in python exceptions callers already test for.
 */
#include <propmap/util/errors.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;

void export_types(nb::module_ &);

void export_properties(nb::module_ &);

NB_MODULE(_propmap, m) {
    m.doc() = "Typed property mappings for input and output types";

    nb::register_exception_translator([](const std::exception_ptr &p, void *) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const propmap::invalid_argument_error &e) {
            PyErr_SetString(PyExc_TypeError, e.what());
        } catch (const propmap::type_mismatch_error &e) {
            PyErr_SetString(PyExc_TypeError, e.what());
        } catch (const propmap::unresolved_reference_error &e) {
            PyErr_SetString(PyExc_NameError, e.what());
        } catch (const propmap::attribute_error &e) {
            PyErr_SetString(PyExc_AttributeError, e.what());
        } catch (const propmap::property_error &e) {
            // already decorated, usage and precondition failures surfaced as assertion failures
            PyErr_SetString(PyExc_AssertionError, e.what());
        }
    }, nullptr);

    export_types(m);
    export_properties(m);
}
