/*
 * Copyright (C) 2025 Aless Microsystems
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, version 3 of the License, or under
 * alternative licensing terms as granted by Aless Microsystems.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 */

#include "global.h"

#include <string>
#include <vector>
#include <cstdlib>
#include <exception>
#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include "packing/include/packer.h"
#include "unpacking/include/unpacker.h"

namespace nb = nanobind;
using namespace nb::literals;

// Memory leak profiling
static bool leak_warnings_enabled = []()
{
    const char *env = std::getenv("BITNUC_LEAK_WARNINGS");
    return env && std::string(env) == "1";
}();

NB_MODULE(_bitnuc_impl, m)
{
    // Set BITNUC_LEAK_WARNINGS=1 to enable
    nb::set_leak_warnings(leak_warnings_enabled);

    nb::exception<NucleotideError> nucleotide_error(m, "NucleotideError", PyExc_ValueError);
    nb::exception<BackendUnavailableException>(m, "BackendUnavailableException", PyExc_RuntimeError);

    // Carry kind/value/position onto the Python exception instance.
    // Registered after nb::exception, so it is tried first.
    nb::register_exception_translator(
        [](const std::exception_ptr &p, void *payload)
        {
            try {
                std::rethrow_exception(p);
            } catch (const NucleotideError &e) {
                nb::handle type(static_cast<PyObject *>(payload));
                nb::object error = type(e.what());
                nb::setattr(error, "kind", nb::str(nucleotide_error_kind_name(e.kind())));
                nb::setattr(error, "value", nb::cast(e.value()));
                if (e.kind() == NucleotideErrorKind::InvalidBase) {
                    nb::setattr(error, "position", nb::cast(e.position()));
                } else {
                    nb::setattr(error, "position", nb::none());
                }
                PyErr_SetObject(type.ptr(), error.ptr());
            }
        },
        nucleotide_error.ptr());

    m.def("as_2bit", [](nb::bytes seq)
          {
        std::string_view view(static_cast<const char*>(seq.c_str()), seq.size());
        return as_2bit(view); },
          "seq"_a, "Pack up to 32 nucleotides (ACGT, either case) into an int, two bits per base.");

    m.def("as_2bit_with", [](const std::string &backend, nb::bytes seq)
          {
        std::optional<PackBackend> selected = backend_from_name(backend);
        if (!selected) {
            throw BackendUnavailableException("Unknown pack backend " + backend);
        }
        std::string_view view(static_cast<const char*>(seq.c_str()), seq.size());
        return as_2bit_with(*selected, view); },
          "backend"_a, "seq"_a);

    m.def("from_2bit", [](uint64_t packed, size_t length)
          {
        std::string sequence = from_2bit(packed, length);
        return nb::bytes(sequence.data(), sequence.size()); },
          "packed"_a, "length"_a, "Unpack `length` bases from a 2-bit packed int, uppercase.");

    m.def("active_backend", []()
          { return std::string(backend_name(active_backend())); });

    m.def("runnable_backends", []()
          {
        std::vector<std::string> names;
        for (PackBackend backend : runnable_backends()) {
            names.emplace_back(backend_name(backend));
        }
        return names; });
}
