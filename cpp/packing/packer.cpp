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

#include "include/packer.h"
#include "include/cpu-features.h"
#include "include/scalar-pack.h"

#if !defined(BITNUC_DISABLE_AVX2_PACK)
#include "include/avx-pack.h"
#endif
#if !defined(BITNUC_DISABLE_SSE_PACK)
#include "include/sse-pack.h"
#endif
#if !defined(BITNUC_DISABLE_NEON_PACK)
#include "include/neon-pack.h"
#endif

#include <cstdlib>

/**
 * Nucleotide Packer (Adaptive Implementation)
 *
 * SELECTION LOGIC:
 * 1. Compile-time: each vectorized backend is its own translation unit,
 *    built with its ISA flags unless BITNUC_DISABLE_*_PACK removes it.
 *    Backends for a foreign ISA are built through SIMDe emulation.
 * 2. Runtime: the first call probes the CPU and fixes the backend for the
 *    process. Only native backends are dispatched.
 *    - Priority: AVX2 > SSE4.1 > NEON > scalar
 *    - BITNUC_BACKEND pins a native backend by name
 *
 * In debug mode every vectorized result is checked against the scalar
 * reference before being returned.
 */

static constexpr PackBackend backend_priority[] = {
    PackBackend::Avx2, PackBackend::Sse41, PackBackend::Neon
};

const char* backend_name(PackBackend backend) {
    switch (backend) {
        case PackBackend::Scalar: return "scalar";
        case PackBackend::Sse41: return "sse41";
        case PackBackend::Avx2: return "avx2";
        case PackBackend::Neon: return "neon";
    }
    return "unknown";
}

std::optional<PackBackend> backend_from_name(std::string_view name) {
    for (PackBackend backend : {PackBackend::Scalar, PackBackend::Sse41, PackBackend::Avx2, PackBackend::Neon}) {
        if (name == backend_name(backend)) return backend;
    }
    return std::nullopt;
}

// Compiled in and built for the host ISA rather than emulated
static bool backend_is_compiled_native(PackBackend backend) {
    switch (backend) {
        case PackBackend::Scalar:
            return true;
        case PackBackend::Sse41:
#if !defined(BITNUC_DISABLE_SSE_PACK)
            return sse_pack_is_native();
#else
            return false;
#endif
        case PackBackend::Avx2:
#if !defined(BITNUC_DISABLE_AVX2_PACK)
            return avx2_pack_is_native();
#else
            return false;
#endif
        case PackBackend::Neon:
#if !defined(BITNUC_DISABLE_NEON_PACK)
            return neon_pack_is_native();
#else
            return false;
#endif
    }
    return false;
}

static bool backend_is_compiled(PackBackend backend) {
    switch (backend) {
        case PackBackend::Scalar:
            return true;
        case PackBackend::Sse41:
#if !defined(BITNUC_DISABLE_SSE_PACK)
            return true;
#else
            return false;
#endif
        case PackBackend::Avx2:
#if !defined(BITNUC_DISABLE_AVX2_PACK)
            return true;
#else
            return false;
#endif
        case PackBackend::Neon:
#if !defined(BITNUC_DISABLE_NEON_PACK)
            return true;
#else
            return false;
#endif
    }
    return false;
}

static bool cpu_supports(PackBackend backend) {
    const CpuFeatures& cpu = CpuFeatures::get();
    switch (backend) {
        case PackBackend::Scalar: return true;
        case PackBackend::Sse41: return cpu.has_sse41;
        case PackBackend::Avx2: return cpu.has_avx2;
        case PackBackend::Neon: return cpu.has_neon;
    }
    return false;
}

bool backend_is_native(PackBackend backend) {
    return backend_is_compiled_native(backend) && cpu_supports(backend);
}

bool backend_is_runnable(PackBackend backend) {
    if (!backend_is_compiled(backend)) return false;
    // Emulated builds only use baseline instructions of the host
    if (!backend_is_compiled_native(backend)) return true;
    return cpu_supports(backend);
}

std::vector<PackBackend> runnable_backends() {
    std::vector<PackBackend> backends;
    for (PackBackend backend : {PackBackend::Scalar, PackBackend::Sse41, PackBackend::Avx2, PackBackend::Neon}) {
        if (backend_is_runnable(backend)) backends.push_back(backend);
    }
    return backends;
}

PackBackend choose_backend(const char* requested) {
    if (requested && *requested) {
        std::optional<PackBackend> pinned = backend_from_name(requested);
        if (pinned && backend_is_native(*pinned)) {
            BITNUC_DEBUG_LOG("BITNUC_BACKEND pins the " << backend_name(*pinned) << " backend");
            return *pinned;
        }
        BITNUC_DEBUG_LOG("Ignoring BITNUC_BACKEND=" << requested << ", not a native backend on this host");
    }

    for (PackBackend backend : backend_priority) {
        if (backend_is_native(backend)) return backend;
    }
    return PackBackend::Scalar;
}

PackBackend active_backend() {
    static const PackBackend selected = []() {
        PackBackend backend = choose_backend(std::getenv("BITNUC_BACKEND"));
        BITNUC_DEBUG_LOG("Selected " << backend_name(backend) << " pack backend");
        return backend;
    }();
    return selected;
}

static PackResult run_backend(PackBackend backend, const uint8_t* seq, size_t len) {
    switch (backend) {
#if !defined(BITNUC_DISABLE_AVX2_PACK)
        case PackBackend::Avx2: return avx2_pack_2bit(seq, len);
#endif
#if !defined(BITNUC_DISABLE_SSE_PACK)
        case PackBackend::Sse41: return sse_pack_2bit(seq, len);
#endif
#if !defined(BITNUC_DISABLE_NEON_PACK)
        case PackBackend::Neon: return neon_pack_2bit(seq, len);
#endif
        default: return scalar_pack_2bit(seq, len);
    }
}

static uint64_t pack_checked(PackBackend backend, const uint8_t* seq, size_t len) {
    PackResult result = run_backend(backend, seq, len);

    // Validate against the scalar reference implementation
    if (is_debug_enabled() && backend != PackBackend::Scalar) {
        const PackResult reference = scalar_pack_2bit(seq, len);
        if (reference.packed != result.packed || reference.invalid_index != result.invalid_index) {
            BITNUC_DEBUG_LOG("MISMATCH DETECTED - " << backend_name(backend) << " packed=" << result.packed
                << " invalid_index=" << result.invalid_index << ", scalar packed=" << reference.packed
                << " invalid_index=" << reference.invalid_index << " for " << len << " bytes");
        }
    }

    if (!result.ok()) {
        const size_t position = static_cast<size_t>(result.invalid_index);
        throw NucleotideError::invalid_base(seq[position], position);
    }
    return result.packed;
}

uint64_t as_2bit(std::string_view seq) {
    if (seq.size() > MAX_PACKED_BASES) {
        throw NucleotideError::sequence_too_long(seq.size());
    }
    return pack_checked(active_backend(), reinterpret_cast<const uint8_t*>(seq.data()), seq.size());
}

uint64_t as_2bit(const std::vector<uint8_t>& seq) {
    return as_2bit(std::string_view(reinterpret_cast<const char*>(seq.data()), seq.size()));
}

uint64_t as_2bit_with(PackBackend backend, std::string_view seq) {
    if (seq.size() > MAX_PACKED_BASES) {
        throw NucleotideError::sequence_too_long(seq.size());
    }
    if (!backend_is_runnable(backend)) {
        throw BackendUnavailableException(std::string("Pack backend ") + backend_name(backend) +
            " is not available on this host");
    }
    BITNUC_DEBUG_LOG("Explicit " << backend_name(backend) << " pack of " << seq.size() << " bytes");
    return pack_checked(backend, reinterpret_cast<const uint8_t*>(seq.data()), seq.size());
}
