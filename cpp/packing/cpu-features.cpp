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

#include "include/cpu-features.h"
#include "../global.h"

const CpuFeatures& CpuFeatures::get() {
    static const CpuFeatures features = detect();
    return features;
}

CpuFeatures CpuFeatures::detect() {
    CpuFeatures f;

#if (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
    __builtin_cpu_init();
    f.has_sse41 = __builtin_cpu_supports("sse4.1");
    f.has_avx2 = __builtin_cpu_supports("avx2");
#elif defined(__aarch64__)
    // AdvSIMD is mandatory on AArch64
    f.has_neon = true;
#endif

    BITNUC_DEBUG_LOG("CPU probe: sse4.1=" << f.has_sse41 << " avx2=" << f.has_avx2 << " neon=" << f.has_neon);
    return f;
}
