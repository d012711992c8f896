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

#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include "../../global.h"

// Widest first within each instruction-set family
enum class PackBackend { Scalar, Sse41, Avx2, Neon };

/**
 * Pack up to 32 nucleotides into a uint64_t, two bits per base.
 *
 * Position i lands in bits [2i, 2i+1], so "ACGT" becomes 0b11100100.
 * Lowercase input packs to the same value as uppercase.
 *
 * @throws NucleotideError SequenceTooLong when seq has more than 32 bytes,
 *         InvalidBase carrying the first offending byte otherwise
 */
uint64_t as_2bit(std::string_view seq);
uint64_t as_2bit(const std::vector<uint8_t>& seq);

/**
 * Same as as_2bit but runs one named backend instead of the dispatched one.
 * @throws BackendUnavailableException if the backend cannot run on this host
 */
uint64_t as_2bit_with(PackBackend backend, std::string_view seq);

// Backend chosen for this process, fixed after the first call
PackBackend active_backend();

/*
 * Selection policy behind active_backend(). requested is the value of
 * BITNUC_BACKEND (may be null) and is only honored for a native backend.
 */
PackBackend choose_backend(const char* requested);

// Compiled in, built for the host ISA and confirmed by the CPU probe
bool backend_is_native(PackBackend backend);
// Native, or compiled through SIMDe emulation
bool backend_is_runnable(PackBackend backend);
std::vector<PackBackend> runnable_backends();

const char* backend_name(PackBackend backend);
std::optional<PackBackend> backend_from_name(std::string_view name);
