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
#include <string>
#include <cstdint>
#include "../../global.h"

/**
 * Unpack the first `length` bases of a 2-bit packed value.
 *
 * Reverses as_2bit. Bases always come back uppercase, and since the length
 * is not stored in the packed value the caller supplies it.
 *
 * @param packed Value produced by as_2bit
 * @param length Number of bases to read, at most 32
 * @return ASCII sequence of exactly `length` bytes
 * @throws NucleotideError InvalidLength when length exceeds 32
 */
std::string from_2bit(uint64_t packed, size_t length);
