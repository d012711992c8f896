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
#include <cstddef>
#include <cstdint>

// Backends report failures as a value so the hot loops carry no throw sites
struct PackResult {
    uint64_t packed = 0;
    // Index of the first non-nucleotide byte in scan order, -1 when the input was valid
    int invalid_index = -1;

    bool ok() const { return invalid_index < 0; }
};
