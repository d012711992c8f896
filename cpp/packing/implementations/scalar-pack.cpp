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

#include "../include/scalar-pack.h"
#include "../../symbols/symbol-table.h"

/**
 * Scalar 2-bit packer
 *
 * Walks the input left to right, stopping at the first byte the symbol
 * table rejects. Callers guarantee len <= MAX_PACKED_BASES.
 *
 * @param seq ASCII nucleotides, either case
 * @param len Number of bytes in seq
 * @return Packed value, or the index of the first invalid byte
 */
BITNUC_HOT BITNUC_FLATTEN PackResult scalar_pack_2bit(const uint8_t* seq, size_t len) {
    PackResult result;
    for (size_t i = 0; i < len; i++) {
        const uint8_t code = encode_base(seq[i]);
        if (code == INVALID_BASE) {
            result.packed = 0;
            result.invalid_index = static_cast<int>(i);
            return result;
        }
        result.packed |= static_cast<uint64_t>(code) << (2 * i);
    }
    return result;
}
