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

#include "include/unpacker.h"
#include "../symbols/symbol-table.h"

std::string from_2bit(uint64_t packed, size_t length) {
    if (length > MAX_PACKED_BASES) {
        throw NucleotideError::invalid_length(length);
    }

    std::string sequence;
    sequence.reserve(length);
    for (size_t i = 0; i < length; i++) {
        sequence += decode_base(static_cast<uint8_t>((packed >> (2 * i)) & 0b11));
    }
    return sequence;
}
