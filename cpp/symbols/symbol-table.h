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
#include <cstdint>

// Sentinel for bytes that are not a nucleotide; real codes only use the low two bits
static constexpr uint8_t INVALID_BASE = 0xFF;

// ASCII -> 2-bit code. A/a=00, C/c=01, G/g=10, T/t=11
static constexpr uint8_t nucleotide_encode_table[256] = {
    // 0..63
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    // 64..79 ('A'=0, 'C'=1, 'G'=2)
    255,  0,255,  1,255,255,255,  2,255,255,255,255,255,255,255,255,
    // 80..95 ('T'=3)
    255,255,255,255,  3,255,255,255,255,255,255,255,255,255,255,255,
    // 96..111 ('a'=0, 'c'=1, 'g'=2)
    255,  0,255,  1,255,255,255,  2,255,255,255,255,255,255,255,255,
    // 112..127 ('t'=3)
    255,255,255,255,  3,255,255,255,255,255,255,255,255,255,255,255,
    // 128..255 invalid
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255
};

// 2-bit code -> canonical uppercase ASCII
static constexpr char nucleotide_decode_table[4] = {'A', 'C', 'G', 'T'};

/*
 * Nibble-indexed form of the encode table for 16-entry byte shuffles.
 * The low nibble of an input byte picks a candidate code and the lowercase
 * letter owning that nibble ('a'=1, 'c'=3, 'g'=7, 't'=4). The byte is a
 * nucleotide iff (byte | 0x20) equals that letter. Unused nibbles hold 0,
 * which never equals a byte with bit 5 set.
 */
alignas(16) static constexpr uint8_t nibble_code_lut[16] = {
    0, 0, 0, 1, 3, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 0
};
alignas(16) static constexpr uint8_t nibble_letter_lut[16] = {
    0, 'a', 0, 'c', 't', 0, 0, 'g', 0, 0, 0, 0, 0, 0, 0, 0
};

constexpr uint8_t encode_base(uint8_t byte) {
    return nucleotide_encode_table[byte];
}

constexpr char decode_base(uint8_t code) {
    return nucleotide_decode_table[code & 0b11];
}
