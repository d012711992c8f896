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

#include "../include/neon-pack.h"

#if !defined(BITNUC_DISABLE_NEON_PACK)
#include <cstring>
#include <vector>
#include <boost/align/aligned_allocator.hpp>
#define SIMDE_ENABLE_NATIVE_ALIASES
#include <simde/arm/neon.h>
#include "../../symbols/symbol-table.h"

static thread_local std::vector<uint8_t, boost::alignment::aligned_allocator<uint8_t, 16>> neon_tail_buffer(16);

// vqtbl1q_u8 and vminvq_u8 are AArch64 only
bool neon_pack_is_native() {
#if defined(SIMDE_ARM_NEON_A64V8_NATIVE)
    return true;
#else
    return false;
#endif
}

BITNUC_ALWAYS_INLINE static uint8x16_t neon_load_chunk(const uint8_t* src, size_t remaining) {
    if (remaining >= 16) {
        return vld1q_u8(src);
    }
    uint8_t* staging = neon_tail_buffer.data();
    std::memset(staging, 'A', 16);
    std::memcpy(staging, src, remaining);
    return vld1q_u8(staging);
}

// Narrow each 0x00/0xFF lane to a nibble: lane i owns bits [4i, 4i+3]
BITNUC_ALWAYS_INLINE static uint64_t neon_lane_mask(uint8x16_t lanes) {
    const uint8x8_t narrowed = vshrn_n_u16(vreinterpretq_u16_u8(lanes), 4);
    return vget_lane_u64(vreinterpret_u64_u8(narrowed), 0);
}

/*
 * 16 lanes of codes -> 32 bits by shift-or narrowing:
 * u16 lanes become c0 | c1 << 2, u32 lanes four codes, u64 lanes eight.
 */
BITNUC_ALWAYS_INLINE static uint32_t neon_pack_codes(uint8x16_t codes) {
    uint16x8_t pairs = vreinterpretq_u16_u8(codes);
    pairs = vandq_u16(vorrq_u16(pairs, vshrq_n_u16(pairs, 6)), vdupq_n_u16(0x000F));

    uint32x4_t quads = vreinterpretq_u32_u16(pairs);
    quads = vandq_u32(vorrq_u32(quads, vshrq_n_u32(quads, 12)), vdupq_n_u32(0x000000FF));

    uint64x2_t octets = vreinterpretq_u64_u32(quads);
    octets = vandq_u64(vorrq_u64(octets, vshrq_n_u64(octets, 24)), vdupq_n_u64(0xFFFF));

    return static_cast<uint32_t>(vgetq_lane_u64(octets, 0) | (vgetq_lane_u64(octets, 1) << 16));
}

/**
 * NEON 2-bit packer
 *
 * Same table-lookup validation as the x86 paths with vqtbl1q_u8 in place of
 * pshufb. NEON has no movemask, so a chunk is first checked with a min
 * reduction and only a failing chunk pays for building the lane mask.
 *
 * @param seq ASCII nucleotides, either case
 * @param len Number of bytes in seq, at most 32
 * @return Packed value, or the index of the first invalid byte
 */
BITNUC_HOT BITNUC_FLATTEN PackResult neon_pack_2bit(const uint8_t* seq, size_t len) {
    PackResult result;

    const uint8x16_t code_lut = vld1q_u8(nibble_code_lut);
    const uint8x16_t letter_lut = vld1q_u8(nibble_letter_lut);
    const uint8x16_t low_nibble = vdupq_n_u8(0x0F);
    const uint8x16_t case_bit = vdupq_n_u8(0x20);

    for (size_t offset = 0; offset < len; offset += 16) {
        const uint8x16_t bases = neon_load_chunk(seq + offset, len - offset);
        const uint8x16_t nibbles = vandq_u8(bases, low_nibble);
        const uint8x16_t folded = vorrq_u8(bases, case_bit);
        const uint8x16_t expected = vqtbl1q_u8(letter_lut, nibbles);
        const uint8x16_t valid = vceqq_u8(folded, expected);

        // Padded lanes hold 'A' and always pass
        if (vminvq_u8(valid) != 0xFFu) {
            const uint64_t invalid = neon_lane_mask(vmvnq_u8(valid));
            result.packed = 0;
            result.invalid_index = static_cast<int>(offset) + __builtin_ctzll(invalid) / 4;
            return result;
        }

        const uint8x16_t codes = vqtbl1q_u8(code_lut, nibbles);
        result.packed |= static_cast<uint64_t>(neon_pack_codes(codes)) << (2 * offset);
    }
    return result;
}
#endif
