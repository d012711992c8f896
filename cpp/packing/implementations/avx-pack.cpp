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

#include "../include/avx-pack.h"

#if !defined(BITNUC_DISABLE_AVX2_PACK)
#include <cstring>
#include <vector>
#include <boost/align/aligned_allocator.hpp>
#define SIMDE_ENABLE_NATIVE_ALIASES
#include <simde/x86/avx2.h>
#include "../../symbols/symbol-table.h"

// Staging buffer for inputs shorter than one 32-lane register
static thread_local std::vector<uint8_t, boost::alignment::aligned_allocator<uint8_t, 32>> avx2_tail_buffer(32);

bool avx2_pack_is_native() {
#if defined(SIMDE_X86_AVX2_NATIVE)
    return true;
#else
    return false;
#endif
}

BITNUC_ALWAYS_INLINE static __m256i avx2_broadcast_lut(const uint8_t* lut) {
    return _mm256_broadcastsi128_si256(_mm_load_si128(reinterpret_cast<const __m128i*>(lut)));
}

// Filler 'A' is a valid base with code 00, so padded lanes add no bits
BITNUC_ALWAYS_INLINE static __m256i avx2_load_padded(const uint8_t* seq, size_t len) {
    if (len == 32) {
        return _mm256_loadu_si256(reinterpret_cast<const __m256i*>(seq));
    }
    uint8_t* staging = avx2_tail_buffer.data();
    std::memset(staging, 'A', 32);
    std::memcpy(staging, seq, len);
    return _mm256_load_si256(reinterpret_cast<const __m256i*>(staging));
}

/**
 * Pack 32 lanes of 2-bit codes into 64 bits.
 *
 * maddubs folds byte pairs into c0 | c1 << 2, madd folds word pairs into a
 * byte holding four codes at the bottom of each dword. The shuffle gathers
 * those bytes to the front of each 128-bit half.
 */
BITNUC_ALWAYS_INLINE static uint64_t avx2_pack_codes(__m256i codes) {
    const __m256i pairs = _mm256_maddubs_epi16(codes, _mm256_set1_epi16(0x0401));
    const __m256i quads = _mm256_madd_epi16(pairs, _mm256_set1_epi32(0x00100001));
    const __m256i gathered = _mm256_shuffle_epi8(quads, _mm256_setr_epi8(
        0, 4, 8, 12, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
        0, 4, 8, 12, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1
    ));
    const uint64_t lo = static_cast<uint32_t>(_mm256_extract_epi32(gathered, 0));
    const uint64_t hi = static_cast<uint32_t>(_mm256_extract_epi32(gathered, 4));
    return lo | (hi << 32);
}

/**
 * AVX2 2-bit packer
 *
 * ALGORITHM:
 * 1. Load the whole input as one 32-lane register, padding short inputs
 *    through the aligned staging buffer
 * 2. Shuffle the low nibble of every byte through two LUTs: the candidate
 *    code and the lowercase letter owning that nibble
 * 3. A lane is valid iff (byte | 0x20) equals its letter; movemask gives one
 *    bit per lane, the lowest clear bit inside len is the first invalid byte
 * 4. Pack the codes with widening multiply-adds
 *
 * @param seq ASCII nucleotides, either case
 * @param len Number of bytes in seq, at most 32
 * @return Packed value, or the index of the first invalid byte
 */
BITNUC_HOT BITNUC_FLATTEN PackResult avx2_pack_2bit(const uint8_t* seq, size_t len) {
    PackResult result;
    if (len == 0) return result;

    const __m256i code_lut = avx2_broadcast_lut(nibble_code_lut);
    const __m256i letter_lut = avx2_broadcast_lut(nibble_letter_lut);

    const __m256i bases = avx2_load_padded(seq, len);
    const __m256i nibbles = _mm256_and_si256(bases, _mm256_set1_epi8(0x0F));
    const __m256i folded = _mm256_or_si256(bases, _mm256_set1_epi8(0x20));
    const __m256i expected = _mm256_shuffle_epi8(letter_lut, nibbles);
    const __m256i codes = _mm256_shuffle_epi8(code_lut, nibbles);

    const uint32_t valid = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(folded, expected)));
    const uint32_t live = len == 32 ? 0xFFFFFFFFu : ((1u << len) - 1u);
    const uint32_t invalid = ~valid & live;
    if (invalid) {
        result.invalid_index = __builtin_ctz(invalid);
        return result;
    }

    result.packed = avx2_pack_codes(codes);
    return result;
}
#endif
