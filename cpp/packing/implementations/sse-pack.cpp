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

#include "../include/sse-pack.h"

#if !defined(BITNUC_DISABLE_SSE_PACK)
#include <cstring>
#include <vector>
#include <boost/align/aligned_allocator.hpp>
#define SIMDE_ENABLE_NATIVE_ALIASES
#include <simde/x86/sse4.1.h>
#include "../../symbols/symbol-table.h"

static thread_local std::vector<uint8_t, boost::alignment::aligned_allocator<uint8_t, 16>> sse_tail_buffer(16);

bool sse_pack_is_native() {
#if defined(SIMDE_X86_SSE4_1_NATIVE)
    return true;
#else
    return false;
#endif
}

BITNUC_ALWAYS_INLINE static __m128i sse_load_chunk(const uint8_t* src, size_t remaining) {
    if (remaining >= 16) {
        return _mm_loadu_si128(reinterpret_cast<const __m128i*>(src));
    }
    uint8_t* staging = sse_tail_buffer.data();
    std::memset(staging, 'A', 16);
    std::memcpy(staging, src, remaining);
    return _mm_load_si128(reinterpret_cast<const __m128i*>(staging));
}

// 16 lanes of codes -> 32 bits, same multiply-add folding as the AVX2 path
BITNUC_ALWAYS_INLINE static uint32_t sse_pack_codes(__m128i codes) {
    const __m128i pairs = _mm_maddubs_epi16(codes, _mm_set1_epi16(0x0401));
    const __m128i quads = _mm_madd_epi16(pairs, _mm_set1_epi32(0x00100001));
    const __m128i gathered = _mm_shuffle_epi8(quads, _mm_setr_epi8(
        0, 4, 8, 12, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1
    ));
    return static_cast<uint32_t>(_mm_extract_epi32(gathered, 0));
}

/**
 * SSE4.1 2-bit packer
 *
 * Two 16-lane chunks at most. Chunks are validated in scan order, so the
 * first chunk holding an invalid lane also holds the first invalid byte.
 * The tail chunk is staged with 'A' filler.
 *
 * @param seq ASCII nucleotides, either case
 * @param len Number of bytes in seq, at most 32
 * @return Packed value, or the index of the first invalid byte
 */
BITNUC_HOT BITNUC_FLATTEN PackResult sse_pack_2bit(const uint8_t* seq, size_t len) {
    PackResult result;

    const __m128i code_lut = _mm_load_si128(reinterpret_cast<const __m128i*>(nibble_code_lut));
    const __m128i letter_lut = _mm_load_si128(reinterpret_cast<const __m128i*>(nibble_letter_lut));
    const __m128i low_nibble = _mm_set1_epi8(0x0F);
    const __m128i case_bit = _mm_set1_epi8(0x20);

    for (size_t offset = 0; offset < len; offset += 16) {
        const size_t remaining = len - offset;
        const __m128i bases = sse_load_chunk(seq + offset, remaining);
        const __m128i nibbles = _mm_and_si128(bases, low_nibble);
        const __m128i folded = _mm_or_si128(bases, case_bit);
        const __m128i expected = _mm_shuffle_epi8(letter_lut, nibbles);

        const uint32_t valid = static_cast<uint32_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(folded, expected)));
        const uint32_t live = remaining >= 16 ? 0xFFFFu : ((1u << remaining) - 1u);
        const uint32_t invalid = ~valid & live;
        if (invalid) {
            result.packed = 0;
            result.invalid_index = static_cast<int>(offset) + __builtin_ctz(invalid);
            return result;
        }

        const __m128i codes = _mm_shuffle_epi8(code_lut, nibbles);
        result.packed |= static_cast<uint64_t>(sse_pack_codes(codes)) << (2 * offset);
    }
    return result;
}
#endif
