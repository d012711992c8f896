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
#include <iostream>
#include <fstream>
#include <string>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

// BITNUC_NOSIMD turns off every vectorized pack backend; the scalar path is always built
#ifdef BITNUC_NOSIMD
#ifndef BITNUC_DISABLE_AVX2_PACK
#define BITNUC_DISABLE_AVX2_PACK
#endif
#ifndef BITNUC_DISABLE_SSE_PACK
#define BITNUC_DISABLE_SSE_PACK
#endif
#ifndef BITNUC_DISABLE_NEON_PACK
#define BITNUC_DISABLE_NEON_PACK
#endif
#endif


// Compiler-specific optimization attributes
#if defined(__GNUC__) || defined(__clang__)
#define BITNUC_ALWAYS_INLINE [[gnu::always_inline]] inline
#define BITNUC_HOT [[gnu::hot]]
#define BITNUC_FLATTEN [[gnu::flatten]]
#else
#define BITNUC_ALWAYS_INLINE inline
#define BITNUC_HOT
#define BITNUC_FLATTEN
#endif


// Debug logging infrastructure - check environment variable at runtime
inline bool is_debug_enabled() {
    static bool cached_result = []() {
        const char* env = std::getenv("BITNUC_DEBUG");
        return env && std::string(env) == "1";
    }();
    return cached_result;
}

// Optional file sink for debug output, BITNUC_DEBUG_FILE=<path>
inline const char* debug_log_path() {
    static const char* cached_path = std::getenv("BITNUC_DEBUG_FILE");
    return cached_path;
}

#define BITNUC_DEBUG_LOG(msg) do { \
    if (is_debug_enabled()) { \
        std::cout << "DEBUG bitnuc: " << msg << std::endl; \
        if (debug_log_path()) { \
            std::ofstream logfile(debug_log_path(), std::ios::app); \
            if (logfile.is_open()) { \
                logfile << "DEBUG bitnuc: " << msg << std::endl; \
                logfile.close(); \
            } \
        } \
    } \
} while(0)

// Hex lookup table for byte dumps in messages
static constexpr char hex_lut[] = "0123456789abcdef";

// A uint64_t holds 32 two-bit codes
static constexpr size_t MAX_PACKED_BASES = 32;

// Printable form of a raw input byte, e.g. 'N' (0x4e)
inline std::string describe_byte(uint8_t byte) {
    std::string out;
    if (byte >= 0x20 && byte < 0x7f) {
        out += '\'';
        out += static_cast<char>(byte);
        out += "' ";
    }
    out += "(0x";
    out += hex_lut[byte >> 4];
    out += hex_lut[byte & 0x0F];
    out += ')';
    return out;
}

// Shared exception classes
enum class NucleotideErrorKind { InvalidBase, SequenceTooLong, InvalidLength };

// Name exposed on the Python exception's `kind` attribute
inline const char* nucleotide_error_kind_name(NucleotideErrorKind kind) {
    switch (kind) {
        case NucleotideErrorKind::InvalidBase: return "InvalidBase";
        case NucleotideErrorKind::SequenceTooLong: return "SequenceTooLong";
        case NucleotideErrorKind::InvalidLength: return "InvalidLength";
    }
    return "Unknown";
}

class NucleotideError : public std::runtime_error {
public:
    NucleotideError(NucleotideErrorKind kind, size_t value, size_t position, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), value_(value), position_(position) {}

    // First byte outside {A,C,G,T} (either case) in scan order
    static NucleotideError invalid_base(uint8_t base, size_t position) {
        return NucleotideError(NucleotideErrorKind::InvalidBase, base, position,
            "Invalid nucleotide " + describe_byte(base) + " at position " + std::to_string(position));
    }

    static NucleotideError sequence_too_long(size_t length) {
        return NucleotideError(NucleotideErrorKind::SequenceTooLong, length, 0,
            "Sequence of length " + std::to_string(length) + " exceeds " +
            std::to_string(MAX_PACKED_BASES) + " bases");
    }

    static NucleotideError invalid_length(size_t length) {
        return NucleotideError(NucleotideErrorKind::InvalidLength, length, 0,
            "Cannot unpack " + std::to_string(length) + " bases, maximum is " +
            std::to_string(MAX_PACKED_BASES));
    }

    NucleotideErrorKind kind() const noexcept { return kind_; }
    // The offending byte for InvalidBase, the offending length otherwise
    size_t value() const noexcept { return value_; }
    // Only meaningful for InvalidBase
    size_t position() const noexcept { return position_; }

private:
    NucleotideErrorKind kind_;
    size_t value_;
    size_t position_;
};

class BackendUnavailableException : public std::runtime_error {
public:
    explicit BackendUnavailableException(const std::string& msg) : std::runtime_error(msg) {}
};
