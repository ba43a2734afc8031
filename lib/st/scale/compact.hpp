/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_COMPACT_HPP
#define SCALE_TURBO_SCALE_COMPACT_HPP

#include <st/big-int.hpp>
#include <st/scale/cursor.hpp>

/*
 * Compact integers select the encoding by the two lowest bits of the first byte:
 * 0b00 - a single byte, the value is stored in the upper six bits: 0 .. 63
 * 0b01 - two bytes little-endian, the value is stored in the upper fourteen bits: 64 .. 2^14 - 1
 * 0b10 - four bytes little-endian, the value is stored in the upper thirty bits: 2^14 .. 2^30 - 1
 * 0b11 - the upper six bits plus four is the number of the following little-endian value bytes
 */
namespace scale_turbo::scale::compact {
    static constexpr uint64_t max_single_byte = (1ULL << 6) - 1;
    static constexpr uint64_t max_two_bytes = (1ULL << 14) - 1;
    static constexpr uint64_t max_four_bytes = (1ULL << 30) - 1;

    // max_bits must be one of 8, 16, 32, 64, 128
    // strict rejects encodings that use a longer mode than the value requires
    extern uint128_t decode(cursor &c, size_t max_bits, bool strict=true);

    inline uint64_t decode_u64(cursor &c, const size_t max_bits=64, const bool strict=true)
    {
        return static_cast<uint64_t>(decode(c, max_bits, strict));
    }

    // lengths of sequences, strings and bit sequences
    inline uint32_t decode_length(cursor &c, const bool strict=true)
    {
        return static_cast<uint32_t>(decode(c, 32, strict));
    }
}

#endif // !SCALE_TURBO_SCALE_COMPACT_HPP
