/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <st/scale/compact.hpp>

namespace scale_turbo::scale::compact {
    uint128_t decode(cursor &c, const size_t max_bits, const bool strict)
    {
        switch (max_bits) {
            case 8: case 16: case 32: case 64: case 128: break;
            [[unlikely]] default: throw error(fmt::format("compact integers of {} bits are not supported!", max_bits));
        }
        const uint8_t first = c.read_byte();
        uint128_t val;
        switch (first & 0x3) {
            case 0b00:
                val = first >> 2;
                break;
            case 0b01: {
                const uint16_t raw = static_cast<uint16_t>(first | (static_cast<uint16_t>(c.read_byte()) << 8));
                val = raw >> 2;
                if (strict && val <= max_single_byte) [[unlikely]]
                    throw codec_error(error_kind::invalid_compact_encoding, fmt::format("a non-canonical two-byte encoding of {}", val));
                break;
            }
            case 0b10: {
                const auto rest = c.take(3);
                const uint32_t raw = first | (static_cast<uint32_t>(rest[0]) << 8)
                    | (static_cast<uint32_t>(rest[1]) << 16) | (static_cast<uint32_t>(rest[2]) << 24);
                val = raw >> 2;
                if (strict && val <= max_two_bytes) [[unlikely]]
                    throw codec_error(error_kind::invalid_compact_encoding, fmt::format("a non-canonical four-byte encoding of {}", val));
                break;
            }
            case 0b11: {
                const size_t num_bytes = (first >> 2) + 4;
                if (num_bytes * 8 > std::max(max_bits, size_t { 32 })) [[unlikely]]
                    throw codec_error(error_kind::invalid_compact_encoding,
                        fmt::format("a {}-byte big-integer encoding cannot hold a {}-bit value", num_bytes, max_bits));
                const auto bytes = c.take(num_bytes);
                val = uint128_from_le_bytes(bytes);
                if (strict) {
                    if (num_bytes == 4 && val <= max_four_bytes) [[unlikely]]
                        throw codec_error(error_kind::invalid_compact_encoding, fmt::format("a non-canonical big-integer encoding of {}", val));
                    if (num_bytes > 4 && bytes.back() == 0) [[unlikely]]
                        throw codec_error(error_kind::invalid_compact_encoding, fmt::format("a non-canonical {}-byte encoding of {}", num_bytes, val));
                }
                break;
            }
            default:
                throw error("internal error: unreachable compact mode");
        }
        if (max_bits < 128 && (val >> max_bits) != 0) [[unlikely]]
            throw codec_error(error_kind::invalid_compact_encoding, fmt::format("the value {} does not fit into {} bits", val, max_bits));
        return val;
    }
}
