/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/scale/bitseq.hpp>
#include <st/scale/compact.hpp>

namespace scale_turbo::scale::bitseq {
    bit_sequence decode(cursor &c, const bit_sequence_def &def, const bool strict)
    {
        uint32_t num_bits;
        try {
            num_bits = compact::decode_length(c, strict);
        } catch (const codec_error &ex) {
            throw codec_error(error_kind::invalid_bit_sequence, fmt::format("invalid length prefix: {}", ex.detail()));
        }
        const size_t word_bytes = bit_store_bytes(def.store);
        const size_t word_bits = word_bytes * 8;
        const size_t num_words = (static_cast<size_t>(num_bits) + word_bits - 1) / word_bits;
        if (num_words * word_bytes > c.remaining()) [[unlikely]]
            throw codec_error(error_kind::invalid_bit_sequence,
                fmt::format("{} bits stored in {} words need {} bytes but only {} remain",
                    num_bits, def.store, num_words * word_bytes, c.remaining()));
        bit_sequence res { {}, def.store, def.order };
        res.bits.reserve(num_bits);
        for (size_t w = 0; w < num_words; ++w) {
            const auto bytes = c.take(word_bytes);
            uint64_t word = 0;
            for (size_t i = 0; i < word_bytes; ++i)
                word |= static_cast<uint64_t>(bytes[i]) << (i * 8);
            for (size_t i = 0; i < word_bits && res.bits.size() < num_bits; ++i) {
                const size_t shift = def.order == bit_order::lsb0 ? i : word_bits - 1 - i;
                res.bits.push_back((word >> shift) & 1);
            }
        }
        return res;
    }
}
