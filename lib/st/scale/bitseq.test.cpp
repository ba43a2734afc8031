/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/common/test.hpp>
#include <st/scale/bitseq.hpp>

using namespace scale_turbo;
using namespace scale_turbo::scale;

namespace {
    bit_sequence decode_hex(const std::string_view hex, const bit_store store, const bit_order order, size_t *num_bytes=nullptr)
    {
        const auto data = uint8_vector::from_hex(hex);
        cursor c { data };
        auto res = bitseq::decode(c, bit_sequence_def { store, order });
        if (num_bytes)
            *num_bytes = data.size() - c.remaining();
        return res;
    }
}

suite scale_bitseq_suite = [] {
    "scale::bitseq"_test = [] {
        "lsb0 over u8"_test = [] {
            // 5 bits of 0b00001101
            size_t num_bytes = 0;
            const auto bits = decode_hex("140D", bit_store::u8, bit_order::lsb0, &num_bytes);
            test_same(num_bytes, 2);
            test_same(bits.size(), 5);
            test_same(fmt::format("{}", bits), std::string { "<10110>" });
        };
        "msb0 over u8"_test = [] {
            const auto bits = decode_hex("140D", bit_store::u8, bit_order::msb0);
            test_same(fmt::format("{}", bits), std::string { "<00001>" });
        };
        "multiple words"_test = [] {
            // 10 bits take two u8 words
            size_t num_bytes = 0;
            const auto bits = decode_hex("28FF02AA", bit_store::u8, bit_order::lsb0, &num_bytes);
            test_same(num_bytes, 3);
            test_same(fmt::format("{}", bits), std::string { "<1111111101>" });
        };
        "u16 words are little-endian"_test = [] {
            size_t num_bytes = 0;
            const auto bits = decode_hex("400100", bit_store::u16, bit_order::msb0, &num_bytes);
            test_same(num_bytes, 3);
            test_same(bits.size(), 16);
            expect(bits[15]);
            for (size_t i = 0; i < 15; ++i)
                expect(!bits[i]);
            const auto lsb = decode_hex("400100", bit_store::u16, bit_order::lsb0);
            expect(lsb[0]);
            test_same(lsb.store, bit_store::u16);
            test_same(lsb.order, bit_order::lsb0);
        };
        "u64 store"_test = [] {
            size_t num_bytes = 0;
            const auto bits = decode_hex("0C0000000000000080", bit_store::u64, bit_order::msb0, &num_bytes);
            test_same(num_bytes, 9);
            test_same(fmt::format("{}", bits), std::string { "<100>" });
        };
        "empty"_test = [] {
            size_t num_bytes = 0;
            const auto bits = decode_hex("00", bit_store::u32, bit_order::lsb0, &num_bytes);
            test_same(num_bytes, 1);
            test_same(bits.size(), 0);
        };
        "failures"_test = [] {
            const auto kind_of = [](const std::string_view hex) {
                try {
                    decode_hex(hex, bit_store::u32, bit_order::lsb0);
                } catch (const codec_error &ex) {
                    return ex.kind();
                }
                throw error(fmt::format("decoding of {} was expected to fail", hex));
            };
            // not enough bytes for a single u32 word
            test_same(kind_of("04FFFF"), error_kind::invalid_bit_sequence);
            // a truncated length prefix
            test_same(kind_of("01"), error_kind::invalid_bit_sequence);
            test_same(kind_of(""), error_kind::invalid_bit_sequence);
            // a non-canonical length prefix
            test_same(kind_of("0100"), error_kind::invalid_bit_sequence);
        };
    };
};
