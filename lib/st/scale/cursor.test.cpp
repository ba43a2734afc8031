/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/common/test.hpp>
#include <st/scale/cursor.hpp>

using namespace scale_turbo;
using namespace scale_turbo::scale;

suite scale_cursor_suite = [] {
    "scale::cursor"_test = [] {
        "read little-endian"_test = [] {
            const auto data = uint8_vector::from_hex("2A3412785634120123456789ABCDEF");
            cursor c { data };
            test_same(c.read<uint8_t>(), uint8_t { 0x2A });
            test_same(c.read<uint16_t>(), uint16_t { 0x1234 });
            test_same(c.read<uint32_t>(), uint32_t { 0x12345678 });
            test_same(c.read<uint64_t>(), uint64_t { 0xEFCDAB8967452301ULL });
            test_same(c.remaining(), 0);
        };
        "advance past the end"_test = [] {
            const auto data = uint8_vector::from_hex("010203");
            cursor c { data };
            c.advance(2);
            test_same(c.remaining(), 1);
            expect(throws<codec_error>([&] { c.advance(2); }));
            // a failed advance does not move the view
            test_same(c.remaining(), 1);
            test_same(c.read_byte(), uint8_t { 3 });
            expect(c.empty());
            expect(throws<codec_error>([&] { c.read_byte(); }));
        };
        "take is zero-copy"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            cursor c { data };
            const cursor start = c;
            const auto b = c.take(3);
            expect(b.data() == data.data());
            test_same(b.size(), 3);
            test_same(c.consumed_since(start), 3);
            expect(c.data().data() == data.data() + 3);
        };
        "error kind"_test = [] {
            cursor c {};
            try {
                c.read<uint32_t>();
                expect(false);
            } catch (const codec_error &ex) {
                expect(ex.kind() == error_kind::unexpected_end);
            }
        };
    };
};
