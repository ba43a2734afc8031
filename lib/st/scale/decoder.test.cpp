/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <thread>
#include <st/common/test.hpp>
#include <st/scale/decoder.hpp>
#include <st/scale/test-types.hpp>
#include <st/scale/value.hpp>

using namespace scale_turbo;
using namespace scale_turbo::scale;

namespace {
    struct decode_result {
        value val;
        size_t remaining;
    };

    decode_result decode_hex(const std::string_view hex, const type_id id, const decode_options &opts={})
    {
        const auto data = uint8_vector::from_hex(hex);
        cursor c { data };
        value_visitor v {};
        auto val = decode(c, id, test_types::get().reg, v, opts);
        return { std::move(val), c.remaining() };
    }

    std::string decode_str(const std::string_view hex, const type_id id)
    {
        return to_string(decode_hex(hex, id).val);
    }

    template<typename T>
    size_t remaining_after(const std::string_view hex, const type_id id, visitor<T> &v)
    {
        const auto data = uint8_vector::from_hex(hex);
        cursor c { data };
        decode(c, id, test_types::get().reg, v);
        return c.remaining();
    }

    template<typename F>
    decode_error expect_decode_error(const F &f)
    {
        try {
            f();
        } catch (const decode_error &ex) {
            return ex;
        }
        throw error("a decode_error was expected but nothing has been thrown");
    }

    decode_error decode_error_of(const std::string_view hex, const type_id id, const decode_options &opts={})
    {
        return expect_decode_error([&] { decode_hex(hex, id, opts); });
    }

    // reads only the first child of every container
    struct first_item_visitor: visitor<size_t> {
        size_t visit_unexpected(visit_kind, type_id, const decode_path &) override
        {
            return 0;
        }

        size_t visit_sequence(sequence_reader &r, type_id, const decode_path &) override
        {
            return _first(r);
        }

        size_t visit_array(array_reader &r, type_id, const decode_path &) override
        {
            return _first(r);
        }

        size_t visit_tuple(tuple_reader &r, type_id, const decode_path &) override
        {
            return _first(r);
        }

        size_t visit_composite(composite_reader &r, type_id, const decode_path &) override
        {
            return _first(r);
        }

        size_t visit_variant(variant_reader &r, type_id, const decode_path &) override
        {
            return _first(r.fields());
        }
    private:
        template<typename R>
        size_t _first(R &r)
        {
            ignore_visitor ign {};
            return r.decode_item(ign) ? 1 : 0;
        }
    };

    // looks a field up by name and falls back to the second field of unnamed composites
    struct field_visitor: visitor<uint64_t> {
        size_t fallbacks = 0;

        explicit field_visitor(const std::string_view name): _name { name }
        {
        }

        uint64_t visit_u8(const uint8_t v, type_id, const decode_path &) override
        {
            return v;
        }

        uint64_t visit_u32(const uint32_t v, type_id, const decode_path &) override
        {
            return v;
        }

        uint64_t visit_str(str_reader &r, type_id, const decode_path &) override
        {
            return r.size();
        }

        uint64_t visit_composite(composite_reader &r, type_id, const decode_path &) override
        {
            return _field(r);
        }

        uint64_t visit_variant(variant_reader &r, type_id, const decode_path &) override
        {
            return _field(r.fields());
        }
    private:
        std::string _name;

        uint64_t _field(composite_reader &r)
        {
            try {
                return r.decode_field(_name, *this);
            } catch (const decode_error &ex) {
                if (ex.kind() != error_kind::no_field_name_available)
                    throw;
                ++fallbacks;
                // nothing has been consumed so the positional access starts from the first field
                test_same(r.remaining(), r.size());
                r.skip(1);
                return *r.decode_item(*this);
            }
        }
    };

    struct limit_visitor: value_visitor {
        value visit_u32(const uint32_t v, const type_id id, const decode_path &path) override
        {
            if (v > 10)
                throw decode_error::custom(path, fmt::format("{} is above the limit", v));
            return value_visitor::visit_u32(v, id, path);
        }
    };

    struct domain_failure: std::exception {
        const char *what() const noexcept override
        {
            return "domain failure";
        }
    };

    struct failing_visitor: value_visitor {
        value visit_u16(uint16_t, type_id, const decode_path &) override
        {
            throw domain_failure {};
        }
    };

    struct u8_only_visitor: visitor<int> {
        int visit_u8(const uint8_t v, type_id, const decode_path &) override
        {
            return v;
        }
    };

    struct bytes_visitor: visitor<buffer> {
        buffer visit_sequence(sequence_reader &r, type_id, const decode_path &) override
        {
            return r.bytes();
        }

        buffer visit_array(array_reader &r, type_id, const decode_path &) override
        {
            return r.bytes();
        }
    };
}

suite scale_decoder_suite = [] {
    "scale::decoder"_test = [] {
        const auto &t = test_types::get();
        "unsigned integers"_test = [&] {
            test_same(decode_str("2A", t.u8), std::string { "42" });
            test_same(decode_str("3412", t.u16), std::string { "4660" });
            test_same(decode_str("78563412", t.u32), std::string { "305419896" });
            test_same(decode_str("FFFFFFFFFFFFFFFF", t.u64), std::string { "18446744073709551615" });
            test_same(decode_str("01000000000000000000000000000000", t.u128), std::string { "1" });
            test_same(decode_str("02" + std::string(62, '0'), t.u256), std::string { "2" });
        };
        "signed integers"_test = [&] {
            test_same(decode_str("FF", t.i8), std::string { "-1" });
            test_same(decode_str("FEFF", t.i16), std::string { "-2" });
            test_same(decode_str("00000080", t.i32), std::string { "-2147483648" });
            test_same(decode_str("FFFFFFFFFFFFFFFF", t.i64), std::string { "-1" });
            test_same(decode_str(std::string(32, 'F'), t.i128), std::string { "-1" });
            test_same(decode_str("0A" + std::string(30, '0'), t.i128), std::string { "10" });
            test_same(decode_str(std::string(64, 'F'), t.i256), std::string { "-1" });
        };
        "bool, char, str and bytes"_test = [&] {
            test_same(decode_str("01", t.boolean), std::string { "true" });
            test_same(decode_str("00", t.boolean), std::string { "false" });
            test_same(decode_str("41000000", t.character), std::string { "'A'" });
            test_same(decode_str("AC200000", t.character), std::string { "'\xE2\x82\xAC'" });
            test_same(decode_str("1468656C6C6F", t.str), std::string { "\"hello\"" });
            test_same(decode_str("00", t.str), std::string { "\"\"" });
            test_same(decode_str("0CAABBCC", t.bytes), std::string { "0xAABBCC" });
        };
        "invalid primitives"_test = [&] {
            test_same(decode_error_of("02", t.boolean).kind(), error_kind::invalid_bool);
            test_same(decode_error_of("00D80000", t.character).kind(), error_kind::invalid_char);
            test_same(decode_error_of("00001100", t.character).kind(), error_kind::invalid_char);
            test_same(decode_error_of("0000", t.i32).kind(), error_kind::unexpected_end);
            test_same(decode_error_of("14AA", t.str).kind(), error_kind::unexpected_end);
            test_same(decode_error_of("08FFFE", t.str).kind(), error_kind::invalid_str);
            test_same(decode_error_of("", t.u8).kind(), error_kind::unexpected_end);
        };
        "strings are validated on access"_test = [&] {
            ignore_visitor ign {};
            test_same(remaining_after("08FFFE", t.str, ign), 0);
        };
        "containers"_test = [&] {
            test_same(decode_str("0100000002000000", t.point), std::string { "Point { x: 1, y: 2 }" });
            test_same(decode_str("0705000000", t.unnamed), std::string { "Unnamed(7, 5)" });
            test_same(decode_str("0C010203", t.seq_u8), std::string { "(1, 2, 3)" });
            test_same(decode_str("01020304", t.arr_u8_4), std::string { "(1, 2, 3, 4)" });
            test_same(decode_str("070C616263", t.pair), std::string { "(7, \"abc\")" });
            test_same(decode_str("00", t.shape), std::string { "Empty" });
            test_same(decode_str("0107", t.shape), std::string { "Byte(7)" });
            test_same(decode_str("0305000000086869", t.shape), std::string { "Named { x: 5, y: \"hi\" }" });
            test_same(decode_str("0105000000", t.option_u32), std::string { "Some(5)" });
            test_same(decode_str("140D", t.bits), std::string { "<10110>" });
            test_same(decode_str("3412", t.outer), std::string { "Outer { a: Middle { b: Inner { c: 4660 } } }" });
            test_same(decode_str("01010102010300", t.list),
                std::string { "Cons(Node { val: 1, next: Cons(Node { val: 2, next: Cons(Node { val: 3, next: Nil }) }) })" });
        };
        "full consumption"_test = [&] {
            test_same(decode_hex("0100000002000000EEFF", t.point).remaining, 2);
            test_same(decode_hex("0305000000086869EE", t.shape).remaining, 1);
            test_same(decode_hex("0C010203EE", t.seq_u8).remaining, 1);
            test_same(decode_hex("01010102010300EE", t.list).remaining, 1);
            test_same(decode_hex("0101EE", t.compact_u32).remaining, 1);
        };
        "skip equivalence"_test = [&] {
            const std::vector<std::pair<std::string, type_id>> samples {
                { "3412", t.outer },
                { "0100000002000000", t.point },
                { "0705000000", t.unnamed },
                { "0305000000086869", t.shape },
                { "0107", t.shape },
                { "00", t.shape },
                { "08010103020000000C616263", t.shapes },
                { "01020304", t.arr_u8_4 },
                { "0C010203", t.seq_u8 },
                { "080100000002000000", t.seq_u32 },
                { "070C616263", t.pair },
                { "01010102010300", t.list },
                { "0105000000", t.option_u32 },
                { "140D", t.bits },
                { "DEADBEEF", t.hash },
                { "0C", t.seq_marker }
            };
            for (const auto &[hex, id]: samples) {
                const auto data = hex + "EE";
                ignore_visitor ign {};
                first_item_visitor first {};
                value_visitor full {};
                const auto after_ign = remaining_after(data, id, ign);
                test_same(fmt::format("{} ignore", hex), after_ign, 1);
                test_same(fmt::format("{} first item", hex), remaining_after(data, id, first), after_ign);
                test_same(fmt::format("{} full", hex), remaining_after(data, id, full), after_ign);
            }
        };
        "error path of a nested field"_test = [&] {
            const auto ex = decode_error_of("34", t.outer);
            test_same(ex.kind(), error_kind::unexpected_end);
            expect(ex.path() == decode_path { field_segment { "a" }, field_segment { "b" }, field_segment { "c" } });
            test_same(ex.path().to_string(), std::string { ".a.b.c" });
            expect(std::string_view { ex.what() }.starts_with("unexpected end of data at .a.b.c: ")) << ex.what();
        };
        "error path through sequences and variants"_test = [&] {
            const auto ex = decode_error_of("080101030200000008FFFE", t.shapes);
            test_same(ex.kind(), error_kind::invalid_str);
            expect(ex.path() == decode_path { array_index_segment { 1 }, variant_field_segment { "Named", std::string { "y" } } });
            test_same(ex.path().to_string(), std::string { ".1.Named.y" });
            const auto unnamed_ex = decode_error_of("07050000", t.unnamed);
            test_same(unnamed_ex.path().to_string(), std::string { ".1" });
            const auto tuple_ex = decode_error_of("0710", t.pair);
            expect(tuple_ex.path() == decode_path { tuple_index_segment { 1 } });
        };
        "unknown variant discriminant"_test = [&] {
            const auto data = uint8_vector::from_hex("02AABB");
            cursor c { data };
            ignore_visitor ign {};
            const auto ex = expect_decode_error([&] { decode(c, t.shape, t.reg, ign); });
            test_same(ex.kind(), error_kind::unknown_variant_discriminant);
            expect(ex.path().empty());
            // exactly the discriminant byte has been consumed
            test_same(c.remaining(), 2);
        };
        "compact values"_test = [&] {
            test_same(decode_hex("FC", t.compact_u32).val, value { uint128_t { 63 } });
            const auto min_two = decode_hex("0101", t.compact_u32);
            test_same(min_two.val, value { uint128_t { 64 } });
            test_same(min_two.remaining, 0);
            test_same(decode_hex("FDFF", t.compact_u32).val, value { uint128_t { 16383 } });
            test_same(decode_hex("02000100", t.compact_u32).val, value { uint128_t { 16384 } });
            test_same(decode_str("33FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF", t.compact_u128), std::string { "340282366920938463463374607431768211455" });
            // the target type is reached through a single-field composite
            test_same(decode_str("0101", t.compact_wrapped), std::string { "64" });
            test_same(decode_error_of("00", t.compact_str).kind(), error_kind::unsupported_type);
            test_same(decode_error_of("0700000000FF", t.compact_u32).kind(), error_kind::invalid_compact_encoding);
        };
        "strict and lenient compact lengths"_test = [&] {
            const auto ex = decode_error_of("0100", t.seq_u8);
            test_same(ex.kind(), error_kind::invalid_compact_encoding);
            decode_options lenient {};
            lenient.strict_compact = false;
            const auto res = decode_hex("0100", t.seq_u8, lenient);
            test_same(to_string(res.val), std::string { "()" });
            test_same(res.remaining, 0);
        };
        "recursion limit"_test = [&] {
            decode_options opts {};
            opts.max_depth = 7;
            test_same(decode_hex("01010102010300", t.list, opts).remaining, 0);
            opts.max_depth = 6;
            test_same(decode_error_of("01010102010300", t.list, opts).kind(), error_kind::recursion_limit_exceeded);
            // skipping is subject to the same limit
            const auto data = uint8_vector::from_hex("01010102010300");
            ignore_visitor ign {};
            expect(throws<decode_error>([&] { decode(data, t.list, t.reg, ign, opts); }));
        };
        "missing types"_test = [&] {
            const auto ex = decode_error_of("00", 12345);
            test_same(ex.kind(), error_kind::type_id_not_found);
            expect(ex.path().empty());
            const auto nested = decode_error_of("00", t.dangling);
            test_same(nested.kind(), error_kind::type_id_not_found);
            test_same(nested.path().to_string(), std::string { ".f" });
        };
        "access by name and by position"_test = [&] {
            field_visitor y_v { "y" };
            test_same(decode(uint8_vector::from_hex("0100000002000000"), t.point, t.reg, y_v), uint64_t { 2 });
            test_same(decode(uint8_vector::from_hex("0305000000086869"), t.shape, t.reg, y_v), uint64_t { 2 });
            test_same(y_v.fallbacks, 0);
            test_same(remaining_after("0100000002000000", t.point, y_v), 0);
            // unnamed composites fail without consuming anything and the visitor falls back to positions
            test_same(decode(uint8_vector::from_hex("0705000000"), t.unnamed, t.reg, y_v), uint64_t { 5 });
            test_same(y_v.fallbacks, 1);
            field_visitor z_v { "z" };
            const auto ex = expect_decode_error([&] { decode(uint8_vector::from_hex("0100000002000000"), t.point, t.reg, z_v); });
            test_same(ex.kind(), error_kind::unknown_field);
        };
        "fields behind the current position are unknown"_test = [&] {
            struct backwards_visitor: visitor<int> {
                int visit_u32(const uint32_t v, type_id, const decode_path &) override
                {
                    return static_cast<int>(v);
                }

                int visit_composite(composite_reader &r, type_id, const decode_path &) override
                {
                    const auto y = r.decode_field("y", *this);
                    return y + r.decode_field("x", *this);
                }
            };
            backwards_visitor v {};
            const auto ex = expect_decode_error([&] { decode(uint8_vector::from_hex("0100000002000000"), t.point, t.reg, v); });
            test_same(ex.kind(), error_kind::unknown_field);
        };
        "custom visitor errors"_test = [&] {
            limit_visitor v {};
            const auto ex = expect_decode_error([&] { decode(uint8_vector::from_hex("0100000014000000"), t.point, t.reg, v); });
            test_same(ex.kind(), error_kind::custom);
            test_same(ex.path().to_string(), std::string { ".y" });
            test_same(std::string { ex.what() }, std::string { "custom error at .y: 20 is above the limit" });
            failing_visitor fv {};
            expect(throws<domain_failure>([&] { decode(uint8_vector::from_hex("3412"), t.outer, t.reg, fv); }));
        };
        "unsupported shapes"_test = [&] {
            u8_only_visitor v {};
            test_same(decode(uint8_vector::from_hex("2A"), t.u8, t.reg, v), 42);
            const auto ex = expect_decode_error([&] { decode(uint8_vector::from_hex("00"), t.str, t.reg, v); });
            test_same(ex.kind(), error_kind::unsupported_type);
            expect(std::string_view { ex.what() }.find("str") != std::string_view::npos) << ex.what();
        };
        "raw bytes of u8 containers"_test = [&] {
            const auto data = uint8_vector::from_hex("0C010203EE");
            cursor c { data };
            bytes_visitor v {};
            const auto bytes = decode(c, t.seq_u8, t.reg, v);
            expect(bytes.data() == data.data() + 1);
            test_same(bytes.size(), 3);
            test_same(c.remaining(), 1);
            test_same(decode(uint8_vector::from_hex("DEADBEEF"), t.arr_u8_4, t.reg, v), buffer { uint8_vector::from_hex("DEADBEEF") });
            const auto ex = expect_decode_error([&] { decode(uint8_vector::from_hex("0801000000"), t.seq_u32, t.reg, v); });
            test_same(ex.kind(), error_kind::unsupported_type);
        };
        "truncated u8 containers"_test = [&] {
            for (const auto &sample: std::vector<std::pair<std::string, type_id>> { { "0102", t.arr_u8_4 }, { "100102", t.seq_u8 } }) {
                const auto &hex = sample.first;
                const auto id = sample.second;
                const auto data = uint8_vector::from_hex(hex);
                value_visitor full {};
                ignore_visitor ign {};
                first_item_visitor first {};
                bytes_visitor raw {};
                const auto full_ex = expect_decode_error([&] { decode(data, id, t.reg, full); });
                test_same(hex, full_ex.kind(), error_kind::unexpected_end);
                test_same(hex, full_ex.path().to_string(), std::string { ".2" });
                for (const auto &ex: { expect_decode_error([&] { decode(data, id, t.reg, ign); }),
                        expect_decode_error([&] { decode(data, id, t.reg, first); }),
                        expect_decode_error([&] { decode(data, id, t.reg, raw); }) }) {
                    test_same(hex, ex.kind(), full_ex.kind());
                    expect(ex.path() == full_ex.path()) << hex << ex.path().to_string();
                    test_same(hex, std::string { ex.what() }, std::string { full_ex.what() });
                }
            }
        };
        "elements without bytes"_test = [&] {
            ignore_visitor ign {};
            first_item_visitor first {};
            // 2^30 - 1 elements declared by a four-byte compact length
            test_same(remaining_after("FEFFFFFFEE", t.seq_unit, ign), 1);
            test_same(remaining_after("FEFFFFFFEE", t.seq_marker, ign), 1);
            test_same(remaining_after("FEFFFFFFEE", t.seq_marker, first), 1);
            test_same(decode_hex("0CEE", t.seq_marker).remaining, 1);
            // the elements are still subject to the depth limit
            decode_options opts {};
            opts.max_depth = 3;
            test_same(decode_hex("04EE", t.seq_marker, opts).remaining, 1);
            test_same(remaining_after("04EE", t.seq_marker, ign), 1);
            opts.max_depth = 2;
            const auto data = uint8_vector::from_hex("04EE");
            const auto ex = expect_decode_error([&] { decode(data, t.seq_marker, t.reg, ign, opts); });
            test_same(ex.kind(), error_kind::recursion_limit_exceeded);
            test_same(ex.path().to_string(), std::string { ".0.u" });
            test_same(decode_error_of("04EE", t.seq_marker, opts).path(), ex.path());
        };
        "composite fields by position"_test = [&] {
            struct second_field_visitor: visitor<uint32_t> {
                uint32_t visit_u32(const uint32_t v, type_id, const decode_path &) override
                {
                    return v;
                }

                uint32_t visit_composite(composite_reader &r, type_id, const decode_path &) override
                {
                    const auto y = r.decode_item_at(1, *this);
                    test_same(r.remaining(), 0);
                    expect(throws([&] { r.decode_item_at(0, *this); }));
                    expect(!r.decode_item_at(2, *this));
                    return y ? *y : 0;
                }
            };
            second_field_visitor v {};
            const auto data = uint8_vector::from_hex("0100000002000000EE");
            cursor c { data };
            test_same(decode(c, t.point, t.reg, v), uint32_t { 2 });
            test_same(c.remaining(), 1);
        };
        "reader positions"_test = [&] {
            struct positions_visitor: visitor<size_t> {
                size_t visit_u32(const uint32_t v, type_id, const decode_path &) override
                {
                    return v;
                }

                size_t visit_sequence(sequence_reader &r, type_id, const decode_path &) override
                {
                    test_same(r.size(), 4);
                    test_same(r.bytes_from_start().size(), 18);
                    test_same(r.bytes_from_undecoded().size(), 17);
                    const auto third = r.decode_item_at(2, *this);
                    test_same(r.remaining(), 1);
                    test_same(r.bytes_from_undecoded().size(), 5);
                    expect(throws([&] { r.decode_item_at(1, *this); }));
                    expect(!r.decode_item_at(4, *this));
                    return third ? *third : 0;
                }
            };
            positions_visitor v {};
            const auto data = uint8_vector::from_hex("1001000000020000000300000004000000EE");
            cursor c { data };
            test_same(decode(c, t.seq_u32, t.reg, v), 3);
            test_same(c.remaining(), 1);
        };
        "concurrent decoding"_test = [&] {
            const auto data_a = uint8_vector::from_hex("0305000000086869");
            const auto data_b = uint8_vector::from_hex("01010102010300");
            const std::string exp_a { "Named { x: 5, y: \"hi\" }" };
            const std::string exp_b = decode_str("01010102010300", t.list);
            std::atomic_size_t mismatches { 0 };
            const auto worker = [&](const uint8_vector &data, const type_id id, const std::string &exp) {
                for (size_t i = 0; i < 1000; ++i) {
                    cursor c { data };
                    value_visitor v {};
                    if (to_string(decode(c, id, t.reg, v)) != exp || !c.empty())
                        ++mismatches;
                }
            };
            std::thread ta { [&] { worker(data_a, t.shape, exp_a); } };
            std::thread tb { [&] { worker(data_b, t.list, exp_b); } };
            ta.join();
            tb.join();
            test_same(mismatches.load(), 0);
        };
    };
};
