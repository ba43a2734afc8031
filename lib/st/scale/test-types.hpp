/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_TEST_TYPES_HPP
#define SCALE_TURBO_SCALE_TEST_TYPES_HPP

#include <st/scale/registry.hpp>

namespace scale_turbo::scale {
    // a registry shared by the unit tests, read-only after construction
    struct test_types {
        static const test_types &get()
        {
            static const test_types types {};
            return types;
        }

        type_registry reg {};
        const type_id u8 = reg.add_primitive(primitive_kind::u8);
        const type_id u16 = reg.add_primitive(primitive_kind::u16);
        const type_id u32 = reg.add_primitive(primitive_kind::u32);
        const type_id u64 = reg.add_primitive(primitive_kind::u64);
        const type_id u128 = reg.add_primitive(primitive_kind::u128);
        const type_id u256 = reg.add_primitive(primitive_kind::u256);
        const type_id i8 = reg.add_primitive(primitive_kind::i8);
        const type_id i16 = reg.add_primitive(primitive_kind::i16);
        const type_id i32 = reg.add_primitive(primitive_kind::i32);
        const type_id i64 = reg.add_primitive(primitive_kind::i64);
        const type_id i128 = reg.add_primitive(primitive_kind::i128);
        const type_id i256 = reg.add_primitive(primitive_kind::i256);
        const type_id boolean = reg.add_primitive(primitive_kind::boolean);
        const type_id character = reg.add_primitive(primitive_kind::character);
        const type_id str = reg.add_primitive(primitive_kind::str);
        const type_id bytes = reg.add_primitive(primitive_kind::bytes);
        const type_id compact_u32 = reg.add_compact(u32);
        const type_id compact_u128 = reg.add_compact(u128);
        const type_id wrapped_u64 = reg.add_composite({ { {}, u64 } }, { "demo", "Balance" });
        const type_id compact_wrapped = reg.add_compact(wrapped_u64);
        const type_id compact_str = reg.add_compact(str);
        const type_id seq_u8 = reg.add_sequence(u8);
        const type_id seq_u32 = reg.add_sequence(u32);
        const type_id arr_u8_4 = reg.add_array(u8, 4);
        const type_id pair = reg.add_tuple({ u8, str });
        const type_id inner = reg.add_composite({ { "c", u16 } }, { "demo", "Inner" });
        const type_id middle = reg.add_composite({ { "b", inner } }, { "demo", "Middle" });
        const type_id outer = reg.add_composite({ { "a", middle } }, { "demo", "Outer" });
        const type_id point = reg.add_composite({ { "x", u32 }, { "y", u32 } }, { "demo", "Point" });
        const type_id unnamed = reg.add_composite({ { {}, u8 }, { {}, u32 } }, { "demo", "Unnamed" });
        const type_id shape = reg.add_variant({
            { 0, "Empty", {} },
            { 1, "Byte", { { {}, u8 } } },
            { 3, "Named", { { "x", u32 }, { "y", str } } }
        }, { "demo", "Shape" });
        const type_id shapes = reg.add_sequence(shape);
        const type_id option_u32 = reg.add_variant({
            { 0, "None", {} },
            { 1, "Some", { { {}, u32 } } }
        }, { "Option" });
        const type_id bits = reg.add_bit_sequence(bit_store::u8, bit_order::lsb0);
        const type_id hash = reg.add_composite({ { {}, arr_u8_4 } }, { "demo", "H32" });
        const type_id list = reg.reserve();
        const type_id node = reg.add_composite({ { "val", u8 }, { "next", list } }, { "demo", "Node" });
        const type_id dangling = reg.add_composite({ { "f", 999 } }, { "demo", "Dangling" });
        const type_id unit = reg.add_tuple({});
        const type_id marker = reg.add_composite({ { "u", unit } }, { "demo", "Marker" });
        const type_id seq_unit = reg.add_sequence(unit);
        const type_id seq_marker = reg.add_sequence(marker);

        test_types(const test_types &) =delete;
    private:
        test_types()
        {
            reg.define(list, type_def { { "demo", "List" }, variant_def { {
                { 0, "Nil", {} },
                { 1, "Cons", { { {}, node } } }
            } } });
        }
    };
}

#endif // !SCALE_TURBO_SCALE_TEST_TYPES_HPP
