/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_VISITOR_HPP
#define SCALE_TURBO_SCALE_VISITOR_HPP

#include <variant>
#include <st/array.hpp>
#include <st/big-int.hpp>
#include <st/scale/bitseq.hpp>
#include <st/scale/error.hpp>
#include <st/scale/types.hpp>

namespace scale_turbo::scale {
    enum class visit_kind: uint8_t {
        boolean, character,
        u8, u16, u32, u64, u128, u256,
        i8, i16, i32, i64, i128, i256,
        str, bytes,
        compact_u8, compact_u16, compact_u32, compact_u64, compact_u128,
        sequence, array, tuple, composite, variant, bit_sequence
    };

    extern const char *visit_kind_name(visit_kind kind) noexcept;

    struct str_reader;
    struct sequence_reader;
    struct array_reader;
    struct tuple_reader;
    struct composite_reader;
    struct variant_reader;

    /*
     * The decoder calls exactly one method per decoded value. The readers passed to the container
     * methods are valid only for the duration of the call and so are the buffers and str_reader views,
     * which reference the input bytes. Whatever a container method leaves unread is skipped by the
     * decoder once the method returns.
     */
    template<typename T>
    struct visitor {
        using value_type = T;

        virtual ~visitor() =default;

        virtual T visit_bool(bool, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::boolean, id, path);
        }

        virtual T visit_char(char32_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::character, id, path);
        }

        virtual T visit_u8(uint8_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u8, id, path);
        }

        virtual T visit_u16(uint16_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u16, id, path);
        }

        virtual T visit_u32(uint32_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u32, id, path);
        }

        virtual T visit_u64(uint64_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u64, id, path);
        }

        virtual T visit_u128(const uint128_t &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u128, id, path);
        }

        // the raw little-endian bytes
        virtual T visit_u256(const byte_array<32> &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::u256, id, path);
        }

        virtual T visit_i8(int8_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i8, id, path);
        }

        virtual T visit_i16(int16_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i16, id, path);
        }

        virtual T visit_i32(int32_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i32, id, path);
        }

        virtual T visit_i64(int64_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i64, id, path);
        }

        virtual T visit_i128(const int128_t &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i128, id, path);
        }

        // the raw little-endian two's complement bytes
        virtual T visit_i256(const byte_array<32> &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::i256, id, path);
        }

        virtual T visit_str(str_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::str, id, path);
        }

        virtual T visit_bytes(buffer, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::bytes, id, path);
        }

        virtual T visit_compact_u8(uint8_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::compact_u8, id, path);
        }

        virtual T visit_compact_u16(uint16_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::compact_u16, id, path);
        }

        virtual T visit_compact_u32(uint32_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::compact_u32, id, path);
        }

        virtual T visit_compact_u64(uint64_t, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::compact_u64, id, path);
        }

        virtual T visit_compact_u128(const uint128_t &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::compact_u128, id, path);
        }

        virtual T visit_sequence(sequence_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::sequence, id, path);
        }

        virtual T visit_array(array_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::array, id, path);
        }

        virtual T visit_tuple(tuple_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::tuple, id, path);
        }

        virtual T visit_composite(composite_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::composite, id, path);
        }

        virtual T visit_variant(variant_reader &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::variant, id, path);
        }

        virtual T visit_bit_sequence(const bit_sequence &, const type_id id, const decode_path &path)
        {
            return visit_unexpected(visit_kind::bit_sequence, id, path);
        }

        // the fallback of all methods that are not overridden
        virtual T visit_unexpected(const visit_kind kind, const type_id id, const decode_path &path)
        {
            throw decode_error { error_kind::unsupported_type, path,
                fmt::format("the visitor does not support {} values such as type #{}", visit_kind_name(kind), id) };
        }
    };

    // accepts everything and remembers nothing, used to skip values
    struct ignore_visitor: visitor<std::monostate> {
        std::monostate visit_unexpected(visit_kind, type_id, const decode_path &) override
        {
            return {};
        }
    };
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::visit_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", scale_turbo::scale::visit_kind_name(v));
        }
    };
}

#endif // !SCALE_TURBO_SCALE_VISITOR_HPP
