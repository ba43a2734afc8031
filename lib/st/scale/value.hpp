/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_VALUE_HPP
#define SCALE_TURBO_SCALE_VALUE_HPP

#include <st/scale/decoder.hpp>

namespace scale_turbo::scale {
    struct value;

    // records, sequences, arrays and tuples
    struct composite_value {
        // the short name of the record type, empty for anonymous types
        std::string type_name {};
        // empty when the items have no names, otherwise one per item
        std::vector<std::string> names {};
        std::vector<value> items {};

        size_t size() const noexcept;

        bool named() const noexcept
        {
            return !names.empty();
        }

        const value &at(size_t idx) const;
        const value &at(std::string_view name) const;
        bool operator==(const composite_value &o) const;
    };

    struct variant_value {
        std::string name {};
        composite_value fields {};

        bool operator==(const variant_value &o) const;
    };

    struct u256_value {
        byte_array<32> bytes {};

        bool operator==(const u256_value &o) const =default;
    };

    struct i256_value {
        byte_array<32> bytes {};

        bool operator==(const i256_value &o) const =default;
    };

    struct value {
        using storage_type = std::variant<bool, char32_t, uint128_t, int128_t, u256_value, i256_value,
            std::string, uint8_vector, composite_value, variant_value, bit_sequence>;

        storage_type data;

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(data);
        }

        template<typename T>
        const T &as() const
        {
            if (const auto *v = std::get_if<T>(&data); v) [[likely]]
                return *v;
            throw error(fmt::format("a value of type index {} does not hold the requested type", data.index()));
        }

        const composite_value &composite() const
        {
            return as<composite_value>();
        }

        const variant_value &variant() const
        {
            return as<variant_value>();
        }

        bool operator==(const value &o) const
        {
            return data == o.data;
        }
    };

    inline size_t composite_value::size() const noexcept
    {
        return items.size();
    }

    // decodes data of any type into a value: integers are widened to 128 bits,
    // sequences, arrays and tuples become composites without names
    struct value_visitor: visitor<value> {
        value visit_bool(bool v, type_id, const decode_path &) override;
        value visit_char(char32_t v, type_id, const decode_path &) override;
        value visit_u8(uint8_t v, type_id, const decode_path &) override;
        value visit_u16(uint16_t v, type_id, const decode_path &) override;
        value visit_u32(uint32_t v, type_id, const decode_path &) override;
        value visit_u64(uint64_t v, type_id, const decode_path &) override;
        value visit_u128(const uint128_t &v, type_id, const decode_path &) override;
        value visit_u256(const byte_array<32> &v, type_id, const decode_path &) override;
        value visit_i8(int8_t v, type_id, const decode_path &) override;
        value visit_i16(int16_t v, type_id, const decode_path &) override;
        value visit_i32(int32_t v, type_id, const decode_path &) override;
        value visit_i64(int64_t v, type_id, const decode_path &) override;
        value visit_i128(const int128_t &v, type_id, const decode_path &) override;
        value visit_i256(const byte_array<32> &v, type_id, const decode_path &) override;
        value visit_str(str_reader &r, type_id, const decode_path &) override;
        value visit_bytes(buffer v, type_id, const decode_path &) override;
        value visit_compact_u8(uint8_t v, type_id, const decode_path &) override;
        value visit_compact_u16(uint16_t v, type_id, const decode_path &) override;
        value visit_compact_u32(uint32_t v, type_id, const decode_path &) override;
        value visit_compact_u64(uint64_t v, type_id, const decode_path &) override;
        value visit_compact_u128(const uint128_t &v, type_id, const decode_path &) override;
        value visit_sequence(sequence_reader &r, type_id, const decode_path &) override;
        value visit_array(array_reader &r, type_id, const decode_path &) override;
        value visit_tuple(tuple_reader &r, type_id, const decode_path &) override;
        value visit_composite(composite_reader &r, type_id, const decode_path &) override;
        value visit_variant(variant_reader &r, type_id, const decode_path &) override;
        value visit_bit_sequence(const bit_sequence &v, type_id, const decode_path &) override;
    };

    inline value decode_value(const buffer bytes, const type_id id, const type_resolver &types, const decode_options &opts={})
    {
        value_visitor v {};
        return decode(bytes, id, types, v, opts);
    }

    extern std::string to_string(const value &v);
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", scale_turbo::scale::to_string(v));
        }
    };
}

#endif // !SCALE_TURBO_SCALE_VALUE_HPP
