/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <iterator>
#include <utf8cpp/utf8.h>
#include <st/scale/value.hpp>

namespace scale_turbo::scale {
    const value &composite_value::at(const size_t idx) const
    {
        if (idx >= items.size()) [[unlikely]]
            throw error(fmt::format("item #{} requested but the composite has only {} items", idx, items.size()));
        return items[idx];
    }

    const value &composite_value::at(const std::string_view name) const
    {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name)
                return items.at(i);
        }
        throw error(fmt::format("the composite does not have an item named {}", name));
    }

    bool composite_value::operator==(const composite_value &o) const
    {
        return type_name == o.type_name && names == o.names && items == o.items;
    }

    bool variant_value::operator==(const variant_value &o) const
    {
        return name == o.name && fields == o.fields;
    }

    namespace {
        void append_quoted(std::string &out, const std::string_view s, const char quote)
        {
            out += quote;
            for (const char ch: s) {
                switch (ch) {
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n"; break;
                    case '\t': out += "\\t"; break;
                    default:
                        if (ch == quote)
                            out += '\\';
                        out += ch;
                        break;
                }
            }
            out += quote;
        }

        void append_value(std::string &out, const value &v);

        void append_composite(std::string &out, const std::string_view name, const composite_value &c)
        {
            out += name;
            if (c.named()) {
                if (!name.empty())
                    out += ' ';
                out += "{ ";
                for (size_t i = 0; i < c.size(); ++i) {
                    if (i)
                        out += ", ";
                    out += c.names.at(i);
                    out += ": ";
                    append_value(out, c.items[i]);
                }
                out += c.size() ? " }" : "}";
                return;
            }
            // named unit types and variants without fields are rendered by their name only
            if (!name.empty() && c.items.empty())
                return;
            out += '(';
            for (size_t i = 0; i < c.size(); ++i) {
                if (i)
                    out += ", ";
                append_value(out, c.items[i]);
            }
            out += ')';
        }

        void append_value(std::string &out, const value &v)
        {
            std::visit([&](const auto &x) {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, bool>) {
                    out += x ? "true" : "false";
                } else if constexpr (std::is_same_v<T, char32_t>) {
                    std::string s {};
                    ::utf8::append(static_cast<::utf8::utfchar32_t>(x), std::back_inserter(s));
                    append_quoted(out, s, '\'');
                } else if constexpr (std::is_same_v<T, uint128_t> || std::is_same_v<T, int128_t>) {
                    out += fmt::format("{}", x);
                } else if constexpr (std::is_same_v<T, u256_value>) {
                    out += fmt::format("{}", big_uint_from_le_bytes(x.bytes));
                } else if constexpr (std::is_same_v<T, i256_value>) {
                    out += fmt::format("{}", big_int_from_le_bytes(x.bytes));
                } else if constexpr (std::is_same_v<T, std::string>) {
                    append_quoted(out, x, '"');
                } else if constexpr (std::is_same_v<T, uint8_vector>) {
                    out += fmt::format("0x{}", x);
                } else if constexpr (std::is_same_v<T, composite_value>) {
                    append_composite(out, x.type_name, x);
                } else if constexpr (std::is_same_v<T, variant_value>) {
                    append_composite(out, x.name, x.fields);
                } else if constexpr (std::is_same_v<T, bit_sequence>) {
                    out += fmt::format("{}", x);
                } else {
                    static_assert(sizeof(T) == 0, "an unsupported value type!");
                }
            }, v.data);
        }

        template<typename R>
        composite_value read_items(R &r, visitor<value> &v)
        {
            composite_value res {};
            // the size comes from the input so the reservation is limited by the number of available bytes
            res.items.reserve(std::min(r.remaining(), r.bytes_from_undecoded().size()));
            while (!r.done())
                res.items.emplace_back(*r.decode_item(v));
            return res;
        }

        composite_value read_fields(composite_reader &r, visitor<value> &v)
        {
            composite_value res {};
            while (!r.done()) {
                if (const auto name = r.next_name(); name)
                    res.names.emplace_back(*name);
                res.items.emplace_back(*r.decode_item(v));
            }
            return res;
        }
    }

    std::string to_string(const value &v)
    {
        std::string res {};
        append_value(res, v);
        return res;
    }

    value value_visitor::visit_bool(const bool v, type_id, const decode_path &)
    {
        return value { v };
    }

    value value_visitor::visit_char(const char32_t v, type_id, const decode_path &)
    {
        return value { v };
    }

    value value_visitor::visit_u8(const uint8_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_u16(const uint16_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_u32(const uint32_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_u64(const uint64_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_u128(const uint128_t &v, type_id, const decode_path &)
    {
        return value { v };
    }

    value value_visitor::visit_u256(const byte_array<32> &v, type_id, const decode_path &)
    {
        return value { u256_value { v } };
    }

    value value_visitor::visit_i8(const int8_t v, type_id, const decode_path &)
    {
        return value { int128_t { v } };
    }

    value value_visitor::visit_i16(const int16_t v, type_id, const decode_path &)
    {
        return value { int128_t { v } };
    }

    value value_visitor::visit_i32(const int32_t v, type_id, const decode_path &)
    {
        return value { int128_t { v } };
    }

    value value_visitor::visit_i64(const int64_t v, type_id, const decode_path &)
    {
        return value { int128_t { v } };
    }

    value value_visitor::visit_i128(const int128_t &v, type_id, const decode_path &)
    {
        return value { v };
    }

    value value_visitor::visit_i256(const byte_array<32> &v, type_id, const decode_path &)
    {
        return value { i256_value { v } };
    }

    value value_visitor::visit_str(str_reader &r, type_id, const decode_path &)
    {
        return value { r.to_string() };
    }

    value value_visitor::visit_bytes(const buffer v, type_id, const decode_path &)
    {
        return value { uint8_vector { v } };
    }

    value value_visitor::visit_compact_u8(const uint8_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_compact_u16(const uint16_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_compact_u32(const uint32_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_compact_u64(const uint64_t v, type_id, const decode_path &)
    {
        return value { uint128_t { v } };
    }

    value value_visitor::visit_compact_u128(const uint128_t &v, type_id, const decode_path &)
    {
        return value { v };
    }

    value value_visitor::visit_sequence(sequence_reader &r, type_id, const decode_path &)
    {
        return value { read_items(r, *this) };
    }

    value value_visitor::visit_array(array_reader &r, type_id, const decode_path &)
    {
        return value { read_items(r, *this) };
    }

    value value_visitor::visit_tuple(tuple_reader &r, type_id, const decode_path &)
    {
        return value { read_items(r, *this) };
    }

    value value_visitor::visit_composite(composite_reader &r, type_id, const decode_path &)
    {
        auto res = read_fields(r, *this);
        if (!r.type_path().empty())
            res.type_name = r.type_path().back();
        return value { std::move(res) };
    }

    value value_visitor::visit_variant(variant_reader &r, type_id, const decode_path &)
    {
        return value { variant_value { std::string { r.name() }, read_fields(r.fields(), *this) } };
    }

    value value_visitor::visit_bit_sequence(const bit_sequence &v, type_id, const decode_path &)
    {
        return value { v };
    }
}
