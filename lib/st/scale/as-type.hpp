/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_AS_TYPE_HPP
#define SCALE_TURBO_SCALE_AS_TYPE_HPP

#include <algorithm>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>
#include <st/scale/value.hpp>

namespace scale_turbo::scale {
    namespace detail {
        template<typename T>
        struct is_vector: std::false_type {};

        template<typename U>
        struct is_vector<std::vector<U>>: std::true_type {};

        template<typename T>
        struct is_optional: std::false_type {};

        template<typename U>
        struct is_optional<std::optional<U>>: std::true_type {};

        template<typename T>
        struct is_byte_array: std::false_type {};

        template<size_t SZ>
        struct is_byte_array<byte_array<SZ>>: std::true_type {};

        template<typename T>
        concept integer_target = std::is_integral_v<T> && !std::is_same_v<T, bool>;

        template<typename T>
        concept supported_target = std::is_same_v<T, bool> || integer_target<T> || std::is_same_v<T, std::string>
            || is_vector<T>::value || is_optional<T>::value || is_byte_array<T>::value;

        template<typename T>
        struct as_visitor: visitor<T> {
            using base_type = visitor<T>;

            T visit_bool(const bool v, const type_id id, const decode_path &path) override
            {
                if constexpr (std::is_same_v<T, bool>)
                    return v;
                else
                    return base_type::visit_bool(v, id, path);
            }

            T visit_u8(const uint8_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::u8, id, path);
            }

            T visit_u16(const uint16_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::u16, id, path);
            }

            T visit_u32(const uint32_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::u32, id, path);
            }

            T visit_u64(const uint64_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::u64, id, path);
            }

            T visit_u128(const uint128_t &v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::u128, id, path);
            }

            T visit_i8(const int8_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::i8, id, path);
            }

            T visit_i16(const int16_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::i16, id, path);
            }

            T visit_i32(const int32_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::i32, id, path);
            }

            T visit_i64(const int64_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::i64, id, path);
            }

            T visit_i128(const int128_t &v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::i128, id, path);
            }

            T visit_compact_u8(const uint8_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::compact_u8, id, path);
            }

            T visit_compact_u16(const uint16_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::compact_u16, id, path);
            }

            T visit_compact_u32(const uint32_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::compact_u32, id, path);
            }

            T visit_compact_u64(const uint64_t v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::compact_u64, id, path);
            }

            T visit_compact_u128(const uint128_t &v, const type_id id, const decode_path &path) override
            {
                return _integer(v, visit_kind::compact_u128, id, path);
            }

            T visit_str(str_reader &r, const type_id id, const decode_path &path) override
            {
                if constexpr (std::is_same_v<T, std::string>)
                    return r.to_string();
                else
                    return base_type::visit_str(r, id, path);
            }

            T visit_bytes(const buffer v, const type_id id, const decode_path &path) override
            {
                if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
                    return T { v.begin(), v.end() };
                } else if constexpr (is_byte_array<T>::value) {
                    if (v.size() != std::tuple_size_v<typename T::base_type>) [[unlikely]]
                        throw decode_error::custom(path, fmt::format("expected {} bytes but got {}", std::tuple_size_v<typename T::base_type>, v.size()));
                    return T { v };
                } else {
                    return base_type::visit_bytes(v, id, path);
                }
            }

            T visit_sequence(sequence_reader &r, const type_id id, const decode_path &path) override
            {
                if constexpr (is_vector<T>::value || is_byte_array<T>::value)
                    return _items(r, path);
                else
                    return base_type::visit_sequence(r, id, path);
            }

            T visit_array(array_reader &r, const type_id id, const decode_path &path) override
            {
                if constexpr (is_vector<T>::value || is_byte_array<T>::value)
                    return _items(r, path);
                else
                    return base_type::visit_array(r, id, path);
            }

            T visit_tuple(tuple_reader &r, const type_id id, const decode_path &path) override
            {
                if constexpr (is_vector<T>::value) {
                    using U = typename T::value_type;
                    as_visitor<U> item_v {};
                    T res {};
                    while (!r.done())
                        res.emplace_back(*r.decode_item(item_v));
                    return res;
                } else {
                    if (r.size() == 1)
                        return *r.decode_item(*this);
                    return base_type::visit_tuple(r, id, path);
                }
            }

            // single-field wrappers such as Compact<T> newtypes or H256 are unwrapped transparently
            T visit_composite(composite_reader &r, const type_id id, const decode_path &path) override
            {
                if (r.size() == 1)
                    return *r.decode_item(*this);
                return base_type::visit_composite(r, id, path);
            }

            T visit_variant(variant_reader &r, const type_id id, const decode_path &path) override
            {
                if constexpr (is_optional<T>::value) {
                    if (r.name() == "None" && r.remaining() == 0)
                        return T {};
                    if (r.name() == "Some" && r.remaining() == 1) {
                        as_visitor<typename T::value_type> inner_v {};
                        return T { *r.decode_item(inner_v) };
                    }
                    throw decode_error::custom(path, fmt::format("an optional value must be None or Some but got {}", r.name()));
                } else {
                    return base_type::visit_variant(r, id, path);
                }
            }
        private:
            template<typename V>
            T _integer(const V &v, const visit_kind kind, const type_id id, const decode_path &path)
            {
                if constexpr (integer_target<T>) {
                    const cpp_int val { v };
                    if (val < cpp_int { std::numeric_limits<T>::min() } || val > cpp_int { std::numeric_limits<T>::max() }) [[unlikely]]
                        throw decode_error::custom(path, fmt::format("{} value {} does not fit into the {}-bit {} target",
                            visit_kind_name(kind), val, sizeof(T) * 8, std::is_signed_v<T> ? "signed" : "unsigned"));
                    return static_cast<T>(val);
                } else {
                    return base_type::visit_unexpected(kind, id, path);
                }
            }

            template<typename R>
            T _items(R &r, const decode_path &path)
            {
                if constexpr (is_byte_array<T>::value) {
                    // the fixed-width byte array shortcut: no per-element decoding
                    constexpr size_t num_bytes = std::tuple_size_v<typename T::base_type>;
                    if (r.size() != num_bytes) [[unlikely]]
                        throw decode_error::custom(path, fmt::format("expected {} bytes but got {} elements", num_bytes, r.size()));
                    return T { r.bytes() };
                } else {
                    using U = typename T::value_type;
                    if constexpr (std::is_same_v<U, uint8_t>) {
                        if (r.u8_items()) {
                            const auto bytes = r.bytes();
                            return T { bytes.begin(), bytes.end() };
                        }
                    }
                    T res {};
                    as_visitor<U> item_v {};
                    res.reserve(std::min(r.remaining(), r.bytes_from_undecoded().size()));
                    while (!r.done())
                        res.emplace_back(*r.decode_item(item_v));
                    return res;
                }
            }
        };
    }

    template<typename T>
    T decode_as(cursor &c, const type_id id, const type_resolver &types, const decode_options &opts={})
    {
        if constexpr (std::is_same_v<T, value>) {
            value_visitor v {};
            return decode(c, id, types, v, opts);
        } else {
            static_assert(detail::supported_target<T>, "an unsupported target type!");
            detail::as_visitor<T> v {};
            return decode(c, id, types, v, opts);
        }
    }

    template<typename T>
    T decode_as(const buffer bytes, const type_id id, const type_resolver &types, const decode_options &opts={})
    {
        cursor c { bytes };
        return decode_as<T>(c, id, types, opts);
    }
}

#endif // !SCALE_TURBO_SCALE_AS_TYPE_HPP
