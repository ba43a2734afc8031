/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_TYPES_HPP
#define SCALE_TURBO_SCALE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <st/common/error.hpp>
#include <st/common/format.hpp>

namespace scale_turbo::scale {
    using type_id = uint32_t;

    enum class primitive_kind: uint8_t {
        boolean, character, str, bytes,
        u8, u16, u32, u64, u128, u256,
        i8, i16, i32, i64, i128, i256
    };

    // the number of bits of integer kinds and 0 for all others
    inline size_t primitive_bits(const primitive_kind k) noexcept
    {
        switch (k) {
            case primitive_kind::u8: case primitive_kind::i8: return 8;
            case primitive_kind::u16: case primitive_kind::i16: return 16;
            case primitive_kind::u32: case primitive_kind::i32: return 32;
            case primitive_kind::u64: case primitive_kind::i64: return 64;
            case primitive_kind::u128: case primitive_kind::i128: return 128;
            case primitive_kind::u256: case primitive_kind::i256: return 256;
            default: return 0;
        }
    }

    enum class bit_order: uint8_t {
        lsb0, msb0
    };

    enum class bit_store: uint8_t {
        u8, u16, u32, u64
    };

    inline size_t bit_store_bytes(const bit_store s) noexcept
    {
        switch (s) {
            case bit_store::u16: return 2;
            case bit_store::u32: return 4;
            case bit_store::u64: return 8;
            default: return 1;
        }
    }

    struct field {
        std::optional<std::string> name {};
        type_id type = 0;
    };
    using field_list = std::vector<field>;

    // a composite's fields are either all named or all unnamed
    inline bool has_unnamed_fields(const std::span<const field> fields) noexcept
    {
        for (const auto &f: fields) {
            if (!f.name)
                return true;
        }
        return false;
    }

    struct variant_case {
        uint8_t index = 0;
        std::string name {};
        field_list fields {};
    };

    struct primitive_def {
        primitive_kind kind;
    };

    struct compact_def {
        type_id type;
    };

    struct sequence_def {
        type_id type;
    };

    struct array_def {
        type_id type;
        uint32_t len;
    };

    struct tuple_def {
        std::vector<type_id> types {};
    };

    struct composite_def {
        field_list fields {};
    };

    struct variant_def {
        std::vector<variant_case> variants {};

        const variant_case *find(const uint8_t index) const noexcept
        {
            for (const auto &v: variants) {
                if (v.index == index)
                    return &v;
            }
            return nullptr;
        }
    };

    struct bit_sequence_def {
        bit_store store = bit_store::u8;
        bit_order order = bit_order::lsb0;
    };

    using type_shape = std::variant<primitive_def, compact_def, sequence_def, array_def, tuple_def,
        composite_def, variant_def, bit_sequence_def>;

    struct type_def {
        // the name path of the type such as { "primitive_types", "H256" }, can be empty
        std::vector<std::string> path {};
        type_shape shape;

        std::string name() const
        {
            std::string res {};
            for (const auto &seg: path) {
                if (!res.empty())
                    res += "::";
                res += seg;
            }
            return res;
        }

        std::string_view short_name() const noexcept
        {
            if (path.empty())
                return {};
            return path.back();
        }
    };
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::primitive_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using scale_turbo::scale::primitive_kind;
            switch (v) {
                case primitive_kind::boolean: return fmt::format_to(ctx.out(), "bool");
                case primitive_kind::character: return fmt::format_to(ctx.out(), "char");
                case primitive_kind::str: return fmt::format_to(ctx.out(), "str");
                case primitive_kind::bytes: return fmt::format_to(ctx.out(), "bytes");
                case primitive_kind::u8: return fmt::format_to(ctx.out(), "u8");
                case primitive_kind::u16: return fmt::format_to(ctx.out(), "u16");
                case primitive_kind::u32: return fmt::format_to(ctx.out(), "u32");
                case primitive_kind::u64: return fmt::format_to(ctx.out(), "u64");
                case primitive_kind::u128: return fmt::format_to(ctx.out(), "u128");
                case primitive_kind::u256: return fmt::format_to(ctx.out(), "u256");
                case primitive_kind::i8: return fmt::format_to(ctx.out(), "i8");
                case primitive_kind::i16: return fmt::format_to(ctx.out(), "i16");
                case primitive_kind::i32: return fmt::format_to(ctx.out(), "i32");
                case primitive_kind::i64: return fmt::format_to(ctx.out(), "i64");
                case primitive_kind::i128: return fmt::format_to(ctx.out(), "i128");
                case primitive_kind::i256: return fmt::format_to(ctx.out(), "i256");
                default: return fmt::format_to(ctx.out(), "primitive_kind({})", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<scale_turbo::scale::bit_order>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using scale_turbo::scale::bit_order;
            switch (v) {
                case bit_order::lsb0: return fmt::format_to(ctx.out(), "Lsb0");
                case bit_order::msb0: return fmt::format_to(ctx.out(), "Msb0");
                default: return fmt::format_to(ctx.out(), "bit_order({})", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<scale_turbo::scale::bit_store>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "u{}", scale_turbo::scale::bit_store_bytes(v) * 8);
        }
    };

    template<>
    struct formatter<scale_turbo::scale::type_def>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace scale_turbo::scale;
            auto out_it = ctx.out();
            if (!v.path.empty())
                out_it = fmt::format_to(out_it, "{} ", v.name());
            return std::visit([&](const auto &s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, primitive_def>) {
                    return fmt::format_to(out_it, "primitive {}", s.kind);
                } else if constexpr (std::is_same_v<T, compact_def>) {
                    return fmt::format_to(out_it, "compact<#{}>", s.type);
                } else if constexpr (std::is_same_v<T, sequence_def>) {
                    return fmt::format_to(out_it, "sequence<#{}>", s.type);
                } else if constexpr (std::is_same_v<T, array_def>) {
                    return fmt::format_to(out_it, "array<#{}; {}>", s.type, s.len);
                } else if constexpr (std::is_same_v<T, tuple_def>) {
                    out_it = fmt::format_to(out_it, "tuple(");
                    for (size_t i = 0; i < s.types.size(); ++i)
                        out_it = fmt::format_to(out_it, "{}#{}", i ? ", " : "", s.types[i]);
                    return fmt::format_to(out_it, ")");
                } else if constexpr (std::is_same_v<T, composite_def>) {
                    out_it = fmt::format_to(out_it, "composite {{");
                    for (size_t i = 0; i < s.fields.size(); ++i) {
                        const auto &f = s.fields[i];
                        out_it = fmt::format_to(out_it, "{} {}#{}", i ? "," : "", f.name ? *f.name + ": " : "", f.type);
                    }
                    return fmt::format_to(out_it, " }}");
                } else if constexpr (std::is_same_v<T, variant_def>) {
                    out_it = fmt::format_to(out_it, "variant {{");
                    for (size_t i = 0; i < s.variants.size(); ++i) {
                        const auto &vc = s.variants[i];
                        out_it = fmt::format_to(out_it, "{} {}={}", i ? "," : "", vc.name, vc.index);
                        if (!vc.fields.empty()) {
                            out_it = fmt::format_to(out_it, "(");
                            for (size_t j = 0; j < vc.fields.size(); ++j) {
                                const auto &f = vc.fields[j];
                                out_it = fmt::format_to(out_it, "{}{}#{}", j ? ", " : "", f.name ? *f.name + ": " : "", f.type);
                            }
                            out_it = fmt::format_to(out_it, ")");
                        }
                    }
                    return fmt::format_to(out_it, " }}");
                } else if constexpr (std::is_same_v<T, bit_sequence_def>) {
                    return fmt::format_to(out_it, "bit_sequence<{}, {}>", s.store, s.order);
                } else {
                    static_assert(sizeof(T) == 0, "unsupported type shape");
                }
            }, v.shape);
        }
    };
}

#endif // !SCALE_TURBO_SCALE_TYPES_HPP
