/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/scale/visitor.hpp>

namespace scale_turbo::scale {
    const char *visit_kind_name(const visit_kind kind) noexcept
    {
        switch (kind) {
            case visit_kind::boolean: return "bool";
            case visit_kind::character: return "char";
            case visit_kind::u8: return "u8";
            case visit_kind::u16: return "u16";
            case visit_kind::u32: return "u32";
            case visit_kind::u64: return "u64";
            case visit_kind::u128: return "u128";
            case visit_kind::u256: return "u256";
            case visit_kind::i8: return "i8";
            case visit_kind::i16: return "i16";
            case visit_kind::i32: return "i32";
            case visit_kind::i64: return "i64";
            case visit_kind::i128: return "i128";
            case visit_kind::i256: return "i256";
            case visit_kind::str: return "str";
            case visit_kind::bytes: return "bytes";
            case visit_kind::compact_u8: return "compact u8";
            case visit_kind::compact_u16: return "compact u16";
            case visit_kind::compact_u32: return "compact u32";
            case visit_kind::compact_u64: return "compact u64";
            case visit_kind::compact_u128: return "compact u128";
            case visit_kind::sequence: return "sequence";
            case visit_kind::array: return "array";
            case visit_kind::tuple: return "tuple";
            case visit_kind::composite: return "composite";
            case visit_kind::variant: return "variant";
            case visit_kind::bit_sequence: return "bit sequence";
            default: return "unknown";
        }
    }
}
