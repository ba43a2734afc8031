/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/scale/error.hpp>

namespace scale_turbo::scale {
    const char *error_kind_name(const error_kind kind) noexcept
    {
        switch (kind) {
            case error_kind::unexpected_end: return "unexpected end of data";
            case error_kind::invalid_bool: return "invalid bool";
            case error_kind::invalid_char: return "invalid char";
            case error_kind::invalid_str: return "invalid str";
            case error_kind::invalid_compact_encoding: return "invalid compact encoding";
            case error_kind::invalid_bit_sequence: return "invalid bit sequence";
            case error_kind::type_id_not_found: return "type id not found";
            case error_kind::unknown_variant_discriminant: return "unknown variant discriminant";
            case error_kind::no_field_name_available: return "no field name available";
            case error_kind::unknown_field: return "unknown field";
            case error_kind::unsupported_type: return "unsupported type";
            case error_kind::recursion_limit_exceeded: return "recursion limit exceeded";
            case error_kind::custom: return "custom error";
            default: return "unknown error kind";
        }
    }

    codec_error::codec_error(const error_kind kind, const std::string_view detail):
        error { fmt::format("{}: {}", error_kind_name(kind), detail) },
        _kind { kind },
        _detail { detail }
    {
    }

    decode_error::decode_error(const error_kind kind, const decode_path &path, const std::string_view detail):
        error { fmt::format("{} at {}: {}", error_kind_name(kind), path, detail) },
        _kind { kind },
        _path { path },
        _detail { detail }
    {
    }
}
