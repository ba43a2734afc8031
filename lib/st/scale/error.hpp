/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_ERROR_HPP
#define SCALE_TURBO_SCALE_ERROR_HPP

#include <st/common/error.hpp>
#include <st/common/format.hpp>
#include <st/scale/path.hpp>

namespace scale_turbo::scale {
    enum class error_kind: uint8_t {
        unexpected_end,
        invalid_bool,
        invalid_char,
        invalid_str,
        invalid_compact_encoding,
        invalid_bit_sequence,
        type_id_not_found,
        unknown_variant_discriminant,
        no_field_name_available,
        unknown_field,
        unsupported_type,
        recursion_limit_exceeded,
        custom
    };

    extern const char *error_kind_name(error_kind kind) noexcept;

    // Reported by the leaf codecs (cursor, compact, bit sequences, utf8) which do not know
    // where in the type graph they are called from. The decoder converts them into decode_error.
    struct codec_error: error {
        codec_error(error_kind kind, std::string_view detail);

        error_kind kind() const noexcept
        {
            return _kind;
        }

        const std::string &detail() const noexcept
        {
            return _detail;
        }
    private:
        error_kind _kind;
        std::string _detail;
    };

    struct decode_error: error {
        decode_error(error_kind kind, const decode_path &path, std::string_view detail);

        static decode_error custom(const decode_path &path, const std::string_view detail)
        {
            return decode_error { error_kind::custom, path, detail };
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        const decode_path &path() const noexcept
        {
            return _path;
        }

        const std::string &detail() const noexcept
        {
            return _detail;
        }
    private:
        const error_kind _kind;
        const decode_path _path;
        const std::string _detail;
    };

    // runs a leaf codec and attributes its failures to the given path
    template<typename F>
    auto with_path(const decode_path &path, const F &f) -> decltype(f())
    {
        try {
            return f();
        } catch (const codec_error &ex) {
            throw decode_error { ex.kind(), path, ex.detail() };
        }
    }
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", scale_turbo::scale::error_kind_name(v));
        }
    };
}

#endif // !SCALE_TURBO_SCALE_ERROR_HPP
