/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_UTF8_HPP
#define SCALE_TURBO_SCALE_UTF8_HPP

#include <optional>
#include <utf8cpp/utf8.h>
#include <st/common/bytes.hpp>

namespace scale_turbo::scale::utf8 {
    inline bool is_scalar(const uint32_t cp) noexcept
    {
        return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
    }

    // the offset of the first byte that does not start a well-formed sequence, if any
    inline std::optional<size_t> first_invalid(const buffer data)
    {
        const std::string_view s = data.string_view();
        if (const auto it = ::utf8::find_invalid(s.begin(), s.end()); it != s.end()) [[unlikely]]
            return static_cast<size_t>(it - s.begin());
        return {};
    }

    inline bool valid(const buffer data)
    {
        return !first_invalid(data);
    }
}

#endif // !SCALE_TURBO_SCALE_UTF8_HPP
