/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <st/scale/path.hpp>

namespace scale_turbo::scale {
    template<typename OUT_IT>
    static OUT_IT format_field(OUT_IT out_it, const field_ref &f)
    {
        return std::visit([&](const auto &v) {
            return fmt::format_to(out_it, ".{}", v);
        }, f);
    }

    std::string decode_path::to_string() const
    {
        if (_segments.empty())
            return "<root>";
        std::string res {};
        auto out_it = std::back_inserter(res);
        for (const auto &seg: _segments) {
            std::visit([&](const auto &s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, field_segment>) {
                    out_it = format_field(out_it, s.field);
                } else if constexpr (std::is_same_v<T, variant_field_segment>) {
                    out_it = fmt::format_to(out_it, ".{}", s.variant);
                    out_it = format_field(out_it, s.field);
                } else if constexpr (std::is_same_v<T, array_index_segment> || std::is_same_v<T, tuple_index_segment>) {
                    out_it = fmt::format_to(out_it, ".{}", s.index);
                } else {
                    static_assert(sizeof(T) == 0, "unsupported path segment");
                }
            }, seg);
        }
        return res;
    }
}
