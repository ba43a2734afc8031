/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_BITSEQ_HPP
#define SCALE_TURBO_SCALE_BITSEQ_HPP

#include <vector>
#include <st/scale/cursor.hpp>
#include <st/scale/types.hpp>

namespace scale_turbo::scale {
    struct bit_sequence {
        std::vector<bool> bits {};
        bit_store store = bit_store::u8;
        bit_order order = bit_order::lsb0;

        size_t size() const noexcept
        {
            return bits.size();
        }

        bool operator[](const size_t idx) const
        {
            return bits.at(idx);
        }

        bool operator==(const bit_sequence &o) const =default;
    };

    namespace bitseq {
        // all failures including a bad length prefix are reported as invalid_bit_sequence
        extern bit_sequence decode(cursor &c, const bit_sequence_def &def, bool strict=true);
    }
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::bit_sequence>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "<");
            for (const bool b: v.bits)
                out_it = fmt::format_to(out_it, "{}", b ? '1' : '0');
            return fmt::format_to(out_it, ">");
        }
    };
}

#endif // !SCALE_TURBO_SCALE_BITSEQ_HPP
