/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_BIG_INT_HPP
#define SCALE_TURBO_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <st/common/bytes.hpp>
#include <st/common/format.hpp>

namespace scale_turbo {
    using boost::multiprecision::cpp_int;
    using boost::multiprecision::uint128_t;
    using boost::multiprecision::int128_t;

    // SCALE stores all integers in the little-endian byte order
    inline cpp_int big_uint_from_le_bytes(const buffer data)
    {
        cpp_int val = 0;
        for (auto it = data.rbegin(); it != data.rend(); ++it) {
            val <<= 8;
            val |= *it;
        }
        return val;
    }

    // two's complement
    inline cpp_int big_int_from_le_bytes(const buffer data)
    {
        auto val = big_uint_from_le_bytes(data);
        if (!data.empty() && (data.back() & 0x80))
            val -= cpp_int { 1 } << (data.size() * 8);
        return val;
    }

    inline uint128_t uint128_from_le_bytes(const buffer data)
    {
        if (data.size() > 16) [[unlikely]]
            throw error(fmt::format("a 128-bit integer cannot be made from {} bytes", data.size()));
        uint128_t val = 0;
        for (auto it = data.rbegin(); it != data.rend(); ++it) {
            val <<= 8;
            val |= *it;
        }
        return val;
    }

    inline int128_t int128_from_le_bytes(const buffer data)
    {
        if (data.size() != 16) [[unlikely]]
            throw error(fmt::format("a signed 128-bit integer requires 16 bytes but got {}", data.size()));
        const auto u = uint128_from_le_bytes(data);
        if (data.back() & 0x80) {
            uint128_t magnitude = ~u;
            magnitude += 1;
            return -static_cast<int128_t>(magnitude);
        }
        return static_cast<int128_t>(u);
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !SCALE_TURBO_BIG_INT_HPP
