/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_ARRAY_HPP
#define SCALE_TURBO_ARRAY_HPP

#include <array>
#include <cstring>
#include <st/common/bytes.hpp>

namespace scale_turbo {
    // fixed-width byte strings such as hashes and 256-bit integers
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data {};
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a byte array of size {} cannot be initialized with {} bytes", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a byte array of size {} cannot be initialized with {} bytes", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };
}

#endif // !SCALE_TURBO_ARRAY_HPP
