/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_CURSOR_HPP
#define SCALE_TURBO_SCALE_CURSOR_HPP

#include <type_traits>
#include <st/common/bytes.hpp>
#include <st/scale/error.hpp>

namespace scale_turbo::scale {
    /*
     * A read position over a borrowed byte buffer. The view only shrinks from the front
     * and the referenced bytes must outlive the cursor and everything decoded from it.
     */
    struct cursor {
        cursor() =default;

        explicit cursor(const buffer data) noexcept:
            _data { data }
        {
        }

        size_t remaining() const noexcept
        {
            return _data.size();
        }

        bool empty() const noexcept
        {
            return _data.empty();
        }

        buffer data() const noexcept
        {
            return _data;
        }

        void advance(const size_t num_bytes)
        {
            if (num_bytes > _data.size()) [[unlikely]]
                throw codec_error(error_kind::unexpected_end, fmt::format("need {} bytes but only {} remain", num_bytes, _data.size()));
            _data = buffer { _data.data() + num_bytes, _data.size() - num_bytes };
        }

        buffer take(const size_t num_bytes)
        {
            const auto *start = _data.data();
            advance(num_bytes);
            return buffer { start, num_bytes };
        }

        uint8_t read_byte()
        {
            return take(1)[0];
        }

        // fixed-width little-endian unsigned integers
        template<typename T>
        T read()
        {
            static_assert(std::is_unsigned_v<T>);
            const auto bytes = take(sizeof(T));
            T val = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                val |= static_cast<T>(bytes[i]) << (i * 8);
            return val;
        }

        // the number of bytes consumed since the start position
        size_t consumed_since(const cursor &start) const noexcept
        {
            return start.remaining() - remaining();
        }
    private:
        buffer _data {};
    };
}

#endif // !SCALE_TURBO_SCALE_CURSOR_HPP
