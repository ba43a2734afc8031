/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_PATH_HPP
#define SCALE_TURBO_SCALE_PATH_HPP

#include <string>
#include <variant>
#include <vector>
#include <st/common/error.hpp>
#include <st/common/format.hpp>

namespace scale_turbo::scale {
    // a field is addressed by its name when it has one and by its position otherwise
    using field_ref = std::variant<std::string, size_t>;

    struct field_segment {
        field_ref field;

        bool operator==(const field_segment &o) const =default;
    };

    struct variant_field_segment {
        std::string variant;
        field_ref field;

        bool operator==(const variant_field_segment &o) const =default;
    };

    struct array_index_segment {
        size_t index;

        bool operator==(const array_index_segment &o) const =default;
    };

    struct tuple_index_segment {
        size_t index;

        bool operator==(const tuple_index_segment &o) const =default;
    };

    using path_segment = std::variant<field_segment, variant_field_segment, array_index_segment, tuple_index_segment>;

    struct decode_path {
        decode_path() =default;

        decode_path(std::initializer_list<path_segment> segs): _segments { segs }
        {
        }

        void push(path_segment seg)
        {
            _segments.emplace_back(std::move(seg));
        }

        void pop()
        {
            if (_segments.empty()) [[unlikely]]
                throw error("decode_path: pop called on an empty path!");
            _segments.pop_back();
        }

        bool empty() const noexcept
        {
            return _segments.empty();
        }

        size_t size() const noexcept
        {
            return _segments.size();
        }

        const path_segment &at(const size_t idx) const
        {
            return _segments.at(idx);
        }

        const std::vector<path_segment> &segments() const noexcept
        {
            return _segments;
        }

        std::string to_string() const;

        bool operator==(const decode_path &o) const =default;
    private:
        std::vector<path_segment> _segments {};
    };

    // pushes a segment for the lifetime of the scope
    struct path_scope {
        path_scope(const path_scope &) =delete;

        path_scope(decode_path &path, path_segment seg): _path { path }
        {
            _path.push(std::move(seg));
        }

        ~path_scope()
        {
            _path.pop();
        }
    private:
        decode_path &_path;
    };
}

namespace fmt {
    template<>
    struct formatter<scale_turbo::scale::decode_path>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !SCALE_TURBO_SCALE_PATH_HPP
