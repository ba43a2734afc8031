/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/config.hpp>
#include <st/logger.hpp>
#include <st/scale/options.hpp>

namespace scale_turbo::scale {
    decode_options decode_options::from_config(const config &cfg)
    {
        decode_options opts {};
        if (const auto *v = cfg.find("max_depth"); v) {
            if (!v->is_int64() && !v->is_uint64()) [[unlikely]]
                throw error(fmt::format("max_depth must be an integer but got {}", json::serialize(*v)));
            const auto depth = v->to_number<int64_t>();
            if (depth <= 0) [[unlikely]]
                throw error(fmt::format("max_depth must be positive but got {}", depth));
            opts.max_depth = static_cast<size_t>(depth);
        }
        if (const auto *v = cfg.find("strict_compact"); v) {
            if (!v->is_bool()) [[unlikely]]
                throw error(fmt::format("strict_compact must be a boolean but got {}", json::serialize(*v)));
            opts.strict_compact = v->get_bool();
        }
        logger::debug("decode options: max_depth: {} strict_compact: {}", opts.max_depth, opts.strict_compact);
        return opts;
    }
}
