/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_OPTIONS_HPP
#define SCALE_TURBO_SCALE_OPTIONS_HPP

#include <cstddef>

namespace scale_turbo {
    struct config;
}

namespace scale_turbo::scale {
    struct decode_options {
        // The maximum nesting of shapes within a single decode call.
        // Element counts are not limited: a few bytes can declare billions of elements that occupy no bytes,
        // such as a sequence of unit tuples. Skipping them is free, but visitors that materialize elements,
        // value_visitor included, pay for each one.
        size_t max_depth = 256;
        // reject compact integers that do not use the shortest possible mode
        bool strict_compact = true;

        // reads the optional max_depth and strict_compact elements
        static decode_options from_config(const config &cfg);
    };
}

#endif // !SCALE_TURBO_SCALE_OPTIONS_HPP
