/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/common/test.hpp>
#include <st/logger.hpp>
#include <st/scale/path.hpp>

using namespace scale_turbo;

suite logger_suite = [] {
    "logger"_test = [] {
        "levels"_test = [] {
            const scale::decode_path path { scale::field_segment { "a" }, scale::array_index_segment { 2 } };
            expect(nothrow([&] {
                logger::trace("trace at {}", path);
                logger::debug("debug at {}", path);
                logger::info("info with {} args: {} {}", 3, "x", path);
                logger::warn("a plain warning");
                logger::error("error #{}", 7);
                logger::log(logger::level::info, std::string { "a preformatted message" });
            }));
        };
        "tracing switch"_test = [] {
            auto &tracing = logger::tracing_enabled();
            const auto orig = tracing;
            tracing = !orig;
            test_same(logger::tracing_enabled(), !orig);
            tracing = orig;
            test_same(logger::tracing_enabled(), orig);
        };
        "invalid level"_test = [] {
            expect(throws<error>([] { logger::log(static_cast<logger::level>(42), std::string { "bad" }); }));
        };
    };
};
