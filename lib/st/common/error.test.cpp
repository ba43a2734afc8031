/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <st/common/test.hpp>
#include <st/array.hpp>
#include <st/common/error.hpp>

using namespace scale_turbo;

namespace {
    template<typename F>
    std::string error_message(const F &f)
    {
        try {
            f();
        } catch (const error &ex) {
            return ex.what();
        }
        throw std::runtime_error("no error has been thrown");
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "formatted messages"_test = [] {
            test_same(error_message([] { throw error("plain"); }), std::string { "plain" });
            test_same(error_message([] { throw error(fmt::format("type #{} is missing", 17)); }), std::string { "type #17 is missing" });
            const byte_array<4> buf { 0xDE, 0xAD, 0xBE, 0xEF };
            test_same(error_message([&] { throw error(fmt::format("bytes {}", buf)); }), std::string { "bytes DEADBEEF" });
        };
        "nested"_test = [] {
            const auto msg = error_message([] {
                try {
                    throw std::runtime_error("inner");
                } catch (const std::exception &ex) {
                    throw error("outer", ex);
                }
            });
            expect(msg.starts_with("outer caused by")) << msg;
            expect(msg.find("inner") != std::string::npos) << msg;
        };
        "system errors"_test = [] {
            const auto msg = error_message([] {
                errno = ENOENT;
                throw error_sys("open registry.json");
            });
            expect(msg.starts_with("open registry.json errno: 2 strerror: ")) << msg;
        };
        "what is stable"_test = [] {
            const error ex { "same" };
            test_same(std::string { ex.what() }, std::string { ex.what() });
        };
    };
};
