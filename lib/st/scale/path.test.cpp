/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/common/test.hpp>
#include <st/scale/path.hpp>

using namespace scale_turbo;
using namespace scale_turbo::scale;

suite scale_path_suite = [] {
    "scale::path"_test = [] {
        "render"_test = [] {
            test_same(decode_path {}.to_string(), std::string { "<root>" });
            const decode_path p {
                field_segment { "calls" },
                array_index_segment { 3 },
                variant_field_segment { "Transfer", std::string { "dest" } },
                tuple_index_segment { 0 },
                field_segment { size_t { 1 } },
                variant_field_segment { "Some", size_t { 0 } }
            };
            test_same(p.to_string(), std::string { ".calls.3.Transfer.dest.0.1.Some.0" });
            test_same(fmt::format("{}", p), p.to_string());
        };
        "scopes"_test = [] {
            decode_path p {};
            {
                path_scope outer { p, field_segment { "a" } };
                {
                    path_scope inner { p, array_index_segment { 7 } };
                    test_same(p.size(), 2);
                    test_same(p.to_string(), std::string { ".a.7" });
                }
                test_same(p.size(), 1);
            }
            expect(p.empty());
            expect(throws([&] { p.pop(); }));
        };
        "equality"_test = [] {
            const decode_path a { field_segment { "x" }, array_index_segment { 1 } };
            const decode_path b { field_segment { "x" }, array_index_segment { 1 } };
            // the same rendering but a different kind of segment
            const decode_path c { field_segment { "x" }, tuple_index_segment { 1 } };
            expect(a == b);
            expect(!(a == c));
            test_same(a.to_string(), c.to_string());
            expect(a.at(1) == path_segment { array_index_segment { 1 } });
        };
    };
};
