/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <fstream>
#include <st/common/test.hpp>
#include <st/config.hpp>
#include <st/scale/options.hpp>

using namespace scale_turbo;

suite config_suite = [] {
    "config"_test = [] {
        "mock"_test = [] {
            const config_json cfg { json::object {
                { "max_depth", 12 },
                { "name", "test" }
            } };
            expect(cfg.at("max_depth").as_int64() == 12_ll);
            expect(cfg.at("name").as_string() == std::string_view { "test" });
            expect(cfg.find("missing") == nullptr);
            expect(throws([&] { static_cast<void>(cfg.at("missing")); }));
        };
        "file"_test = [] {
            const std::string path { "config-test.json" };
            {
                std::ofstream os { path };
                os << R"({ "strict_compact": false, "max_depth": 32 })";
            }
            const config_file cfg { path };
            expect(cfg.at("strict_compact").as_bool() == false);
            const auto opts = scale::decode_options::from_config(cfg);
            test_same(opts.max_depth, 32);
            test_same(opts.strict_compact, false);
            std::remove(path.c_str());
        };
        "file must contain an object"_test = [] {
            const std::string path { "config-test-array.json" };
            {
                std::ofstream os { path };
                os << "[1, 2, 3]";
            }
            expect(throws([&] { config_file cfg { path }; }));
            std::remove(path.c_str());
            expect(throws([] { config_file cfg { "config-test-missing.json" }; }));
        };
        "decode options"_test = [] {
            const auto defaults = scale::decode_options::from_config(config_json { json::object {} });
            test_same(defaults.max_depth, 256);
            test_same(defaults.strict_compact, true);
            const auto custom = scale::decode_options::from_config(config_json { json::object { { "max_depth", 4 } } });
            test_same(custom.max_depth, 4);
            test_same(custom.strict_compact, true);
            expect(throws([] { scale::decode_options::from_config(config_json { json::object { { "max_depth", "deep" } } }); }));
            expect(throws([] { scale::decode_options::from_config(config_json { json::object { { "max_depth", 0 } } }); }));
            expect(throws([] { scale::decode_options::from_config(config_json { json::object { { "strict_compact", 1 } } }); }));
        };
    };
};
