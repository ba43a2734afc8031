/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <st/cli.hpp>
#include <st/config.hpp>
#include <st/narrow-cast.hpp>
#include <st/scale/registry.hpp>
#include <st/scale/value.hpp>

namespace scale_turbo::cli::decode {
    using namespace scale_turbo::scale;

    static uint64_t parse_uint(const std::string_view text)
    {
        uint64_t val = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
        if (ec != std::errc {} || ptr != text.data() + text.size()) [[unlikely]]
            throw error(fmt::format("not a valid unsigned integer: '{}'", text));
        return val;
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "decode";
            cmd.desc = "decode a hex-encoded value of the given type and print it";
            cmd.args.expect({ "<registry.json>", "<type-id>", "<hex>" });
            cmd.opts.try_emplace("config", "a JSON file with decoding options: max_depth and strict_compact");
            cmd.opts.try_emplace("lenient-compact", "accept compact integers that are not encoded in the shortest mode");
            cmd.opts.try_emplace("max-depth", option_config { "the maximum nesting of decoded types", {},
                [](const std::optional<std::string> &val) -> std::optional<std::string> {
                    if (!val)
                        return "a value is required";
                    if (val->empty() || val->find_first_not_of("0123456789") != std::string::npos || val->starts_with('0'))
                        return "must be a positive integer";
                    return {};
                } });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto types = type_registry::from_json_file(args.at(0));
            const auto id = narrow_cast<type_id>(parse_uint(args.at(1)));
            const auto data = uint8_vector::from_hex(args.at(2));
            decode_options dec_opts {};
            if (const auto it = opts.find("config"); it != opts.end()) {
                if (!it->second)
                    throw error("--config requires a path to a JSON file");
                dec_opts = decode_options::from_config(config_file { *it->second });
            }
            if (opts.contains("lenient-compact"))
                dec_opts.strict_compact = false;
            if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
                dec_opts.max_depth = narrow_cast<size_t>(parse_uint(*it->second));
            logger::debug("decoding {} bytes as type #{} with max_depth: {} strict_compact: {}",
                data.size(), id, dec_opts.max_depth, dec_opts.strict_compact);
            cursor c { data };
            value_visitor v {};
            const auto val = scale::decode(c, id, types, v, dec_opts);
            logger::info("{}", val);
            logger::info("trailing bytes: {}", c.remaining());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
