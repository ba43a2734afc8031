/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/cli.hpp>
#include <st/scale/registry.hpp>

namespace scale_turbo::cli::types {
    using namespace scale_turbo::scale;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "types";
            cmd.desc = "list the types defined in a JSON type registry";
            cmd.args.expect({ "<registry.json>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto reg = type_registry::from_json_file(args.at(0));
            reg.foreach_type([](const type_id id, const type_def &def) {
                logger::info("#{}: {}", id, def);
            });
            logger::info("the registry defines {} types", reg.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
