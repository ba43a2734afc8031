/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/config.hpp>
#include <st/logger.hpp>

namespace scale_turbo {
    static json::object load_object(const std::string &path)
    {
        auto j = json::load(path);
        if (!j.is_object()) [[unlikely]]
            throw error(fmt::format("configuration file {} must contain a JSON object!", path));
        logger::debug("loaded configuration from {}", path);
        return std::move(j.as_object());
    }

    config_file::config_file(const std::string &path)
        : _parsed { load_object(path) }
    {
    }
}
