/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_CONFIG_HPP
#define SCALE_TURBO_CONFIG_HPP

#include <st/json.hpp>

namespace scale_turbo {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = json();
            if (const auto it = obj.find(name); it != obj.end())
                return &it->value();
            return nullptr;
        }

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            if (const auto *v = find(name); v)
                return *v;
            throw error(fmt::format("config does not have the requested {} element!", name));
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        json::object _parsed;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };
}

#endif // !SCALE_TURBO_CONFIG_HPP
