/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_JSON_HPP
#define SCALE_TURBO_JSON_HPP

#include <boost/json.hpp>
#include <st/common/bytes.hpp>
#include <st/file.hpp>

namespace scale_turbo::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline const json::value &at(const json::object &obj, const std::string_view name)
    {
        const auto it = obj.find(name);
        if (it == obj.end()) [[unlikely]]
            throw error(fmt::format("json object does not have the required element {}: {}", name, json::serialize(obj)));
        return it->value();
    }
}

#endif // !SCALE_TURBO_JSON_HPP
