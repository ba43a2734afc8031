/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <st/scale/registry.hpp>

namespace scale_turbo::scale {
    type_id type_registry::add(type_def def)
    {
        const auto id = reserve();
        _set(id, std::move(def));
        return id;
    }

    type_id type_registry::reserve()
    {
        if (_types.size() >= max_ids) [[unlikely]]
            throw error(fmt::format("a type registry cannot have more than {} types", max_ids));
        const auto id = static_cast<type_id>(_types.size());
        _types.emplace_back();
        return id;
    }

    void type_registry::define(const type_id id, type_def def)
    {
        if (id >= max_ids) [[unlikely]]
            throw error(fmt::format("type id {} is too large, the maximum supported is {}", id, max_ids - 1));
        if (id >= _types.size())
            _types.resize(id + 1);
        _set(id, std::move(def));
    }

    void type_registry::foreach_type(const observer_t &observer) const
    {
        for (size_t id = 0; id < _types.size(); ++id) {
            if (_types[id])
                observer(static_cast<type_id>(id), *_types[id]);
        }
    }

    void type_registry::_set(const type_id id, type_def &&def)
    {
        auto &slot = _types.at(id);
        if (slot) [[unlikely]]
            throw error(fmt::format("type #{} has already been defined as {}", id, *slot));
        slot.emplace(std::move(def));
        ++_num_defined;
    }

    const type_def *type_registry::_find_impl(const type_id id) const
    {
        if (id < _types.size() && _types[id])
            return &*_types[id];
        return nullptr;
    }
}
