/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_REGISTRY_HPP
#define SCALE_TURBO_SCALE_REGISTRY_HPP

#include <functional>
#include <st/json-fwd.hpp>
#include <st/scale/types.hpp>

namespace scale_turbo::scale {
    /*
     * Maps type ids to their definitions. Implementations must be deterministic and must not
     * change while decode calls are running since the readers keep references into the definitions.
     */
    struct type_resolver {
        virtual ~type_resolver() =default;

        // nullptr when the id is unknown
        const type_def *find(const type_id id) const
        {
            return _find_impl(id);
        }
    private:
        virtual const type_def *_find_impl(type_id id) const =0;
    };

    struct type_registry: type_resolver {
        using observer_t = std::function<void(type_id, const type_def &)>;

        // the portable registry JSON form: { "types": [ { "id": 0, "type": { "path": [], "def": { ... } } } ] }
        static type_registry from_json(const json::value &j);
        static type_registry from_json_file(const std::string &path);

        type_registry() =default;
        type_registry(type_registry &&) =default;
        type_registry &operator=(type_registry &&) =default;
        type_registry(const type_registry &) =delete;

        type_id add(type_def def);
        // allocates an id to be defined later so that types can refer to themselves
        type_id reserve();
        void define(type_id id, type_def def);

        type_id add_primitive(primitive_kind kind, std::vector<std::string> path={})
        {
            return add(type_def { std::move(path), primitive_def { kind } });
        }

        type_id add_compact(const type_id type)
        {
            return add(type_def { {}, compact_def { type } });
        }

        type_id add_sequence(const type_id type)
        {
            return add(type_def { {}, sequence_def { type } });
        }

        type_id add_array(const type_id type, const uint32_t len)
        {
            return add(type_def { {}, array_def { type, len } });
        }

        type_id add_tuple(std::vector<type_id> types)
        {
            return add(type_def { {}, tuple_def { std::move(types) } });
        }

        type_id add_composite(field_list fields, std::vector<std::string> path={})
        {
            return add(type_def { std::move(path), composite_def { std::move(fields) } });
        }

        type_id add_variant(std::vector<variant_case> variants, std::vector<std::string> path={})
        {
            return add(type_def { std::move(path), variant_def { std::move(variants) } });
        }

        type_id add_bit_sequence(const bit_store store, const bit_order order)
        {
            return add(type_def { {}, bit_sequence_def { store, order } });
        }

        // the number of defined types
        size_t size() const noexcept
        {
            return _num_defined;
        }

        // visits the defined types in the order of their ids
        void foreach_type(const observer_t &observer) const;
    private:
        static constexpr size_t max_ids = 1U << 24;

        std::vector<std::optional<type_def>> _types {};
        size_t _num_defined = 0;

        void _set(type_id id, type_def &&def);
        const type_def *_find_impl(type_id id) const override;
    };
}

#endif // !SCALE_TURBO_SCALE_REGISTRY_HPP
