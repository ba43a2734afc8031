/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <map>
#include <st/json.hpp>
#include <st/logger.hpp>
#include <st/scale/registry.hpp>

namespace scale_turbo::scale {
    namespace {
        struct pending_bit_sequence {
            type_id id;
            type_id store_type;
            type_id order_type;
        };

        type_id parse_id(const json::value &v, const std::string_view what)
        {
            if (!v.is_int64() && !v.is_uint64()) [[unlikely]]
                throw error(fmt::format("{} must be a type id but got {}", what, json::serialize(v)));
            const auto id = v.to_number<int64_t>();
            if (id < 0 || id > static_cast<int64_t>(std::numeric_limits<type_id>::max())) [[unlikely]]
                throw error(fmt::format("{} is not a valid type id: {}", what, id));
            return static_cast<type_id>(id);
        }

        primitive_kind parse_primitive(const std::string_view name)
        {
            static const std::map<std::string_view, primitive_kind> kinds {
                { "bool", primitive_kind::boolean }, { "char", primitive_kind::character },
                { "str", primitive_kind::str }, { "bytes", primitive_kind::bytes },
                { "u8", primitive_kind::u8 }, { "u16", primitive_kind::u16 }, { "u32", primitive_kind::u32 },
                { "u64", primitive_kind::u64 }, { "u128", primitive_kind::u128 }, { "u256", primitive_kind::u256 },
                { "i8", primitive_kind::i8 }, { "i16", primitive_kind::i16 }, { "i32", primitive_kind::i32 },
                { "i64", primitive_kind::i64 }, { "i128", primitive_kind::i128 }, { "i256", primitive_kind::i256 }
            };
            if (const auto it = kinds.find(name); it != kinds.end())
                return it->second;
            throw error(fmt::format("unsupported primitive type: {}", name));
        }

        field_list parse_fields(const json::value &j)
        {
            field_list fields {};
            for (const auto &jf: j.as_array()) {
                const auto &obj = jf.as_object();
                auto &f = fields.emplace_back();
                if (const auto *name = obj.if_contains("name"); name && !name->is_null())
                    f.name.emplace(name->as_string());
                f.type = parse_id(json::at(obj, "type"), "a field's type");
            }
            return fields;
        }

        std::vector<std::string> parse_path(const json::object &obj)
        {
            std::vector<std::string> path {};
            if (const auto *jp = obj.if_contains("path"); jp) {
                for (const auto &seg: jp->as_array())
                    path.emplace_back(seg.as_string());
            }
            return path;
        }

        type_shape parse_shape(const json::object &def, const type_id id, std::vector<pending_bit_sequence> &pending)
        {
            if (def.size() != 1) [[unlikely]]
                throw error(fmt::format("a type definition must have exactly one element: {}", json::serialize(def)));
            const std::string_view kind = def.begin()->key();
            const auto &body = def.begin()->value();
            if (kind == "primitive")
                return primitive_def { parse_primitive(body.as_string()) };
            if (kind == "compact")
                return compact_def { parse_id(json::at(body.as_object(), "type"), "compact.type") };
            if (kind == "sequence")
                return sequence_def { parse_id(json::at(body.as_object(), "type"), "sequence.type") };
            if (kind == "array") {
                const auto &obj = body.as_object();
                const auto len = json::at(obj, "len").to_number<uint32_t>();
                return array_def { parse_id(json::at(obj, "type"), "array.type"), len };
            }
            if (kind == "tuple") {
                tuple_def t {};
                for (const auto &jt: body.as_array())
                    t.types.emplace_back(parse_id(jt, "a tuple's element"));
                return t;
            }
            if (kind == "composite")
                return composite_def { parse_fields(json::at(body.as_object(), "fields")) };
            if (kind == "variant") {
                variant_def v {};
                const auto &obj = body.as_object();
                if (const auto *jvars = obj.if_contains("variants"); jvars) {
                    for (const auto &jv: jvars->as_array()) {
                        const auto &vobj = jv.as_object();
                        const auto index = json::at(vobj, "index").to_number<uint8_t>();
                        if (v.find(index)) [[unlikely]]
                            throw error(fmt::format("duplicate variant index {}", index));
                        field_list fields {};
                        if (const auto *jf = vobj.if_contains("fields"); jf)
                            fields = parse_fields(*jf);
                        v.variants.push_back(variant_case { index, std::string { json::at(vobj, "name").as_string() }, std::move(fields) });
                    }
                }
                return v;
            }
            if (kind == "bitSequence") {
                const auto &obj = body.as_object();
                pending.push_back(pending_bit_sequence { id, parse_id(json::at(obj, "bit_store_type"), "bit_store_type"),
                    parse_id(json::at(obj, "bit_order_type"), "bit_order_type") });
                // the store and the order are resolved once all types are known
                return bit_sequence_def {};
            }
            throw error(fmt::format("unsupported type definition kind: {}", kind));
        }

        bit_sequence_def resolve_bit_sequence(const type_registry &reg, const pending_bit_sequence &p)
        {
            bit_sequence_def res {};
            const auto *store = reg.find(p.store_type);
            if (!store) [[unlikely]]
                throw error(fmt::format("unknown bit store type #{}", p.store_type));
            const auto *store_prim = std::get_if<primitive_def>(&store->shape);
            if (!store_prim) [[unlikely]]
                throw error(fmt::format("bit store type #{} must be a primitive but is {}", p.store_type, *store));
            switch (store_prim->kind) {
                case primitive_kind::u8: res.store = bit_store::u8; break;
                case primitive_kind::u16: res.store = bit_store::u16; break;
                case primitive_kind::u32: res.store = bit_store::u32; break;
                case primitive_kind::u64: res.store = bit_store::u64; break;
                default: throw error(fmt::format("unsupported bit store type: {}", store_prim->kind));
            }
            const auto *order = reg.find(p.order_type);
            if (!order) [[unlikely]]
                throw error(fmt::format("unknown bit order type #{}", p.order_type));
            if (order->short_name() == "Lsb0")
                res.order = bit_order::lsb0;
            else if (order->short_name() == "Msb0")
                res.order = bit_order::msb0;
            else
                throw error(fmt::format("unsupported bit order type: {}", *order));
            return res;
        }
    }

    type_registry type_registry::from_json(const json::value &j)
    {
        const json::array *jtypes = nullptr;
        if (j.is_array())
            jtypes = &j.as_array();
        else if (j.is_object())
            jtypes = &json::at(j.as_object(), "types").as_array();
        else
            throw error("a type registry must be a JSON object or array");
        type_registry reg {};
        std::vector<pending_bit_sequence> pending {};
        for (size_t i = 0; i < jtypes->size(); ++i) {
            try {
                const auto &entry = jtypes->at(i).as_object();
                const auto id = parse_id(json::at(entry, "id"), "id");
                const auto &jtype = json::at(entry, "type").as_object();
                reg.define(id, type_def { parse_path(jtype), parse_shape(json::at(jtype, "def").as_object(), id, pending) });
            } catch (const std::exception &ex) {
                throw error(fmt::format("invalid type registry entry #{}: {}", i, ex.what()));
            }
        }
        for (const auto &p: pending) {
            try {
                const auto def = resolve_bit_sequence(reg, p);
                std::get<bit_sequence_def>(reg._types.at(p.id)->shape) = def;
            } catch (const std::exception &ex) {
                throw error(fmt::format("invalid bit sequence type #{}: {}", p.id, ex.what()));
            }
        }
        logger::debug("loaded a type registry with {} types", reg.size());
        return reg;
    }

    type_registry type_registry::from_json_file(const std::string &path)
    {
        logger::debug("loading a type registry from {}", path);
        return from_json(json::load(path));
    }
}
