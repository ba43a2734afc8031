/* This file is part of Scale Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef SCALE_TURBO_SCALE_DECODER_HPP
#define SCALE_TURBO_SCALE_DECODER_HPP

/*
 * A type-directed decoder of SCALE data. The shape of the data is looked up in a type_resolver
 * at every step so recursive type graphs need no special handling apart from the depth limit.
 * Terminal values are handed to a visitor directly, while containers are handed over as lazy readers
 * which decode their children on request. Once a visitor returns, the decoder skips whatever
 * the visitor did not read, so the position after a container is always the same.
 *
 * The code is defined in a single header since all the entry points are templates.
 */

#include <algorithm>
#include <optional>
#include <span>
#include <st/logger.hpp>
#include <st/scale/compact.hpp>
#include <st/scale/options.hpp>
#include <st/scale/registry.hpp>
#include <st/scale/utf8.hpp>
#include <st/scale/visitor.hpp>

namespace scale_turbo::scale {
    struct decode_ctx {
        const type_resolver &types;
        const decode_options &opts;
    };

    template<typename T>
    T decode_with_visitor(cursor &c, type_id id, const decode_ctx &ctx, const decode_path &path, visitor<T> &v, size_t depth);

    // a view of a string's bytes, the UTF-8 validation happens on the first access to the text
    struct str_reader {
        str_reader(const str_reader &) =delete;

        str_reader(const buffer bytes, const decode_path &path):
            _bytes { bytes }, _path { path }
        {
        }

        size_t size() const noexcept
        {
            return _bytes.size();
        }

        buffer bytes() const noexcept
        {
            return _bytes;
        }

        std::string_view as_str() const
        {
            if (!_validated) {
                if (const auto bad_pos = utf8::first_invalid(_bytes); bad_pos) [[unlikely]]
                    throw decode_error { error_kind::invalid_str, _path, fmt::format("invalid UTF-8 sequence at byte {}", *bad_pos) };
                _validated = true;
            }
            return _bytes.string_view();
        }

        // an owned copy for callers that need the text after the visitor returns
        std::string to_string() const
        {
            return std::string { as_str() };
        }
    private:
        const buffer _bytes;
        const decode_path &_path;
        mutable bool _validated = false;
    };

    struct reader_base {
        reader_base(const reader_base &) =delete;

        // the container's bytes and everything that follows them
        buffer bytes_from_start() const noexcept
        {
            return _start.data();
        }

        // the bytes of the children not decoded yet and everything that follows them
        buffer bytes_from_undecoded() const noexcept
        {
            return _cursor.data();
        }

        const decode_path &path() const noexcept
        {
            return _path;
        }

        // the position right after the decoded children
        const cursor &position() const noexcept
        {
            return _cursor;
        }
    protected:
        reader_base(const cursor &start, const cursor &c, const decode_ctx &ctx, const decode_path &path, const size_t depth):
            _start { start }, _cursor { c }, _ctx { ctx }, _path { path }, _depth { depth }
        {
        }

        template<typename U>
        U _decode_child(const type_id id, path_segment seg, visitor<U> &v)
        {
            path_scope scope { _path, std::move(seg) };
            return decode_with_visitor(_cursor, id, _ctx, _path, v, _depth + 1);
        }

        const cursor _start;
        cursor _cursor;
        const decode_ctx _ctx;
        // a private copy so that errors of children carry the full path
        decode_path _path;
        const size_t _depth;
    };

    namespace detail {
        // The number of nesting levels of a type that occupies no bytes or nothing if it occupies some.
        // Types nested deeper than max_levels or needing more than budget lookups are treated as non-empty.
        inline std::optional<size_t> zero_size_levels(const type_id id, const decode_ctx &ctx, const size_t max_levels, size_t &budget)
        {
            if (max_levels == 0 || budget == 0)
                return {};
            --budget;
            const auto *def = ctx.types.find(id);
            if (!def)
                return {};
            size_t levels = 1;
            const auto nested = [&](const type_id child) {
                const auto child_levels = zero_size_levels(child, ctx, max_levels - 1, budget);
                if (child_levels)
                    levels = std::max(levels, *child_levels + 1);
                return child_levels.has_value();
            };
            return std::visit([&](const auto &shape) -> std::optional<size_t> {
                using S = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<S, composite_def>) {
                    for (const auto &f: shape.fields) {
                        if (!nested(f.type))
                            return {};
                    }
                    return levels;
                } else if constexpr (std::is_same_v<S, tuple_def>) {
                    for (const auto t: shape.types) {
                        if (!nested(t))
                            return {};
                    }
                    return levels;
                } else if constexpr (std::is_same_v<S, array_def>) {
                    if (shape.len != 0 && !nested(shape.type))
                        return {};
                    return levels;
                } else {
                    return {};
                }
            }, def->shape);
        }
    }

    // sequences and arrays
    struct homogeneous_reader: reader_base {
        size_t size() const noexcept
        {
            return _size;
        }

        size_t remaining() const noexcept
        {
            return _size - _next;
        }

        bool done() const noexcept
        {
            return _next >= _size;
        }

        type_id item_type() const noexcept
        {
            return _item_type;
        }

        template<typename U>
        std::optional<U> decode_item(visitor<U> &v)
        {
            if (done())
                return {};
            const auto idx = _next++;
            return _decode_child(_item_type, array_index_segment { idx }, v);
        }

        // elements can only be requested in the increasing order, the ones in between are skipped
        template<typename U>
        std::optional<U> decode_item_at(const size_t idx, visitor<U> &v)
        {
            if (idx < _next) [[unlikely]]
                throw error(fmt::format("element #{} at {} has already been consumed", idx, _path));
            if (idx >= _size)
                return {};
            skip(idx - _next);
            return decode_item(v);
        }

        homogeneous_reader &skip(const size_t num_items)
        {
            if (num_items > remaining()) [[unlikely]]
                throw error(fmt::format("cannot skip {} elements at {} since only {} remain", num_items, _path, remaining()));
            if (num_items == 0)
                return *this;
            if (u8_items() && _depth < _ctx.opts.max_depth) {
                _take_u8(num_items);
            } else if (zero_size_items()) {
                _next += num_items;
            } else {
                ignore_visitor ign {};
                for (size_t i = 0; i < num_items; ++i)
                    decode_item(ign);
            }
            return *this;
        }

        // the elements are u8 and can be read in bulk with bytes()
        bool u8_items() const
        {
            if (!_is_u8) {
                const auto *def = _ctx.types.find(_item_type);
                const auto *prim = def ? std::get_if<primitive_def>(&def->shape) : nullptr;
                _is_u8 = prim && prim->kind == primitive_kind::u8;
            }
            return *_is_u8;
        }

        // the elements occupy no bytes, so they can be skipped without decoding
        bool zero_size_items() const
        {
            if (!_is_zero_size) {
                size_t budget = 64;
                _is_zero_size = _depth < _ctx.opts.max_depth
                    && detail::zero_size_levels(_item_type, _ctx, _ctx.opts.max_depth - _depth, budget).has_value();
            }
            return *_is_zero_size;
        }

        // the raw bytes of the remaining u8 elements, the elements are considered consumed
        buffer bytes()
        {
            if (!u8_items()) [[unlikely]]
                throw decode_error { error_kind::unsupported_type, _path, fmt::format("elements of type #{} are not u8", _item_type) };
            return _take_u8(remaining());
        }

        void consume()
        {
            skip(remaining());
        }
    protected:
        homogeneous_reader(const cursor &start, const cursor &c, const type_id item_type, const size_t size,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            reader_base { start, c, ctx, path, depth }, _item_type { item_type }, _size { size }
        {
        }
    private:
        const type_id _item_type;
        const size_t _size;
        size_t _next = 0;
        mutable std::optional<bool> _is_u8 {};
        mutable std::optional<bool> _is_zero_size {};

        // a missing byte is reported at the index of the first element that is not there
        buffer _take_u8(const size_t num_items)
        {
            if (num_items > _cursor.remaining()) [[unlikely]] {
                path_scope scope { _path, array_index_segment { _next + _cursor.remaining() } };
                throw decode_error { error_kind::unexpected_end, _path, "need 1 bytes but only 0 remain" };
            }
            const auto res = _cursor.take(num_items);
            _next += num_items;
            return res;
        }
    };

    struct sequence_reader: homogeneous_reader {
        sequence_reader(const cursor &start, const cursor &c, const sequence_def &def, const size_t size,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            homogeneous_reader { start, c, def.type, size, ctx, path, depth }
        {
        }
    };

    struct array_reader: homogeneous_reader {
        array_reader(const cursor &start, const cursor &c, const array_def &def,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            homogeneous_reader { start, c, def.type, def.len, ctx, path, depth }
        {
        }
    };

    struct tuple_reader: reader_base {
        tuple_reader(const cursor &start, const cursor &c, const std::span<const type_id> types,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            reader_base { start, c, ctx, path, depth }, _types { types }
        {
        }

        size_t size() const noexcept
        {
            return _types.size();
        }

        size_t remaining() const noexcept
        {
            return _types.size() - _next;
        }

        bool done() const noexcept
        {
            return _next >= _types.size();
        }

        // the types of the elements not decoded yet
        std::span<const type_id> types() const noexcept
        {
            return _types.subspan(_next);
        }

        template<typename U>
        std::optional<U> decode_item(visitor<U> &v)
        {
            if (done())
                return {};
            const auto idx = _next++;
            return _decode_child(_types[idx], tuple_index_segment { idx }, v);
        }

        template<typename U>
        std::optional<U> decode_item_at(const size_t idx, visitor<U> &v)
        {
            if (idx < _next) [[unlikely]]
                throw error(fmt::format("element #{} at {} has already been consumed", idx, _path));
            if (idx >= _types.size())
                return {};
            skip(idx - _next);
            return decode_item(v);
        }

        tuple_reader &skip(const size_t num_items)
        {
            if (num_items > remaining()) [[unlikely]]
                throw error(fmt::format("cannot skip {} elements at {} since only {} remain", num_items, _path, remaining()));
            ignore_visitor ign {};
            for (size_t i = 0; i < num_items; ++i)
                decode_item(ign);
            return *this;
        }

        void consume()
        {
            skip(remaining());
        }
    private:
        const std::span<const type_id> _types;
        size_t _next = 0;
    };

    struct composite_reader: reader_base {
        composite_reader(const cursor &start, const cursor &c, const std::span<const field> fields,
                const std::vector<std::string> &type_path, const std::string *variant_name,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            reader_base { start, c, ctx, path, depth }, _fields { fields }, _type_path { type_path }, _variant_name { variant_name }
        {
        }

        size_t size() const noexcept
        {
            return _fields.size();
        }

        size_t remaining() const noexcept
        {
            return _fields.size() - _next;
        }

        bool done() const noexcept
        {
            return _next >= _fields.size();
        }

        // the fields not decoded yet
        std::span<const field> fields() const noexcept
        {
            return _fields.subspan(_next);
        }

        bool has_unnamed_fields() const noexcept
        {
            return scale::has_unnamed_fields(_fields);
        }

        // the name path of the composite or of the enclosing variant type
        const std::vector<std::string> &type_path() const noexcept
        {
            return _type_path;
        }

        // the name of the next field if there is one and it has a name
        std::optional<std::string_view> next_name() const
        {
            if (done() || !_fields[_next].name)
                return {};
            return *_fields[_next].name;
        }

        template<typename U>
        std::optional<U> decode_item(visitor<U> &v)
        {
            if (done())
                return {};
            const auto idx = _next++;
            return _decode_child(_fields[idx].type, _segment(idx), v);
        }

        template<typename U>
        std::optional<U> decode_item_at(const size_t idx, visitor<U> &v)
        {
            if (idx < _next) [[unlikely]]
                throw error(fmt::format("field #{} at {} has already been consumed", idx, _path));
            if (idx >= _fields.size())
                return {};
            skip(idx - _next);
            return decode_item(v);
        }

        // skips the fields preceding the requested one
        template<typename U>
        U decode_field(const std::string_view name, visitor<U> &v)
        {
            if (has_unnamed_fields()) [[unlikely]]
                throw decode_error { error_kind::no_field_name_available, _path,
                    fmt::format("cannot look up field {} since the fields have no names", name) };
            for (size_t idx = _next; idx < _fields.size(); ++idx) {
                if (*_fields[idx].name == name) {
                    skip(idx - _next);
                    return *decode_item(v);
                }
            }
            throw decode_error { error_kind::unknown_field, _path, fmt::format("no field {} among the remaining {} fields", name, remaining()) };
        }

        composite_reader &skip(const size_t num_items)
        {
            if (num_items > remaining()) [[unlikely]]
                throw error(fmt::format("cannot skip {} fields at {} since only {} remain", num_items, _path, remaining()));
            ignore_visitor ign {};
            for (size_t i = 0; i < num_items; ++i)
                decode_item(ign);
            return *this;
        }

        void consume()
        {
            skip(remaining());
        }
    private:
        const std::span<const field> _fields;
        const std::vector<std::string> &_type_path;
        const std::string *_variant_name;
        size_t _next = 0;

        path_segment _segment(const size_t idx) const
        {
            const auto &f = _fields[idx];
            field_ref ref = f.name ? field_ref { *f.name } : field_ref { idx };
            if (_variant_name)
                return variant_field_segment { *_variant_name, std::move(ref) };
            return field_segment { std::move(ref) };
        }
    };

    struct variant_reader {
        variant_reader(const variant_reader &) =delete;

        variant_reader(const cursor &start, const cursor &c, const variant_case &vc, const std::vector<std::string> &type_path,
                const decode_ctx &ctx, const decode_path &path, const size_t depth):
            _case { vc }, _fields { start, c, vc.fields, type_path, &vc.name, ctx, path, depth }
        {
        }

        std::string_view name() const noexcept
        {
            return _case.name;
        }

        uint8_t index() const noexcept
        {
            return _case.index;
        }

        composite_reader &fields() noexcept
        {
            return _fields;
        }

        const std::vector<std::string> &type_path() const noexcept
        {
            return _fields.type_path();
        }

        size_t remaining() const noexcept
        {
            return _fields.remaining();
        }

        template<typename U>
        std::optional<U> decode_item(visitor<U> &v)
        {
            return _fields.decode_item(v);
        }

        buffer bytes_from_start() const noexcept
        {
            return _fields.bytes_from_start();
        }

        buffer bytes_from_undecoded() const noexcept
        {
            return _fields.bytes_from_undecoded();
        }

        const cursor &position() const noexcept
        {
            return _fields.position();
        }

        void consume()
        {
            _fields.consume();
        }
    private:
        const variant_case &_case;
        composite_reader _fields;
    };

    namespace detail {
        // the engine calls the finish step after the visitor returns and continues from the end of the container
        template<typename T, typename R, typename F>
        T visit_container(cursor &c, R &reader, const F &visit)
        {
            auto res = visit(reader);
            reader.consume();
            c = reader.position();
            return res;
        }

        template<typename T>
        T decode_primitive(cursor &c, const type_id id, const primitive_kind kind, const decode_ctx &ctx, const decode_path &path, visitor<T> &v)
        {
            switch (kind) {
                case primitive_kind::boolean: {
                    const auto b = with_path(path, [&] { return c.read_byte(); });
                    if (b > 1) [[unlikely]]
                        throw decode_error { error_kind::invalid_bool, path, fmt::format("expected 0 or 1 but got {}", b) };
                    return v.visit_bool(b == 1, id, path);
                }
                case primitive_kind::character: {
                    const auto cp = with_path(path, [&] { return c.read<uint32_t>(); });
                    if (!utf8::is_scalar(cp)) [[unlikely]]
                        throw decode_error { error_kind::invalid_char, path, fmt::format("0x{:X} is not a unicode scalar value", cp) };
                    return v.visit_char(static_cast<char32_t>(cp), id, path);
                }
                case primitive_kind::str: {
                    const auto bytes = with_path(path, [&] {
                        const auto len = compact::decode_length(c, ctx.opts.strict_compact);
                        return c.take(len);
                    });
                    str_reader r { bytes, path };
                    return v.visit_str(r, id, path);
                }
                case primitive_kind::bytes: {
                    const auto bytes = with_path(path, [&] {
                        const auto len = compact::decode_length(c, ctx.opts.strict_compact);
                        return c.take(len);
                    });
                    return v.visit_bytes(bytes, id, path);
                }
                case primitive_kind::u8: return v.visit_u8(with_path(path, [&] { return c.read<uint8_t>(); }), id, path);
                case primitive_kind::u16: return v.visit_u16(with_path(path, [&] { return c.read<uint16_t>(); }), id, path);
                case primitive_kind::u32: return v.visit_u32(with_path(path, [&] { return c.read<uint32_t>(); }), id, path);
                case primitive_kind::u64: return v.visit_u64(with_path(path, [&] { return c.read<uint64_t>(); }), id, path);
                case primitive_kind::u128: {
                    const auto val = with_path(path, [&] { return uint128_from_le_bytes(c.take(16)); });
                    return v.visit_u128(val, id, path);
                }
                case primitive_kind::u256: {
                    const byte_array<32> val = with_path(path, [&] { return c.take(32); });
                    return v.visit_u256(val, id, path);
                }
                case primitive_kind::i8: return v.visit_i8(static_cast<int8_t>(with_path(path, [&] { return c.read<uint8_t>(); })), id, path);
                case primitive_kind::i16: return v.visit_i16(static_cast<int16_t>(with_path(path, [&] { return c.read<uint16_t>(); })), id, path);
                case primitive_kind::i32: return v.visit_i32(static_cast<int32_t>(with_path(path, [&] { return c.read<uint32_t>(); })), id, path);
                case primitive_kind::i64: return v.visit_i64(static_cast<int64_t>(with_path(path, [&] { return c.read<uint64_t>(); })), id, path);
                case primitive_kind::i128: {
                    const auto val = with_path(path, [&] { return int128_from_le_bytes(c.take(16)); });
                    return v.visit_i128(val, id, path);
                }
                case primitive_kind::i256: {
                    const byte_array<32> val = with_path(path, [&] { return c.take(32); });
                    return v.visit_i256(val, id, path);
                }
                default:
                    throw decode_error { error_kind::unsupported_type, path, fmt::format("unsupported primitive kind {} of type #{}", kind, id) };
            }
        }

        // compact values can wrap an unsigned integer directly or through single-field composites
        inline size_t compact_target_bits(type_id target, const decode_ctx &ctx, const decode_path &path)
        {
            for (size_t hops = 0; hops <= ctx.opts.max_depth; ++hops) {
                const auto *def = ctx.types.find(target);
                if (!def) [[unlikely]]
                    throw decode_error { error_kind::type_id_not_found, path, fmt::format("the compact target type #{} is not in the registry", target) };
                if (const auto *prim = std::get_if<primitive_def>(&def->shape); prim) {
                    switch (prim->kind) {
                        case primitive_kind::u8:
                        case primitive_kind::u16:
                        case primitive_kind::u32:
                        case primitive_kind::u64:
                        case primitive_kind::u128:
                            return primitive_bits(prim->kind);
                        default:
                            break;
                    }
                } else if (const auto *comp = std::get_if<composite_def>(&def->shape); comp && comp->fields.size() == 1) {
                    target = comp->fields.front().type;
                    continue;
                }
                throw decode_error { error_kind::unsupported_type, path, fmt::format("compact encoding of {} is not supported", *def) };
            }
            throw decode_error { error_kind::recursion_limit_exceeded, path, fmt::format("the compact target of type #{} is nested too deep", target) };
        }

        template<typename T>
        T decode_compact(cursor &c, const type_id id, const compact_def &def, const decode_ctx &ctx, const decode_path &path, visitor<T> &v)
        {
            const auto bits = compact_target_bits(def.type, ctx, path);
            const auto val = with_path(path, [&] { return compact::decode(c, bits, ctx.opts.strict_compact); });
            switch (bits) {
                case 8: return v.visit_compact_u8(static_cast<uint8_t>(val), id, path);
                case 16: return v.visit_compact_u16(static_cast<uint16_t>(val), id, path);
                case 32: return v.visit_compact_u32(static_cast<uint32_t>(val), id, path);
                case 64: return v.visit_compact_u64(static_cast<uint64_t>(val), id, path);
                default: return v.visit_compact_u128(val, id, path);
            }
        }

        template<typename T>
        T decode_shape(cursor &c, const type_id id, const type_def &def, const decode_ctx &ctx, const decode_path &path, visitor<T> &v, const size_t depth)
        {
            const cursor start = c;
            return std::visit([&](const auto &shape) -> T {
                using S = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<S, primitive_def>) {
                    return decode_primitive(c, id, shape.kind, ctx, path, v);
                } else if constexpr (std::is_same_v<S, compact_def>) {
                    return decode_compact(c, id, shape, ctx, path, v);
                } else if constexpr (std::is_same_v<S, sequence_def>) {
                    const auto size = with_path(path, [&] { return compact::decode_length(c, ctx.opts.strict_compact); });
                    sequence_reader r { start, c, shape, size, ctx, path, depth };
                    return visit_container<T>(c, r, [&](auto &rr) { return v.visit_sequence(rr, id, path); });
                } else if constexpr (std::is_same_v<S, array_def>) {
                    array_reader r { start, c, shape, ctx, path, depth };
                    return visit_container<T>(c, r, [&](auto &rr) { return v.visit_array(rr, id, path); });
                } else if constexpr (std::is_same_v<S, tuple_def>) {
                    tuple_reader r { start, c, shape.types, ctx, path, depth };
                    return visit_container<T>(c, r, [&](auto &rr) { return v.visit_tuple(rr, id, path); });
                } else if constexpr (std::is_same_v<S, composite_def>) {
                    composite_reader r { start, c, shape.fields, def.path, nullptr, ctx, path, depth };
                    return visit_container<T>(c, r, [&](auto &rr) { return v.visit_composite(rr, id, path); });
                } else if constexpr (std::is_same_v<S, variant_def>) {
                    const auto index = with_path(path, [&] { return c.read_byte(); });
                    const auto *vc = shape.find(index);
                    if (!vc) [[unlikely]]
                        throw decode_error { error_kind::unknown_variant_discriminant, path,
                            fmt::format("type {} has no variant with index {}", def.name().empty() ? fmt::format("#{}", id) : def.name(), index) };
                    variant_reader r { start, c, *vc, def.path, ctx, path, depth };
                    return visit_container<T>(c, r, [&](auto &rr) { return v.visit_variant(rr, id, path); });
                } else if constexpr (std::is_same_v<S, bit_sequence_def>) {
                    const auto bits = with_path(path, [&] { return bitseq::decode(c, shape, ctx.opts.strict_compact); });
                    return v.visit_bit_sequence(bits, id, path);
                } else {
                    static_assert(sizeof(S) == 0, "an unsupported type shape!");
                }
            }, def.shape);
        }
    }

    template<typename T>
    T decode_with_visitor(cursor &c, const type_id id, const decode_ctx &ctx, const decode_path &path, visitor<T> &v, const size_t depth)
    {
        const auto *def = ctx.types.find(id);
        if (!def) [[unlikely]]
            throw decode_error { error_kind::type_id_not_found, path, fmt::format("type #{} is not in the registry", id) };
        if (depth > ctx.opts.max_depth) [[unlikely]]
            throw decode_error { error_kind::recursion_limit_exceeded, path, fmt::format("type #{} is nested deeper than {} levels", id, ctx.opts.max_depth) };
        if (logger::tracing_enabled()) [[unlikely]]
            logger::trace("decoding type #{} {} at {} with {} bytes remaining", id, *def, path, c.remaining());
        return detail::decode_shape(c, id, *def, ctx, path, v, depth);
    }

    // decodes a single value of the given type and advances the cursor past it
    template<typename T>
    T decode(cursor &c, const type_id id, const type_resolver &types, visitor<T> &v, const decode_options &opts={})
    {
        const decode_ctx ctx { types, opts };
        const decode_path path {};
        return decode_with_visitor(c, id, ctx, path, v, 1);
    }

    // decodes a value from the start of the bytes, trailing bytes are ignored
    template<typename T>
    T decode(const buffer bytes, const type_id id, const type_resolver &types, visitor<T> &v, const decode_options &opts={})
    {
        cursor c { bytes };
        return decode(c, id, types, v, opts);
    }

    // skips a single value of the given type
    inline void skip(cursor &c, const type_id id, const type_resolver &types, const decode_options &opts={})
    {
        ignore_visitor v {};
        decode(c, id, types, v, opts);
    }
}

#endif // !SCALE_TURBO_SCALE_DECODER_HPP
