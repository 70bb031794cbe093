/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "rjson.hh"
#include <fmt/format.h>
#include <rapidjson/encodedstream.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace rjson {

static allocator the_allocator;

/*
 * Adds a nesting limit to a rapidjson handler. Every object or array level
 * costs a stack frame when parsing, printing and destroying a document, so
 * deeper input is refused with an rjson::error instead of overflowing the
 * stack.
 */
template<typename Handler>
struct guarded_json_handler : public Handler {
    size_t _nested_level = 0;
    size_t _max_nested_level;
    bool _too_deep = false;
public:
    using handler_base = Handler;

    explicit guarded_json_handler(size_t max_nested_level) : _max_nested_level(max_nested_level) {}
    guarded_json_handler(string_buffer& buf, size_t max_nested_level)
            : handler_base(buf), _max_nested_level(max_nested_level) {}

    // Parses into the underlying document. The reader's stack of partial
    // values is moved into the document by Populate(), or destroyed if the
    // parse failed.
    rapidjson::ParseResult Parse(const char* str, size_t length) {
        rapidjson::MemoryStream ms(str, length);
        rapidjson::EncodedInputStream<encoding, rapidjson::MemoryStream> is(ms);
        rapidjson::GenericReader<encoding, encoding, allocator> reader(&the_allocator);
        auto res = reader.Parse(is, *this);
        auto replay = [&res] (handler_base&) { return !res.IsError(); };
        handler_base::Populate(replay);
        return res;
    }

    bool StartObject() {
        return enter() && handler_base::StartObject();
    }

    bool EndObject(rapidjson::SizeType elements_count = 0) {
        --_nested_level;
        return handler_base::EndObject(elements_count);
    }

    bool StartArray() {
        return enter() && handler_base::StartArray();
    }

    bool EndArray(rapidjson::SizeType elements_count = 0) {
        --_nested_level;
        return handler_base::EndArray(elements_count);
    }

    bool too_deep() const noexcept { return _too_deep; }
private:
    bool enter() {
        if (++_nested_level > _max_nested_level) {
            _too_deep = true;
            return false;
        }
        return true;
    }
};

static rjson::value name_ref(std::string_view name) {
    return rjson::value(rjson::string_ref_type(name.data(), name.size()));
}

std::string print(const rjson::value& value) {
    string_buffer buffer;
    guarded_json_handler<writer> w(buffer, max_nested_level);
    if (!value.Accept(w) && w.too_deep()) {
        throw rjson::error(fmt::format("Max nested level reached: {}", max_nested_level));
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

rjson::value copy(const rjson::value& value) {
    return rjson::value(value, the_allocator);
}

rjson::value parse(std::string_view str) {
    guarded_json_handler<document> d(max_nested_level);
    auto res = d.Parse(str.data(), str.size());
    if (d.too_deep()) {
        throw rjson::error(fmt::format("Parsing JSON failed: max nested level {} reached (offset: {})", max_nested_level, res.Offset()));
    }
    if (res.IsError()) {
        throw rjson::error(fmt::format("Parsing JSON failed: {} (offset: {})", GetParseError_En(res.Code()), res.Offset()));
    }
    rjson::value& v = d;
    return std::move(v);
}

rjson::value* find(rjson::value& value, std::string_view name) {
    auto member_it = value.FindMember(name_ref(name));
    return member_it != value.MemberEnd() ? &member_it->value : nullptr;
}

const rjson::value* find(const rjson::value& value, std::string_view name) {
    auto member_it = value.FindMember(name_ref(name));
    return member_it != value.MemberEnd() ? &member_it->value : nullptr;
}

const rjson::value& get(const rjson::value& value, std::string_view name) {
    auto member_it = value.FindMember(name_ref(name));
    if (member_it == value.MemberEnd()) {
        throw rjson::error(fmt::format("JSON parameter {} not found", name));
    }
    return member_it->value;
}

std::string_view get_string(const rjson::value& value, std::string_view name) {
    const auto& member = get(value, name);
    if (!member.IsString()) {
        throw rjson::error(fmt::format("JSON parameter {} is not a string", name));
    }
    return to_string_view(member);
}

void replace_with_string_name(rjson::value& base, std::string_view name, rjson::value&& member) {
    if (auto* existing = find(base, name)) {
        *existing = std::move(member);
        return;
    }
    base.AddMember(rjson::value(name.data(), name.size(), the_allocator), std::move(member), the_allocator);
}

} // end namespace rjson
