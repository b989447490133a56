/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_JSON_HPP
#define CHAIN_MIRROR_JSON_HPP

#include <boost/json.hpp>
#include <cm/error.hpp>
#include <cm/file.hpp>

namespace chain_mirror::json {
    using namespace boost::json;

    inline json::value parse(const std::string_view &text, json::storage_ptr sp={})
    {
        return boost::json::parse(text, sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline const json::value *find(const json::object &obj, const std::string_view &name)
    {
        const auto it = obj.find(name);
        return it != obj.end() ? &it->value() : nullptr;
    }

    inline std::string value_or(const json::object &obj, const std::string_view &name, const std::string_view &def)
    {
        if (const auto *v = find(obj, name); v && !v->is_null())
            return std::string { v->as_string() };
        return std::string { def };
    }

    inline uint64_t value_or(const json::object &obj, const std::string_view &name, const uint64_t def)
    {
        if (const auto *v = find(obj, name); v && !v->is_null())
            return json::value_to<uint64_t>(*v);
        return def;
    }
}

#endif // !CHAIN_MIRROR_JSON_HPP
