/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CONFIG_HPP
#define CHAIN_MIRROR_CONFIG_HPP

#include <map>
#include <cm/json.hpp>

namespace chain_mirror {
    extern void consider_bin_dir(std::string_view bin_path);
    extern std::string install_path(std::string_view rel_path);

    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
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

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error("config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    struct configs {
        virtual ~configs() =default;

        [[nodiscard]] const config &at(const std::string &name) const
        {
            return _at_impl(name);
        }
    private:
        virtual const config &_at_impl(const std::string &) const =0;
    };

    struct configs_mock: configs {
        using map_type = std::map<std::string, config_json>;

        explicit configs_mock() =default;

        explicit configs_mock(map_type &&map): _map { std::move(map) }
        {
        }
    private:
        const map_type _map {};

        const config &_at_impl(const std::string &name) const override
        {
            const auto it = _map.find(name);
            if (it == _map.end())
                throw error("there is no config named {}!", name);
            return it->second;
        }
    };

    struct configs_dir: configs {
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();
        static const configs &get();
        explicit configs_dir(const std::string &dir);
    private:
        std::map<std::string, config_file> _configs {};

        const config &_at_impl(const std::string &) const override;
    };
}

#endif // !CHAIN_MIRROR_CONFIG_HPP
