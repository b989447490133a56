/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CLI_HPP
#define CHAIN_MIRROR_CLI_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cm/config.hpp>
#include <cm/error.hpp>
#include <cm/logger.hpp>
#include <cm/timer.hpp>

namespace chain_mirror::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    using option_validator = std::function<std::optional<std::string>(const std::optional<std::string> &)>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
        std::optional<option_validator> validator {};
    };
    using option_config_map = std::map<std::string, option_config>;

    struct argument_config {
        std::optional<size_t> min {};
        std::optional<size_t> max {};
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            size_t req = 0;
            size_t opt = 0;
            for (const auto &a: args) {
                if (a.at(0) == '[')
                    ++opt;
                else
                    ++req;
            }
            min = req;
            max = req + opt;
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &name: args.names)
                arg_info += fmt::format(" {}", name);
            const std::string opt_info { opts.empty() ? "" : "[options]" };
            return fmt::format("{}{} - {}", opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    // Commands register themselves in the registry through static initialization.
    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        virtual void run(const arguments &args, const options &opts) const =0;

        parse_result parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (const auto &arg: args) {
                if (arg.substr(0, 2) == "--") {
                    std::string name = arg.substr(2);
                    std::optional<std::string> val {};
                    if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                        val = arg.substr(eq_pos + 1);
                        name = arg.substr(2, eq_pos - 2);
                    }
                    if (!cfg.opts.contains(name))
                        throw error("unknown option '--{}'", name);
                    const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val));
                    if (!opt_created)
                        throw error("duplicate option specification '{}'", arg);
                } else {
                    pr.args.emplace_back(arg);
                }
            }
            for (const auto &[name, opt_cfg]: cfg.opts) {
                if (opt_cfg.default_value && !pr.opts.contains(name))
                    pr.opts.emplace(name, *opt_cfg.default_value);
                if (const auto val_it = pr.opts.find(name); opt_cfg.validator && val_it != pr.opts.end()) {
                    if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                        throw error("value {} is invalid for '--{}': {}", val_it->second, name, *val_err);
                }
            }
            if (cfg.args.min && pr.args.size() < *cfg.args.min)
                _throw_usage(cfg);
            if (cfg.args.max && pr.args.size() > *cfg.args.max)
                _throw_usage(cfg);
            if (const auto opt_it = pr.opts.find("config-dir"); opt_it != pr.opts.end() && opt_it->second)
                configs_dir::set_default_path(*opt_it->second);
            return pr;
        }
    protected:
        [[noreturn]] static void _throw_usage(const config &cmd)
        {
            std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
            if (!cmd.opts.empty()) {
                usage += fmt::format("\n{} supports the following options:", cmd.name);
                for (const auto &[name, opt_cfg]: cmd.opts) {
                    if (opt_cfg.default_value)
                        usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt_cfg.default_value, opt_cfg.desc);
                    else
                        usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
                }
            }
            throw error(usage);
        }
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !CHAIN_MIRROR_CLI_HPP
