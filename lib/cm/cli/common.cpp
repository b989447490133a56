/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/cli/common.hpp>
#include <cm/db/schema.hpp>

namespace chain_mirror::cli::common {
    void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("db", "the path of the relational store, overrides db_path of the config");
        cmd.opts.try_emplace("kv", "the path of the key-value store, overrides kv_path of the config");
        cmd.opts.try_emplace("rpc", "the URL of the chain node, overrides rpc_url of the config");
    }

    indexer_config load_config(const options &opts)
    {
        auto cfg = indexer_config::from(configs_dir::get());
        if (const auto it = opts.find("db"); it != opts.end() && it->second)
            cfg.db_path = *it->second;
        if (const auto it = opts.find("kv"); it != opts.end() && it->second)
            cfg.kv_path = *it->second;
        if (const auto it = opts.find("rpc"); it != opts.end() && it->second)
            cfg.rpc_url = *it->second;
        logger::info("relational store: {} key-value store: {} chain node: {}", cfg.db_path, cfg.kv_path, cfg.rpc_url);
        return cfg;
    }

    environment::environment(const options &opts)
        : cfg { load_config(opts) }, db { cfg.db_path }, kv { cfg.kv_path }, chain { cfg.rpc_url, cfg.rpc_timeout }
    {
        db::create_schema(db);
    }
}
