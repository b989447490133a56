/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CLI_COMMON_HPP
#define CHAIN_MIRROR_CLI_COMMON_HPP

#include <cm/chain/rpc-client.hpp>
#include <cm/cli.hpp>
#include <cm/db/sqlite.hpp>
#include <cm/indexer-config.hpp>
#include <cm/kv-store-sqlite.hpp>

namespace chain_mirror::cli::common {
    extern void add_opts(config &cmd);
    extern indexer_config load_config(const options &opts);

    // The stores and the chain client configured for a command run
    struct environment {
        explicit environment(const options &opts);

        indexer_config cfg;
        db::database db;
        kv_store_sqlite kv;
        chain::rpc_client chain;
    };
}

#endif // !CHAIN_MIRROR_CLI_COMMON_HPP
