/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/aggregate-user.hpp>
#include <cm/cli.hpp>
#include <cm/cli/common.hpp>
#include <cm/db/schema.hpp>
#include <cm/kv-store-sqlite.hpp>

namespace chain_mirror::cli::aggregate_user {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "aggregate-user";
            cmd.desc = "recount the per-user counters of the users changed since the last run";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            // the chain node is not needed, so the full environment is not created
            const auto cfg = common::load_config(opts);
            db::database db { cfg.db_path };
            db::create_schema(db);
            kv_store_sqlite kv { cfg.kv_path };
            const auto res = aggregate_user_job { db, kv, cfg.aggregate_lock_ttl }.run();
            logger::info("aggregate_user {}: changed users: {} updated rows: {} checkpoint: {}",
                res.status, res.num_changed, res.num_updated, res.checkpoint);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
