/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/block-store.hpp>
#include <cm/checkpoint-store.hpp>
#include <cm/cli.hpp>
#include <cm/cli/common.hpp>
#include <cm/db/schema.hpp>

namespace chain_mirror::cli::tip {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "tip";
            cmd.desc = "show the current block and the checkpoints of the relational store";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto cfg = common::load_config(opts);
            db::database db { cfg.db_path };
            logger::info("schema version: {}", db::stored_schema_version(db));
            block_store blocks { db };
            logger::info("blocks: {} current: {}", blocks.count(), blocks.current());
            for (const auto &[job, blocknumber]: checkpoint_store { db }.all())
                logger::info("checkpoint {}: {}", job, blocknumber);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
