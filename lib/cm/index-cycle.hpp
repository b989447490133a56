/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_INDEX_CYCLE_HPP
#define CHAIN_MIRROR_INDEX_CYCLE_HPP

#include <cm/applier.hpp>
#include <cm/chain/client.hpp>
#include <cm/db/sqlite.hpp>
#include <cm/indexer-config.hpp>
#include <cm/job-lock.hpp>
#include <cm/kv-store.hpp>

namespace chain_mirror {
    // The collaborators of a cycle. Owned by the caller and outliving the cycle.
    struct indexer_context {
        db::database &db;
        kv_store &kv;
        const chain::client &chain;
        const indexer_config &cfg;
        applier_set &appliers;
    };

    struct cycle_result {
        cycle_status status = cycle_status::skipped;
        size_t num_reverted = 0;
        size_t num_indexed = 0;
        std::optional<block_record> current {};
    };

    /*
     * One run of the indexer: reconciliation, revert and application of new blocks
     * under the cluster-wide indexing lock. A busy lock skips the run.
     */
    struct index_cycle {
        static constexpr std::string_view lock_name { "disc_prov_lock" };

        explicit index_cycle(const indexer_context &ctx);
        cycle_result run();
        // init_blocks under the indexing lock; skipped when another cycle holds it
        cycle_status init();
        // Creates the first block row from the configured start block unless a current block exists.
        void init_blocks();
    private:
        const indexer_context _ctx;
    };
}

#endif // !CHAIN_MIRROR_INDEX_CYCLE_HPP
