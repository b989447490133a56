/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_BLOCK_INDEXER_HPP
#define CHAIN_MIRROR_BLOCK_INDEXER_HPP

#include <cm/applier.hpp>
#include <cm/chain/client.hpp>
#include <cm/db/sqlite.hpp>
#include <cm/scheduler.hpp>

namespace chain_mirror {
    struct block_index_result {
        block_record block {};
        size_t num_txs = 0;
        size_t rows_changed = 0;
        std::map<contract_kind, applier_result> appliers {};
    };

    /*
     * Applies canonical blocks one at a time. Each block is a separate transaction
     * covering the entity versions of all appliers and the switch of the current block.
     */
    struct block_indexer {
        block_indexer(db::database &db, kv_store &kv, const chain::client &chain, const contract_map &contracts,
            applier_set &appliers, size_t receipt_workers);
        block_index_result index_block(const chain::block &blk);
        // stops at the first failing block; the blocks before it stay committed
        size_t index(const std::vector<chain::block> &blocks);
    private:
        db::database &_db;
        kv_store &_kv;
        const chain::client &_chain;
        const contract_map &_contracts;
        applier_set &_appliers;
        scheduler _sched;

        chain::receipt_list _fetch_receipts(const chain::block &blk);
    };
}

#endif // !CHAIN_MIRROR_BLOCK_INDEXER_HPP
