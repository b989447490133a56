/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/block-indexer.hpp>
#include <cm/block-store.hpp>
#include <cm/index-cycle.hpp>
#include <cm/job-lock.hpp>
#include <cm/reconciler.hpp>
#include <cm/reverter.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    index_cycle::index_cycle(const indexer_context &ctx): _ctx { ctx }
    {
    }

    void index_cycle::init_blocks()
    {
        block_store blocks { _ctx.db };
        if (blocks.count_current() != 0) {
            const auto cur = blocks.require_current();
            publish_most_recent(_ctx.kv, cur);
            return;
        }
        if (const auto num_blocks = blocks.count(); num_blocks != 0)
            throw invariant_error("the block table has {} rows but none of them is current", num_blocks);
        const auto &start = _ctx.cfg.start_block;
        block_record rec { start, start, std::nullopt, true };
        if (start != origin_hash) {
            const auto blk = _ctx.chain.block_by_hash(start);
            if (blk.number != 0)
                rec.number = blk.number;
        }
        db::transaction txn { _ctx.db };
        blocks.add_current(rec);
        txn.commit();
        logger::info("initialized the block table with {}", rec);
    }

    cycle_status index_cycle::init()
    {
        const job_lock lock { _ctx.kv, lock_name, _ctx.cfg.index_lock_ttl };
        if (!lock) {
            logger::info("init: another indexing cycle holds {}, skipping", lock_name);
            return cycle_status::skipped;
        }
        init_blocks();
        return cycle_status::completed;
    }

    cycle_result index_cycle::run()
    {
        cycle_result res {};
        const job_lock lock { _ctx.kv, lock_name, _ctx.cfg.index_lock_ttl };
        if (!lock) {
            logger::info("index: another indexing cycle holds {}, skipping", lock_name);
            return res;
        }
        timer t { "index cycle", logger::level::info };
        const contract_map contracts { _ctx.cfg.contracts };
        block_indexer indexer { _ctx.db, _ctx.kv, _ctx.chain, contracts, _ctx.appliers, _ctx.cfg.receipt_workers };
        init_blocks();
        const auto latest = _ctx.chain.latest();
        _ctx.kv.set(kv_keys::latest_block, fmt::format("{}", latest.number));
        _ctx.kv.set(kv_keys::latest_block_hash, latest.hash);

        const auto plan = reconciler { _ctx.db, _ctx.chain, _ctx.cfg.block_processing_window }.plan();
        if (!plan.revert_list.empty())
            res.num_reverted = reverter { _ctx.db, _ctx.kv }.revert(plan.revert_list).num_blocks;
        res.num_indexed = indexer.index(plan.index_list);
        res.current = block_store { _ctx.db }.require_current();
        res.status = plan.empty() ? cycle_status::up_to_date : cycle_status::completed;
        logger::info("index: reverted {} and indexed {} blocks, the current block is {}", res.num_reverted, res.num_indexed, *res.current);
        return res;
    }
}
