/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <algorithm>
#include <cm/block-store.hpp>
#include <cm/reconciler.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    reconciler::reconciler(db::database &db, const chain::client &chain, const uint64_t window)
        : _db { db }, _chain { chain }, _window { window }
    {
        if (_window == 0)
            throw error("the block processing window must be positive");
    }

    reconcile_plan reconciler::plan()
    {
        timer t { "reconciler::plan", logger::level::debug };
        block_store blocks { _db };
        const auto current = blocks.require_current();
        const auto cur_num = current.height();
        const auto latest = _chain.latest();
        reconcile_plan res {};
        res.target = std::min(cur_num + _window, latest.number);
        logger::info("reconcile: current {} target #{} chain tip #{}", current, res.target, latest.number);

        auto blk = _chain.block_by_number(res.target);
        for (;;) {
            if (blocks.find(blk.hash)) {
                res.intersection = blk.hash;
                break;
            }
            if (blk.number < cur_num && cur_num - blk.number > max_revert_depth)
                throw invariant_error("no common ancestor within {} blocks below the current block #{}: reached {}", max_revert_depth, cur_num, blk);
            res.index_list.emplace_back(blk);
            if (res.index_list.size() % progress_interval == 0)
                logger::info("reconcile: collected {} blocks to index, last {}", res.index_list.size(), blk);
            const auto parent = normalize_parent_hash(blk.parent_hash);
            if (blocks.find(parent)) {
                res.intersection = parent;
                break;
            }
            if (parent == origin_hash)
                throw invariant_error("the chain shares no block with the persisted state: reached the first block {}", blk);
            blk = _chain.block_by_hash(parent);
            if (normalize_parent_hash(blk.hash) != parent)
                throw chain_error("the chain returned block {} when asked for {}", blk.hash, parent);
        }
        std::reverse(res.index_list.begin(), res.index_list.end());

        for (auto b = current; b.hash != res.intersection; ) {
            res.revert_list.emplace_back(b);
            if (res.revert_list.size() > max_revert_depth)
                throw invariant_error("revert depth exceeds {} blocks; intersection: {} current: {}", max_revert_depth, res.intersection, current);
            const auto parent = blocks.find(b.parent_hash);
            if (!parent) {
                logger::warn("reconcile: the parent {} of {} is not persisted", b.parent_hash, b);
                break;
            }
            b = *parent;
        }
        logger::info("reconcile: intersection {} blocks to revert: {} blocks to index: {}",
            res.intersection, res.revert_list.size(), res.index_list.size());
        return res;
    }
}
