/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_RECONCILER_HPP
#define CHAIN_MIRROR_RECONCILER_HPP

#include <cm/chain/client.hpp>
#include <cm/db/sqlite.hpp>
#include <cm/model.hpp>

namespace chain_mirror {
    using block_record_list = std::vector<block_record>;

    struct reconcile_plan {
        std::string intersection {};
        // ascending, ready to be applied
        std::vector<chain::block> index_list {};
        // most recent first, ending right above the intersection
        block_record_list revert_list {};
        uint64_t target = 0;

        bool empty() const
        {
            return index_list.empty() && revert_list.empty();
        }
    };

    /*
     * Compares the chain with the persisted blocks and decides which blocks must be reverted
     * and which applied. Performs no writes.
     *
     * The walk starts at min(current + window, chain tip) and follows parent hashes until
     * it reaches a persisted block. Every persisted block lies on the local current chain,
     * so the first persisted block met is the common ancestor.
     */
    struct reconciler {
        static constexpr size_t max_revert_depth = 500;
        static constexpr size_t progress_interval = 50;

        reconciler(db::database &db, const chain::client &chain, uint64_t window);
        reconcile_plan plan();
    private:
        db::database &_db;
        const chain::client &_chain;
        const uint64_t _window;
    };
}

#endif // !CHAIN_MIRROR_RECONCILER_HPP
