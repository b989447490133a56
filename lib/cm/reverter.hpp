/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_REVERTER_HPP
#define CHAIN_MIRROR_REVERTER_HPP

#include <cm/kv-store.hpp>
#include <cm/reconciler.hpp>

namespace chain_mirror {
    struct revert_result {
        size_t num_blocks = 0;
        size_t num_versions = 0;
        std::optional<block_record> current {};
    };

    /*
     * Undoes the persisted effects of blocks that left the canonical chain.
     * The whole list is reverted in a single transaction; the downstream cache is
     * notified only after the commit.
     */
    struct reverter {
        reverter(db::database &db, kv_store &kv);
        // the list must be ordered from the most recent block down
        revert_result revert(const block_record_list &revert_list);
    private:
        db::database &_db;
        kv_store &_kv;
    };
}

#endif // !CHAIN_MIRROR_REVERTER_HPP
