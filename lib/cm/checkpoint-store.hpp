/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CHECKPOINT_STORE_HPP
#define CHAIN_MIRROR_CHECKPOINT_STORE_HPP

#include <map>
#include <cm/db/sqlite.hpp>

namespace chain_mirror {
    // Last processed block number per logical job
    struct checkpoint_store {
        using checkpoint_map = std::map<std::string, uint64_t>;

        explicit checkpoint_store(db::database &db);
        std::optional<uint64_t> get(std::string_view job);
        void set(std::string_view job, uint64_t blocknumber);
        checkpoint_map all();
        // Zeroes checkpoints past the block so that their jobs rebuild from scratch.
        size_t reset_above(uint64_t blocknumber);
    private:
        db::database &_db;
    };
}

#endif // !CHAIN_MIRROR_CHECKPOINT_STORE_HPP
