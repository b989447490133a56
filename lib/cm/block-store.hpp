/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_BLOCK_STORE_HPP
#define CHAIN_MIRROR_BLOCK_STORE_HPP

#include <cm/db/sqlite.hpp>
#include <cm/model.hpp>

namespace chain_mirror {
    // The persisted chain of applied blocks linked through parent hashes.
    struct block_store {
        explicit block_store(db::database &db);

        std::optional<block_record> current();
        // throws invariant_error unless exactly one block is current
        block_record require_current();
        std::optional<block_record> find(std::string_view hash);
        size_t count();
        size_t count_current();

        // Inserts a block and makes it the only current one.
        void add_current(const block_record &blk);
        // Makes an existing block the only current one.
        void set_current(std::string_view hash);
        void remove(std::string_view hash);
    private:
        db::database &_db;

        static block_record _read(const db::statement &stmt);
    };
}

#endif // !CHAIN_MIRROR_BLOCK_STORE_HPP
