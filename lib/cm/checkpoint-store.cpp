/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/checkpoint-store.hpp>

namespace chain_mirror {
    checkpoint_store::checkpoint_store(db::database &db): _db { db }
    {
    }

    std::optional<uint64_t> checkpoint_store::get(const std::string_view job)
    {
        auto stmt = _db.prepare("SELECT last_checkpoint FROM indexing_checkpoints WHERE tablename = ?");
        stmt.bind_all(job);
        if (!stmt.step())
            return {};
        return stmt.column_uint(0);
    }

    void checkpoint_store::set(const std::string_view job, const uint64_t blocknumber)
    {
        auto stmt = _db.prepare("INSERT INTO indexing_checkpoints (tablename, last_checkpoint) VALUES (?, ?)"
            " ON CONFLICT (tablename) DO UPDATE SET last_checkpoint = excluded.last_checkpoint");
        stmt.bind_all(job, blocknumber).exec();
        logger::debug("checkpoint {} set to {}", job, blocknumber);
    }

    size_t checkpoint_store::reset_above(const uint64_t blocknumber)
    {
        size_t num_reset = 0;
        for (const auto &[job, last]: all()) {
            if (last > blocknumber) {
                set(job, 0);
                logger::info("checkpoint {} at {} is past block {}, the job will rebuild", job, last, blocknumber);
                ++num_reset;
            }
        }
        return num_reset;
    }

    checkpoint_store::checkpoint_map checkpoint_store::all()
    {
        auto stmt = _db.prepare("SELECT tablename, last_checkpoint FROM indexing_checkpoints ORDER BY tablename");
        checkpoint_map res {};
        while (stmt.step())
            res.emplace(stmt.column_text(0), stmt.column_uint(1));
        return res;
    }
}
