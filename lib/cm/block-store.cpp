/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/block-store.hpp>

namespace chain_mirror {
    block_store::block_store(db::database &db): _db { db }
    {
    }

    block_record block_store::_read(const db::statement &stmt)
    {
        return block_record {
            .hash = stmt.column_text(0),
            .parent_hash = stmt.column_text(1),
            .number = stmt.column_opt_uint(2),
            .is_current = stmt.column_bool(3)
        };
    }

    std::optional<block_record> block_store::current()
    {
        auto stmt = _db.prepare("SELECT blockhash, parenthash, number, is_current FROM blocks WHERE is_current = 1");
        if (!stmt.step())
            return {};
        return _read(stmt);
    }

    block_record block_store::require_current()
    {
        if (const auto num_current = count_current(); num_current != 1)
            throw invariant_error("expected exactly one current block but found {}", num_current);
        return *current();
    }

    std::optional<block_record> block_store::find(const std::string_view hash)
    {
        auto stmt = _db.prepare("SELECT blockhash, parenthash, number, is_current FROM blocks WHERE blockhash = ?");
        stmt.bind_all(hash);
        if (!stmt.step())
            return {};
        return _read(stmt);
    }

    size_t block_store::count()
    {
        auto stmt = _db.prepare("SELECT COUNT(*) FROM blocks");
        stmt.step();
        return stmt.column_uint(0);
    }

    size_t block_store::count_current()
    {
        auto stmt = _db.prepare("SELECT COUNT(*) FROM blocks WHERE is_current = 1");
        stmt.step();
        return stmt.column_uint(0);
    }

    void block_store::add_current(const block_record &blk)
    {
        _db.prepare("UPDATE blocks SET is_current = 0 WHERE is_current = 1").exec();
        auto ins = _db.prepare("INSERT INTO blocks (blockhash, parenthash, number, is_current) VALUES (?, ?, ?, 1)");
        ins.bind_all(blk.hash, normalize_parent_hash(blk.parent_hash), blk.number).exec();
    }

    void block_store::set_current(const std::string_view hash)
    {
        _db.prepare("UPDATE blocks SET is_current = 0 WHERE is_current = 1").exec();
        auto upd = _db.prepare("UPDATE blocks SET is_current = 1 WHERE blockhash = ?");
        upd.bind_all(hash).exec();
        if (_db.changes() != 1)
            throw invariant_error("cannot make block {} current: it is not persisted", hash);
    }

    void block_store::remove(const std::string_view hash)
    {
        auto del = _db.prepare("DELETE FROM blocks WHERE blockhash = ?");
        del.bind_all(hash).exec();
        if (_db.changes() != 1)
            throw invariant_error("cannot remove block {}: it is not persisted", hash);
    }
}
