/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/kv-store-sqlite.hpp>

namespace chain_mirror {
    namespace {
        // lock expiration must be comparable across processes, so wall-clock time is used
        int64_t now_ms()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    kv_store_sqlite::kv_store_sqlite(const std::string &path): _db { path }, _owner { make_lock_owner() }
    {
        _db.exec(
            "CREATE TABLE IF NOT EXISTS kv_locks (name TEXT PRIMARY KEY, owner TEXT NOT NULL, expires_at INTEGER NOT NULL);"
            "CREATE TABLE IF NOT EXISTS kv_values (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS kv_dirty (kind TEXT NOT NULL, id TEXT NOT NULL, published_at INTEGER NOT NULL, PRIMARY KEY (kind, id));");
        logger::debug("kv store {} opened by owner {}", path, _owner);
    }

    kv_store_sqlite::~kv_store_sqlite() =default;

    bool kv_store_sqlite::_acquire_if_absent_impl(const std::string_view key, const std::chrono::seconds ttl)
    {
        mutex::scoped_lock lk { _mutex };
        const auto now = now_ms();
        // a single statement is atomic across processes: it takes an absent or an expired lock only
        auto stmt = _db.prepare("INSERT INTO kv_locks (name, owner, expires_at) VALUES (?, ?, ?)"
            " ON CONFLICT (name) DO UPDATE SET owner = excluded.owner, expires_at = excluded.expires_at"
            " WHERE kv_locks.expires_at <= ?");
        stmt.bind_all(key, _owner, now + static_cast<int64_t>(ttl.count()) * 1000, now).exec();
        return _db.changes() == 1;
    }

    void kv_store_sqlite::_release_impl(const std::string_view key)
    {
        mutex::scoped_lock lk { _mutex };
        auto stmt = _db.prepare("DELETE FROM kv_locks WHERE name = ? AND owner = ?");
        stmt.bind_all(key, _owner).exec();
        if (_db.changes() != 1)
            logger::warn("lock {} was not held by {} at release time", key, _owner);
    }

    void kv_store_sqlite::_set_impl(const std::string_view key, const std::string_view value)
    {
        mutex::scoped_lock lk { _mutex };
        auto stmt = _db.prepare("INSERT INTO kv_values (key, value) VALUES (?, ?) ON CONFLICT (key) DO UPDATE SET value = excluded.value");
        stmt.bind_all(key, value).exec();
    }

    std::optional<std::string> kv_store_sqlite::_get_impl(const std::string_view key) const
    {
        mutex::scoped_lock lk { _mutex };
        auto stmt = _db.prepare("SELECT value FROM kv_values WHERE key = ?");
        stmt.bind_all(key);
        if (!stmt.step())
            return {};
        return stmt.column_text(0);
    }

    void kv_store_sqlite::_publish_dirty_impl(const entity_kind kind, const id_set &ids)
    {
        mutex::scoped_lock lk { _mutex };
        db::transaction tx { _db };
        auto stmt = _db.prepare("INSERT INTO kv_dirty (kind, id, published_at) VALUES (?, ?, ?) ON CONFLICT (kind, id) DO UPDATE SET published_at = excluded.published_at");
        const auto now = now_ms();
        for (const auto &id: ids) {
            stmt.bind_all(entity_kind_name(kind), id, now).exec();
            stmt.reset();
        }
        tx.commit();
        logger::trace("published {} dirty {} ids", ids.size(), kind);
    }

    id_set kv_store_sqlite::_take_dirty_impl(const entity_kind kind)
    {
        mutex::scoped_lock lk { _mutex };
        db::transaction tx { _db };
        auto sel = _db.prepare("SELECT id FROM kv_dirty WHERE kind = ?");
        sel.bind_all(entity_kind_name(kind));
        id_set res {};
        while (sel.step())
            res.emplace(sel.column_text(0));
        auto del = _db.prepare("DELETE FROM kv_dirty WHERE kind = ?");
        del.bind_all(entity_kind_name(kind)).exec();
        tx.commit();
        return res;
    }
}
