/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/entity-store.hpp>
#include <cm/json.hpp>

namespace chain_mirror {
    namespace {
        std::string id_list(const std::vector<uint64_t> &ids)
        {
            json::array arr {};
            for (const auto id: ids)
                arr.emplace_back(id);
            return json::serialize(arr);
        }

        std::string insert_sql(const entity_kind kind, const std::string_view payload_cols, const size_t num_payload)
        {
            std::string placeholders {};
            for (size_t i = 0; i < num_payload; ++i)
                placeholders += ", ?";
            return fmt::format("INSERT INTO {} (entity_key, blockhash, blocknumber, txhash, tx_index, block_time, is_delete, {})"
                " VALUES (?, ?, ?, ?, ?, ?, ?{})", entity_table(kind), payload_cols, placeholders);
        }

        template<typename ROW, typename ...Args>
        uint64_t insert_row(db::database &db, const ROW &row, const std::string_view payload_cols, Args&&... payload)
        {
            auto stmt = db.prepare(insert_sql(ROW::kind, payload_cols, sizeof...(Args)));
            const auto &m = row.meta;
            stmt.bind_all(row.key(), m.blockhash, m.blocknumber, m.txhash, m.tx_index, m.block_time, m.is_delete, std::forward<Args>(payload)...);
            stmt.exec();
            return static_cast<uint64_t>(db.last_insert_rowid());
        }
    }

    entity_store::entity_store(db::database &db): _db { db }
    {
    }

    uint64_t entity_store::_insert(const user_row &r)
    {
        return insert_row(_db, r, "user_id, handle, wallet, name, is_creator, is_verified, is_deactivated, primary_id, secondary_ids",
            r.user_id, r.handle, r.wallet, r.name, r.is_creator, r.is_verified, r.is_deactivated, r.primary_id, id_list(r.secondary_ids));
    }

    uint64_t entity_store::_insert(const track_row &r)
    {
        return insert_row(_db, r, "track_id, owner_id, title, route_id, is_unlisted, stem_of",
            r.track_id, r.owner_id, r.title, r.route_id, r.is_unlisted, r.stem_of);
    }

    uint64_t entity_store::_insert(const playlist_row &r)
    {
        return insert_row(_db, r, "playlist_id, playlist_owner_id, playlist_name, is_album, is_private, playlist_contents",
            r.playlist_id, r.playlist_owner_id, r.playlist_name, r.is_album, r.is_private, id_list(r.playlist_contents));
    }

    uint64_t entity_store::_insert(const follow_row &r)
    {
        return insert_row(_db, r, "follower_user_id, followee_user_id", r.follower_user_id, r.followee_user_id);
    }

    uint64_t entity_store::_insert(const repost_row &r)
    {
        return insert_row(_db, r, "user_id, repost_item_id, repost_type", r.user_id, r.repost_item_id, item_type_name(r.repost_type));
    }

    uint64_t entity_store::_insert(const save_row &r)
    {
        return insert_row(_db, r, "user_id, save_item_id, save_type", r.user_id, r.save_item_id, item_type_name(r.save_type));
    }

    uint64_t entity_store::append(const entity_version &v)
    {
        const auto kind = kind_of(v);
        const auto key = key_of(v);
        const auto blocknumber = std::visit([](const auto &row) { return row.meta.blocknumber; }, v);
        if (const auto cur = current(kind, key); cur && cur->blocknumber > blocknumber)
            throw invariant_error("{} {}: a version from block {} cannot supersede one from block {}", kind, key, blocknumber, cur->blocknumber);
        const auto version_id = std::visit([&](const auto &row) { return _insert(row); }, v);
        point_current(kind, key, version_ref { version_id, key, blocknumber });
        return version_id;
    }

    entity_store::version_list entity_store::versions_in_block(const entity_kind kind, const std::string_view blockhash)
    {
        auto stmt = _db.prepare(fmt::format("SELECT version_id, entity_key, blocknumber FROM {} WHERE blockhash = ? ORDER BY version_id DESC", entity_table(kind)));
        stmt.bind_all(blockhash);
        version_list res {};
        while (stmt.step())
            res.emplace_back(version_ref { stmt.column_uint(0), stmt.column_text(1), stmt.column_uint(2) });
        return res;
    }

    std::optional<entity_store::version_ref> entity_store::predecessor(const entity_kind kind, const std::string_view key, const uint64_t before_number)
    {
        // the last version appended below the block is the one append left current
        auto stmt = _db.prepare(fmt::format("SELECT version_id, entity_key, blocknumber FROM {}"
            " WHERE entity_key = ? AND blocknumber < ? ORDER BY blocknumber DESC, version_id DESC LIMIT 1", entity_table(kind)));
        stmt.bind_all(key, before_number);
        if (!stmt.step())
            return {};
        return version_ref { stmt.column_uint(0), stmt.column_text(1), stmt.column_uint(2) };
    }

    std::optional<entity_store::version_ref> entity_store::current(const entity_kind kind, const std::string_view key)
    {
        auto stmt = _db.prepare("SELECT version_id, entity_key, blocknumber FROM current_versions WHERE kind = ? AND entity_key = ?");
        stmt.bind_all(entity_kind_name(kind), key);
        if (!stmt.step())
            return {};
        return version_ref { stmt.column_uint(0), stmt.column_text(1), stmt.column_uint(2) };
    }

    void entity_store::point_current(const entity_kind kind, const std::string_view key, const std::optional<version_ref> &ver)
    {
        if (ver) {
            auto stmt = _db.prepare("INSERT INTO current_versions (kind, entity_key, version_id, blocknumber) VALUES (?, ?, ?, ?)"
                " ON CONFLICT (kind, entity_key) DO UPDATE SET version_id = excluded.version_id, blocknumber = excluded.blocknumber");
            stmt.bind_all(entity_kind_name(kind), key, ver->version_id, ver->blocknumber).exec();
        } else {
            auto stmt = _db.prepare("DELETE FROM current_versions WHERE kind = ? AND entity_key = ?");
            stmt.bind_all(entity_kind_name(kind), key).exec();
        }
    }

    void entity_store::remove_version(const entity_kind kind, const uint64_t version_id)
    {
        auto ptr = _db.prepare("SELECT entity_key FROM current_versions WHERE kind = ? AND version_id = ?");
        ptr.bind_all(entity_kind_name(kind), version_id);
        if (ptr.step())
            throw invariant_error("{} version {} of {} is still current and cannot be removed", kind, version_id, ptr.column_text(0));
        auto del = _db.prepare(fmt::format("DELETE FROM {} WHERE version_id = ?", entity_table(kind)));
        del.bind_all(version_id).exec();
        if (_db.changes() != 1)
            throw invariant_error("{} version {} does not exist", kind, version_id);
    }

    size_t entity_store::count_versions(const entity_kind kind)
    {
        auto stmt = _db.prepare(fmt::format("SELECT COUNT(*) FROM {}", entity_table(kind)));
        stmt.step();
        return stmt.column_uint(0);
    }

    entity_store::current_map entity_store::current_versions(const entity_kind kind)
    {
        auto stmt = _db.prepare("SELECT entity_key, version_id FROM current_versions WHERE kind = ?");
        stmt.bind_all(entity_kind_name(kind));
        current_map res {};
        while (stmt.step())
            res.emplace(stmt.column_text(0), stmt.column_uint(1));
        return res;
    }
}
