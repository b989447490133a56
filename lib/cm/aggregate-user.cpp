/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/aggregate-user.hpp>
#include <cm/block-store.hpp>
#include <cm/checkpoint-store.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    namespace {
        const char *changed_users_sql =
            "INSERT OR IGNORE INTO changed_users (user_id)"
            " SELECT user_id FROM users_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT owner_id FROM tracks_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT playlist_owner_id FROM playlists_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT followee_user_id FROM follows_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT follower_user_id FROM follows_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT user_id FROM reposts_view WHERE is_current AND blocknumber > ?1"
            " UNION SELECT user_id FROM saves_view WHERE is_current AND save_type = 'track' AND blocknumber > ?1";

        const char *upsert_sql =
            "INSERT INTO aggregate_user (user_id, track_count, playlist_count, album_count,"
            "   follower_count, following_count, repost_count, track_save_count)"
            " SELECT u.user_id,"
            "  (SELECT COUNT(*) FROM tracks_view t WHERE t.is_current AND NOT t.is_delete AND NOT t.is_unlisted"
            "     AND t.stem_of IS NULL AND t.owner_id = u.user_id),"
            "  (SELECT COUNT(*) FROM playlists_view p WHERE p.is_current AND NOT p.is_delete AND NOT p.is_private"
            "     AND NOT p.is_album AND p.playlist_owner_id = u.user_id),"
            "  (SELECT COUNT(*) FROM playlists_view p WHERE p.is_current AND NOT p.is_delete AND NOT p.is_private"
            "     AND p.is_album AND p.playlist_owner_id = u.user_id),"
            "  (SELECT COUNT(*) FROM follows_view f WHERE f.is_current AND NOT f.is_delete AND f.followee_user_id = u.user_id),"
            "  (SELECT COUNT(*) FROM follows_view f WHERE f.is_current AND NOT f.is_delete AND f.follower_user_id = u.user_id),"
            "  (SELECT COUNT(*) FROM reposts_view r WHERE r.is_current AND NOT r.is_delete AND r.user_id = u.user_id),"
            "  (SELECT COUNT(*) FROM saves_view s WHERE s.is_current AND NOT s.is_delete AND s.save_type = 'track' AND s.user_id = u.user_id)"
            " FROM users_view u"
            " WHERE u.is_current AND u.user_id IN (SELECT user_id FROM changed_users)"
            " ON CONFLICT (user_id) DO UPDATE SET"
            "  track_count = excluded.track_count,"
            "  playlist_count = excluded.playlist_count,"
            "  album_count = excluded.album_count,"
            "  follower_count = excluded.follower_count,"
            "  following_count = excluded.following_count,"
            "  repost_count = excluded.repost_count,"
            "  track_save_count = excluded.track_save_count";
    }

    aggregate_user_job::aggregate_user_job(db::database &db, kv_store &kv, const std::chrono::seconds lock_ttl)
        : _db { db }, _kv { kv }, _lock_ttl { lock_ttl }
    {
    }

    aggregate_result aggregate_user_job::run()
    {
        const job_lock lock { _kv, lock_name, _lock_ttl };
        if (!lock) {
            logger::info("{}: failed to acquire lock {}, skipping", job_name, lock_name);
            return {};
        }
        timer t { fmt::format("update of {}", job_name), logger::level::info };
        return _update();
    }

    aggregate_result aggregate_user_job::_update()
    {
        aggregate_result res {};
        db::transaction txn { _db };
        checkpoint_store checkpoints { _db };
        const auto current = block_store { _db }.current();
        if (!current) {
            logger::warn("{}: there is no current block, nothing to aggregate", job_name);
            res.status = cycle_status::up_to_date;
            return res;
        }
        const auto latest = current->height();
        auto last = checkpoints.get(job_name).value_or(0);
        logger::info("{}: checkpoint: {} latest block: {}", job_name, last, latest);
        if (last == 0) {
            logger::info("{}: rebuilding the table from scratch", job_name);
            _db.exec("DELETE FROM aggregate_user");
            res.rebuilt = true;
        } else if (last == latest) {
            logger::info("{}: already up to date at block {}", job_name, latest);
            res.status = cycle_status::up_to_date;
            res.checkpoint = last;
            return res;
        }
        _db.exec("CREATE TEMP TABLE IF NOT EXISTS changed_users (user_id INTEGER PRIMARY KEY)");
        _db.exec("DELETE FROM changed_users");
        // a rebuild must also see the versions of block 0
        _db.prepare(changed_users_sql).bind_all(res.rebuilt ? int64_t { -1 } : static_cast<int64_t>(last)).exec();
        res.num_changed = _db.changes();
        _db.prepare(upsert_sql).exec();
        res.num_updated = _db.changes();
        _db.exec("DELETE FROM changed_users");
        checkpoints.set(job_name, latest);
        txn.commit();
        res.status = cycle_status::completed;
        res.checkpoint = latest;
        logger::info("{}: {} changed users, {} rows updated, the checkpoint is now {}", job_name, res.num_changed, res.num_updated, latest);
        return res;
    }

    std::optional<aggregate_user_row> aggregate_user_job::find(const uint64_t user_id)
    {
        auto stmt = _db.prepare("SELECT user_id, track_count, playlist_count, album_count, follower_count, following_count,"
            " repost_count, track_save_count FROM aggregate_user WHERE user_id = ?");
        stmt.bind_all(user_id);
        if (!stmt.step())
            return {};
        return aggregate_user_row { stmt.column_uint(0), stmt.column_uint(1), stmt.column_uint(2), stmt.column_uint(3),
            stmt.column_uint(4), stmt.column_uint(5), stmt.column_uint(6), stmt.column_uint(7) };
    }

    size_t aggregate_user_job::count()
    {
        auto stmt = _db.prepare("SELECT COUNT(*) FROM aggregate_user");
        stmt.step();
        return stmt.column_uint(0);
    }
}
