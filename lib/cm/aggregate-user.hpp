/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_AGGREGATE_USER_HPP
#define CHAIN_MIRROR_AGGREGATE_USER_HPP

#include <cm/db/sqlite.hpp>
#include <cm/job-lock.hpp>

namespace chain_mirror {
    struct aggregate_user_row {
        uint64_t user_id = 0;
        uint64_t track_count = 0;
        uint64_t playlist_count = 0;
        uint64_t album_count = 0;
        uint64_t follower_count = 0;
        uint64_t following_count = 0;
        uint64_t repost_count = 0;
        uint64_t track_save_count = 0;

        bool operator==(const aggregate_user_row &o) const =default;
    };

    struct aggregate_result {
        cycle_status status = cycle_status::skipped;
        bool rebuilt = false;
        uint64_t checkpoint = 0;
        size_t num_changed = 0;
        size_t num_updated = 0;
    };

    /*
     * Keeps the per-user counters in aggregate_user up to date. Only users touched by
     * current versions above the checkpoint are recounted, and they are recounted in full.
     * Versions restored by a revert at or below the checkpoint are not noticed until
     * the checkpoint is cleared, which forces a full rebuild.
     */
    struct aggregate_user_job {
        static constexpr std::string_view job_name { "aggregate_user" };
        static constexpr std::string_view lock_name { "update_aggregate_table:aggregate_user" };

        aggregate_user_job(db::database &db, kv_store &kv, std::chrono::seconds lock_ttl);
        // skipped when another process holds the lock
        aggregate_result run();
        std::optional<aggregate_user_row> find(uint64_t user_id);
        size_t count();
    private:
        db::database &_db;
        kv_store &_kv;
        const std::chrono::seconds _lock_ttl;

        aggregate_result _update();
    };
}

namespace fmt {
    template<>
    struct formatter<chain_mirror::aggregate_user_row>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::aggregate_user_row &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "user {}: tracks: {} playlists: {} albums: {} followers: {} following: {} reposts: {} track saves: {}",
                v.user_id, v.track_count, v.playlist_count, v.album_count, v.follower_count, v.following_count, v.repost_count, v.track_save_count);
        }
    };
}

#endif // !CHAIN_MIRROR_AGGREGATE_USER_HPP
