/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_KV_STORE_HPP
#define CHAIN_MIRROR_KV_STORE_HPP

#include <chrono>
#include <memory>
#include <set>
#include <cm/model.hpp>

namespace chain_mirror {
    namespace kv_keys {
        static constexpr std::string_view latest_block { "latest_block" };
        static constexpr std::string_view latest_block_hash { "latest_block_hash" };
        static constexpr std::string_view most_recent_indexed_block { "most_recent_indexed_block" };
        static constexpr std::string_view most_recent_indexed_block_hash { "most_recent_indexed_block_hash" };
    }

    using id_set = std::set<std::string>;

    /*
     * The fast store shared by all processes of a deployment: job locks,
     * health keys for the operators, and the outbox of ids whose cached
     * representations must be dropped by the read cache.
     */
    struct kv_store {
        virtual ~kv_store() =default;

        // Non-blocking: returns false when another owner holds a live lock with this name.
        [[nodiscard]] bool acquire_if_absent(const std::string_view key, const std::chrono::seconds ttl)
        {
            return _acquire_if_absent_impl(key, ttl);
        }

        // Releases the lock only when it is held by this store instance.
        void release(const std::string_view key)
        {
            _release_impl(key);
        }

        void set(const std::string_view key, const std::string_view value)
        {
            _set_impl(key, value);
        }

        [[nodiscard]] std::optional<std::string> get(const std::string_view key) const
        {
            return _get_impl(key);
        }

        void publish_dirty(const entity_kind kind, const id_set &ids)
        {
            if (!ids.empty())
                _publish_dirty_impl(kind, ids);
        }

        // Removes and returns the ids queued for the kind; used by the cache side.
        [[nodiscard]] id_set take_dirty(const entity_kind kind)
        {
            return _take_dirty_impl(kind);
        }
    private:
        virtual bool _acquire_if_absent_impl(std::string_view key, std::chrono::seconds ttl) =0;
        virtual void _release_impl(std::string_view key) =0;
        virtual void _set_impl(std::string_view key, std::string_view value) =0;
        virtual std::optional<std::string> _get_impl(std::string_view key) const =0;
        virtual void _publish_dirty_impl(entity_kind kind, const id_set &ids) =0;
        virtual id_set _take_dirty_impl(entity_kind kind) =0;
    };

    // Publishes the block as the most recently indexed one.
    inline void publish_most_recent(kv_store &kv, const block_record &blk)
    {
        kv.set(kv_keys::most_recent_indexed_block, fmt::format("{}", blk.height()));
        kv.set(kv_keys::most_recent_indexed_block_hash, blk.hash);
    }

    // Lock owner identity unique across the processes sharing a store
    extern std::string make_lock_owner();
}

#endif // !CHAIN_MIRROR_KV_STORE_HPP
