/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_KV_STORE_SQLITE_HPP
#define CHAIN_MIRROR_KV_STORE_SQLITE_HPP

#include <cm/db/sqlite.hpp>
#include <cm/kv-store.hpp>
#include <cm/mutex.hpp>

namespace chain_mirror {
    // A store in an sqlite file that all processes of a deployment open.
    struct kv_store_sqlite: kv_store {
        explicit kv_store_sqlite(const std::string &path);
        ~kv_store_sqlite() override;
    private:
        mutable mutex::unique_lock::mutex_type _mutex alignas(mutex::alignment) {};
        mutable db::database _db;
        const std::string _owner;

        bool _acquire_if_absent_impl(std::string_view key, std::chrono::seconds ttl) override;
        void _release_impl(std::string_view key) override;
        void _set_impl(std::string_view key, std::string_view value) override;
        std::optional<std::string> _get_impl(std::string_view key) const override;
        void _publish_dirty_impl(entity_kind kind, const id_set &ids) override;
        id_set _take_dirty_impl(entity_kind kind) override;
    };
}

#endif // !CHAIN_MIRROR_KV_STORE_SQLITE_HPP
